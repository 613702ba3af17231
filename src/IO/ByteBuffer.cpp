#include <IO/ByteBuffer.h>

#include <Common/Exception.h>

#include <algorithm>
#include <cstring>


namespace SSTIO
{

namespace ErrorCodes
{
    extern const int ARGUMENT_OUT_OF_BOUND;
    extern const int LOGICAL_ERROR;
}


ByteBuffer::ByteBuffer(std::variant<HeapStorage, DirectStorage> storage_, size_t capacity_)
    : storage(std::move(storage_))
    , buffer_capacity(capacity_)
    , buffer_position(0)
    , buffer_limit(capacity_)
{
}

ByteBuffer ByteBuffer::allocate(size_t capacity)
{
    HeapStorage heap;
    heap.owned.resize(capacity);
    heap.begin = heap.owned.data();
    return ByteBuffer(std::move(heap), capacity);
}

ByteBuffer ByteBuffer::wrap(char * data, size_t size)
{
    HeapStorage heap;
    heap.begin = data;
    return ByteBuffer(std::move(heap), size);
}

ByteBuffer ByteBuffer::allocateDirect(size_t capacity, size_t alignment)
{
    /// posix_memalign may return nullptr for zero size.
    DirectStorage direct{AlignedBuffer(std::max<size_t>(capacity, 1), alignment)};
    return ByteBuffer(std::move(direct), capacity);
}

char * ByteBuffer::begin()
{
    if (auto * heap = std::get_if<HeapStorage>(&storage))
        return heap->begin;
    return std::get<DirectStorage>(storage).memory.data();
}

const char * ByteBuffer::begin() const
{
    if (const auto * heap = std::get_if<HeapStorage>(&storage))
        return heap->begin;
    return std::get<DirectStorage>(storage).memory.data();
}

char * ByteBuffer::array()
{
    auto * heap = std::get_if<HeapStorage>(&storage);
    if (!heap)
        throw Exception(ErrorCodes::LOGICAL_ERROR, "Direct buffer has no accessible backing array");
    return heap->begin;
}

const char * ByteBuffer::data() const
{
    return begin();
}

void ByteBuffer::setPosition(size_t new_position)
{
    if (new_position > buffer_limit)
        throw Exception(ErrorCodes::ARGUMENT_OUT_OF_BOUND, "Position {} is beyond limit {}", new_position, buffer_limit);
    buffer_position = new_position;
}

void ByteBuffer::setLimit(size_t new_limit)
{
    if (new_limit > buffer_capacity)
        throw Exception(ErrorCodes::ARGUMENT_OUT_OF_BOUND, "Limit {} is beyond capacity {}", new_limit, buffer_capacity);
    buffer_limit = new_limit;
    if (buffer_position > buffer_limit)
        buffer_position = buffer_limit;
}

void ByteBuffer::put(const char * from, size_t size)
{
    if (size > remaining())
        throw Exception(ErrorCodes::ARGUMENT_OUT_OF_BOUND,
            "Cannot put {} bytes into buffer: position {}, limit {}", size, buffer_position, buffer_limit);
    if (size)
        memcpy(begin() + buffer_position, from, size);
    buffer_position += size;
}

void ByteBuffer::get(char * to, size_t size)
{
    if (size > remaining())
        throw Exception(ErrorCodes::ARGUMENT_OUT_OF_BOUND,
            "Cannot get {} bytes from buffer: position {}, limit {}", size, buffer_position, buffer_limit);
    if (size)
        memcpy(to, begin() + buffer_position, size);
    buffer_position += size;
}

void ByteBuffer::flip()
{
    buffer_limit = buffer_position;
    buffer_position = 0;
}

void ByteBuffer::clear()
{
    buffer_position = 0;
    buffer_limit = buffer_capacity;
}

}
