#pragma once

#include <variant>
#include <vector>

#include <Common/AlignedBuffer.h>
#include <base/types.h>


namespace SSTIO
{

/** A fixed-capacity byte buffer with a cursor: 0 <= position <= limit <= capacity.
  *
  * Two kinds of storage:
  * - heap: plain memory that is handed out through array(), so callers may read into it directly;
  * - direct: aligned memory that is not handed out for writing; data gets in only through put().
  *
  * Writers put bytes at position and advance it; flip() turns the written region into the readable window [0, limit).
  */
class ByteBuffer
{
public:
    static constexpr size_t DEFAULT_DIRECT_ALIGNMENT = 4096;

    /// Heap buffer owning its memory.
    static ByteBuffer allocate(size_t capacity);

    /// Heap buffer over external memory, which must outlive the buffer.
    static ByteBuffer wrap(char * data, size_t size);

    /// Direct buffer in aligned memory.
    static ByteBuffer allocateDirect(size_t capacity, size_t alignment = DEFAULT_DIRECT_ALIGNMENT);

    ByteBuffer(ByteBuffer &&) = default;
    ByteBuffer & operator=(ByteBuffer &&) = default;
    ByteBuffer(const ByteBuffer &) = delete;
    ByteBuffer & operator=(const ByteBuffer &) = delete;

    /// True for heap buffers.
    bool hasArray() const { return std::holds_alternative<HeapStorage>(storage); }
    bool isDirect() const { return !hasArray(); }

    /// Backing array of a heap buffer. Throws for direct buffers.
    char * array();

    /// Read-only view of the storage, for both kinds.
    const char * data() const;

    size_t capacity() const { return buffer_capacity; }
    size_t position() const { return buffer_position; }
    size_t limit() const { return buffer_limit; }
    size_t remaining() const { return buffer_limit - buffer_position; }
    bool hasRemaining() const { return buffer_position < buffer_limit; }

    void setPosition(size_t new_position);
    /// If position is beyond the new limit it is moved to the limit.
    void setLimit(size_t new_limit);

    /// Copies `size` bytes to position and advances it. Throws if they don't fit before limit.
    void put(const char * from, size_t size);

    /// Copies `size` bytes from position to `to` and advances position. Throws if fewer are remaining.
    void get(char * to, size_t size);

    /// limit = position, position = 0.
    void flip();
    /// position = 0, limit = capacity.
    void clear();
    /// position = 0.
    void rewind() { buffer_position = 0; }

private:
    struct HeapStorage
    {
        std::vector<char> owned;
        char * begin = nullptr;
    };

    struct DirectStorage
    {
        AlignedBuffer memory;
    };

    ByteBuffer(std::variant<HeapStorage, DirectStorage> storage_, size_t capacity_);

    char * begin();
    const char * begin() const;

    std::variant<HeapStorage, DirectStorage> storage;
    size_t buffer_capacity = 0;
    size_t buffer_position = 0;
    size_t buffer_limit = 0;
};

}
