#pragma once

#include <cstdlib>
#include <utility>
#include <boost/noncopyable.hpp>


namespace SSTIO
{

/** Aligned piece of memory.
  * It can only be allocated and destroyed.
  * Backs direct byte buffers, whose storage is not handed out as a plain array.
  */
class AlignedBuffer : private boost::noncopyable
{
private:
    void * buf = nullptr;

    void alloc(size_t size, size_t alignment);
    void dealloc();

public:
    AlignedBuffer() = default;
    AlignedBuffer(size_t size, size_t alignment);
    AlignedBuffer(AlignedBuffer && old) noexcept { std::swap(buf, old.buf); }
    AlignedBuffer & operator=(AlignedBuffer && old) noexcept { std::swap(buf, old.buf); return *this; }
    ~AlignedBuffer();

    char * data() { return static_cast<char *>(buf); }
    const char * data() const { return static_cast<const char *>(buf); }
};

}
