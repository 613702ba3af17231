#pragma once

#include <memory>
#include <sys/types.h>

#include <base/types.h>


namespace SSTIO
{

/** Stream over one file of a (possibly remote) filesystem that supports reads at an explicit offset.
  * readAt() does not move any cursor, so it may be called concurrently if the implementation is reentrant.
  */
class IPositionalInputStream
{
public:
    static constexpr ssize_t END_OF_STREAM = -1;

    virtual ~IPositionalInputStream() = default;

    /// Reads up to `size` bytes at `offset` into `to`.
    /// Returns the number of bytes read, which may be less than `size` (short read),
    /// or END_OF_STREAM if there is nothing to read at `offset`.
    virtual ssize_t readAt(UInt64 offset, char * to, size_t size) = 0;

    /// Closing an already closed stream does nothing.
    virtual void close() = 0;

    virtual bool isClosed() const = 0;
};

using PositionalInputStreamPtr = std::shared_ptr<IPositionalInputStream>;


/// Client of a filesystem serving one scheme (and authority, for remote ones).
class IFileSystemClient
{
public:
    virtual ~IFileSystemClient() = default;

    virtual String getName() const = 0;

    /// Paths are normalized, see normalizeFileName().
    virtual PositionalInputStreamPtr openPositionalStream(const String & path, size_t buffer_size) = 0;

    virtual UInt64 getFileSize(const String & path) = 0;

    virtual bool exists(const String & path) = 0;
};

using FileSystemClientPtr = std::shared_ptr<IFileSystemClient>;

}
