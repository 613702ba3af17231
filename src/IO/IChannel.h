#pragma once

#include <Common/SharedCloseable.h>
#include <base/types.h>

#include <memory>


namespace SSTIO
{

class ByteBuffer;

/** Read-only channel to one file, shared between readers.
  *
  * Only operations that are safe to call from several threads are exposed:
  * every read names its own position, there is no cursor.
  * Copies share the underlying resource; it is cleaned up when the last copy is closed.
  */
class IChannel : public SharedCloseable
{
public:
    /// Length of the file in bytes. Throws FS_READ_ERROR if it cannot be obtained.
    virtual Int64 size() = 0;

    /// Reads from `position` of the file into `buffer`; see implementations for how the buffer cursor moves.
    /// Returns the number of bytes read, 0 at end of file. Throws FS_READ_ERROR.
    virtual size_t read(ByteBuffer & buffer, Int64 position) = 0;

    /// Identity of the file, for logs and comparisons.
    virtual String getFileName() const = 0;

    /// Replaces the underlying stream with a freshly opened one, if the channel supports that.
    virtual void reopen() {}

    String toString() const { return getFileName(); }

protected:
    explicit IChannel(TidyPtr tidy) : SharedCloseable(std::move(tidy)) {}
    IChannel(const IChannel & copy) = default;
};

using ChannelPtr = std::shared_ptr<IChannel>;

}
