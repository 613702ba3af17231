#pragma once

#include <IO/IChannel.h>
#include <IO/RemoteChannelSettings.h>
#include <Disks/IFileSystemClient.h>

#include <atomic>
#include <limits>
#include <memory>

namespace Poco { class Logger; }

namespace SSTIO
{

class RemoteChannel;
using RemoteChannelPtr = std::shared_ptr<RemoteChannel>;

/** Channel over a file of a remote (or local) filesystem, served by an IFileSystemClient.
  *
  * Every handle owns its own positional stream. The stream is closed by the cleanup of the handle,
  * i.e. exactly once, when the last reference to it is released.
  * Reads go to the stream without locking; reopen() and close() must not race with reads of the same handle.
  *
  * Length is read once and cached; existence is cached only when positive.
  */
class RemoteChannel final : public IChannel
{
public:
    static constexpr size_t MAX_READ_CHUNK = static_cast<size_t>(std::numeric_limits<Int32>::max());

    /// Open the file. Returns nullptr (and logs the reason) if the filesystem or the file is unavailable.
    static RemoteChannelPtr create(const String & file_name, const RemoteChannelSettings & settings = {});
    static RemoteChannelPtr create(const String & file_name, size_t buffer_size, const RemoteChannelSettings & settings);

    ~RemoteChannel() override;

    /// Another handle to the same file with its own, independently opened stream.
    /// The stream cannot be shared, because its users would interfere with each other.
    /// Throws CANNOT_OPEN_FILE if the stream cannot be opened.
    RemoteChannelPtr sharedCopy() const;

    /// Closes the current stream and opens it again. Failures are logged and not thrown:
    /// a stream that fails to close must not prevent opening a new one. No retries.
    void reopen() override;

    /// Never throws: an error is logged and reported as `false`.
    bool exists();

    Int64 size() override;

    /// Heap buffer: reads up to buffer.limit() bytes into its array at offset 0,
    ///  then sets limit to capacity and position to the number of bytes read.
    /// Direct buffer: reads up to buffer.remaining() bytes into a temporary array
    ///  and puts them into the buffer at its position.
    size_t read(ByteBuffer & buffer, Int64 position) override;

    /// Reads up to `length` bytes from `position` into `to + offset`, retrying short reads.
    /// Stops at the end of file (as it was known when the length was cached) or at the end of stream.
    size_t read(Int64 position, char * to, size_t offset, size_t length);

    String getFileName() const override { return file_name; }

    const RemoteChannelSettings & getSettings() const { return settings; }
    size_t getBufferSize() const { return buffer_size; }
    PositionalInputStreamPtr getStream() const { return stream; }
    FileSystemClientPtr getClient() const { return client; }

private:
    class Cleanup;

    RemoteChannel(
        std::unique_ptr<Cleanup> cleanup_,
        FileSystemClientPtr client_,
        PositionalInputStreamPtr stream_,
        const String & file_name_,
        size_t buffer_size_,
        const RemoteChannelSettings & settings_,
        Int64 known_length);

    Cleanup & getCleanup() const;

    [[noreturn]] void throwReadError(const String & action) const;

    const String file_name;
    const FileSystemClientPtr client;
    PositionalInputStreamPtr stream;
    const size_t buffer_size;
    const RemoteChannelSettings settings;

    std::atomic<Int64> file_length{-1};
    std::atomic<bool> is_exists{false};

    Poco::Logger * log;
};

}
