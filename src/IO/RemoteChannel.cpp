#include <IO/RemoteChannel.h>

#include <IO/ByteBuffer.h>
#include <Disks/FileSystemFactory.h>
#include <Disks/normalizeFileName.h>
#include <Disks/registerFileSystems.h>
#include <Common/Exception.h>
#include <Common/logger_useful.h>

#include <base/defines.h>

#include <boost/stacktrace.hpp>

#include <algorithm>
#include <mutex>
#include <vector>


namespace SSTIO
{

namespace ErrorCodes
{
    extern const int ARGUMENT_OUT_OF_BOUND;
    extern const int CANNOT_OPEN_FILE;
    extern const int FS_READ_ERROR;
    extern const int LOGICAL_ERROR;
}


/// Closes the stream of a handle when the last reference to it is released.
/// The stream is swapped on reopen, so the one closed is always the current one.
class RemoteChannel::Cleanup final : public ITidy
{
public:
    Cleanup(const String & file_name_, PositionalInputStreamPtr stream_)
        : file_name(file_name_), stream(std::move(stream_))
    {
    }

    String name() const override { return file_name; }

    void tidy() override
    {
        PositionalInputStreamPtr to_close;
        {
            std::lock_guard lock(mutex);
            to_close = std::move(stream);
            tidied = true;
        }

        auto * log = &Poco::Logger::get("RemoteChannel");
        LOG_INFO(log, "Cleaning channel for file {}", file_name);

        if (!to_close)
            return;

        try
        {
            to_close->close();
        }
        catch (...)
        {
            /// Nobody is there to handle the error, we are shutting the channel down.
            String stack_trace = boost::stacktrace::to_string(boost::stacktrace::stacktrace());
            LOG_ERROR(log, "Cannot close stream of file {}, stack trace:\n{}", file_name, stack_trace);
            tryLogCurrentException(log, fmt::format("Exception on file {}", file_name));
        }
    }

    /// The previous stream must be already closed by the caller.
    /// Returns false if the cleanup already happened; then the new stream is not adopted and the caller must close it.
    bool swapStream(PositionalInputStreamPtr new_stream)
    {
        std::lock_guard lock(mutex);
        if (tidied)
            return false;
        stream = std::move(new_stream);
        return true;
    }

private:
    const String file_name;

    std::mutex mutex;
    PositionalInputStreamPtr stream TSA_GUARDED_BY(mutex);
    bool tidied TSA_GUARDED_BY(mutex) = false;
};


RemoteChannel::RemoteChannel(
    std::unique_ptr<Cleanup> cleanup_,
    FileSystemClientPtr client_,
    PositionalInputStreamPtr stream_,
    const String & file_name_,
    size_t buffer_size_,
    const RemoteChannelSettings & settings_,
    Int64 known_length)
    : IChannel(std::move(cleanup_))
    , file_name(file_name_)
    , client(std::move(client_))
    , stream(std::move(stream_))
    , buffer_size(buffer_size_)
    , settings(settings_)
    , file_length(known_length)
    , log(&Poco::Logger::get("RemoteChannel"))
{
    file_length = size();
}

RemoteChannel::~RemoteChannel() = default;

RemoteChannelPtr RemoteChannel::create(const String & file_name, const RemoteChannelSettings & settings)
{
    return create(file_name, settings.buffer_size, settings);
}

RemoteChannelPtr RemoteChannel::create(const String & file_name, size_t buffer_size, const RemoteChannelSettings & settings)
{
    auto * log = &Poco::Logger::get("RemoteChannel");

    try
    {
        registerFileSystems();

        String normalized_name = normalizeFileName(file_name, settings.default_scheme);
        auto client = FileSystemFactory::instance().get(normalized_name, settings);
        auto stream = client->openPositionalStream(normalized_name, buffer_size);
        auto cleanup = std::make_unique<Cleanup>(normalized_name, stream);

        /// If the length cannot be obtained, the constructor throws and the released reference closes the stream.
        return RemoteChannelPtr(new RemoteChannel(
            std::move(cleanup), std::move(client), std::move(stream), normalized_name, buffer_size, settings, -1));
    }
    catch (...)
    {
        tryLogCurrentException(log, fmt::format("Cannot open channel for file {}", file_name));
        return nullptr;
    }
}

RemoteChannel::Cleanup & RemoteChannel::getCleanup() const
{
    return static_cast<Cleanup &>(getTidy());
}

RemoteChannelPtr RemoteChannel::sharedCopy() const
{
    PositionalInputStreamPtr new_stream;
    try
    {
        new_stream = client->openPositionalStream(file_name, buffer_size);
    }
    catch (...)
    {
        tryLogCurrentException(log, fmt::format("Cannot open a copy of channel for file {}", file_name));
        throw Exception(ErrorCodes::CANNOT_OPEN_FILE, "Cannot open a copy of channel for file {}: {}",
            file_name, getCurrentExceptionMessage(false));
    }

    auto cleanup = std::make_unique<Cleanup>(file_name, new_stream);
    return RemoteChannelPtr(new RemoteChannel(
        std::move(cleanup), client, std::move(new_stream), file_name, buffer_size, settings, file_length.load()));
}

void RemoteChannel::reopen()
{
    /// TODO: retry opening, with a policy from settings, once callers need more than one attempt.
    try
    {
        stream->close();
    }
    catch (...)
    {
        tryLogCurrentException(log, fmt::format("Cannot close stream of file {} before reopening, opening a new one anyway", file_name));
    }

    PositionalInputStreamPtr new_stream;
    try
    {
        new_stream = client->openPositionalStream(file_name, buffer_size);
    }
    catch (...)
    {
        tryLogCurrentException(log, fmt::format("Cannot reopen stream of file {}", file_name));
        return;
    }

    if (!getCleanup().swapStream(new_stream))
    {
        LOG_WARNING(log, "Channel for file {} is already cleaned up, not reopening it", file_name);
        try
        {
            new_stream->close();
        }
        catch (...)
        {
            tryLogCurrentException(log, fmt::format("Cannot close stream of file {}", file_name));
        }
        return;
    }

    stream = std::move(new_stream);
    LOG_DEBUG(log, "Reopened stream of file {}", file_name);
}

bool RemoteChannel::exists()
{
    if (is_exists.load(std::memory_order_acquire))
        return true;

    try
    {
        bool res = client->exists(file_name);
        if (res)
            is_exists.store(true, std::memory_order_release);
        return res;
    }
    catch (...)
    {
        tryLogCurrentException(log, fmt::format("Cannot check existence of file {}", file_name));
        return false;
    }
}

Int64 RemoteChannel::size()
{
    Int64 known_length = file_length.load(std::memory_order_acquire);
    if (known_length != -1)
        return known_length;

    try
    {
        known_length = static_cast<Int64>(client->getFileSize(file_name));
    }
    catch (...)
    {
        throwReadError("get size of");
    }

    file_length.store(known_length, std::memory_order_release);
    return known_length;
}

size_t RemoteChannel::read(Int64 position, char * to, size_t offset, size_t length)
{
    if (position < 0)
        throw Exception(ErrorCodes::ARGUMENT_OUT_OF_BOUND, "Cannot read file {} at negative position {}", file_name, position);

    const Int64 known_length = size();
    size_t bytes_read = 0;

    while (bytes_read < length)
    {
        Int64 bytes_left_in_file = known_length - position - static_cast<Int64>(bytes_read);
        size_t file_bytes_remaining = bytes_left_in_file <= 0
            ? 0
            : static_cast<size_t>(std::min<Int64>(bytes_left_in_file, MAX_READ_CHUNK));

        size_t to_read = std::min(length - bytes_read, file_bytes_remaining);
        if (to_read == 0)
            return bytes_read;

        ssize_t res = stream->readAt(position + bytes_read, to + offset + bytes_read, to_read);

        /// A stream that returns nothing would make us spin, so zero bytes is treated as the end too.
        if (res == IPositionalInputStream::END_OF_STREAM || res == 0)
            return bytes_read;

        if (res < 0 || static_cast<size_t>(res) > to_read)
            throw Exception(ErrorCodes::LOGICAL_ERROR,
                "Stream of file {} returned {} bytes for a read of {} bytes", file_name, res, to_read);

        bytes_read += res;
    }

    return bytes_read;
}

size_t RemoteChannel::read(ByteBuffer & buffer, Int64 position)
{
    try
    {
        if (buffer.hasArray())
        {
            size_t bytes_read = read(position, buffer.array(), 0, buffer.limit());
            buffer.setLimit(buffer.capacity());
            buffer.setPosition(bytes_read);
            return bytes_read;
        }

        /// The memory of a direct buffer is reachable only through put(), so stage the data.
        std::vector<char> staging(buffer.capacity());
        size_t bytes_read = read(position, staging.data(), 0, buffer.remaining());
        buffer.put(staging.data(), bytes_read);
        return bytes_read;
    }
    catch (...)
    {
        throwReadError(fmt::format("read at position {} from", position));
    }
}

void RemoteChannel::throwReadError(const String & action) const
{
    if (getCurrentExceptionCode() == ErrorCodes::FS_READ_ERROR)
        throw;

    throw Exception(ErrorCodes::FS_READ_ERROR, "Cannot {} file {}: {}",
        action, getFileNameFromPath(file_name), getCurrentExceptionMessage(false));
}

}
