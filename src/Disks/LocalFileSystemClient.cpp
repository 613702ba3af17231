#include <Disks/LocalFileSystemClient.h>

#include <Disks/FileSystemFactory.h>
#include <Disks/normalizeFileName.h>
#include <Common/Exception.h>
#include <Common/logger_useful.h>

#include <Poco/URI.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>


namespace SSTIO
{

namespace ErrorCodes
{
    extern const int BAD_ARGUMENTS;
    extern const int FILE_DOESNT_EXIST;
    extern const int CANNOT_OPEN_FILE;
    extern const int CANNOT_CLOSE_FILE;
    extern const int CANNOT_STAT;
    extern const int CANNOT_READ_FROM_FILE_DESCRIPTOR;
    extern const int FILE_ALREADY_CLOSED;
}


LocalPositionalInputStream::LocalPositionalInputStream(const String & file_name_)
    : file_name(file_name_)
{
    int res = ::open(file_name.c_str(), O_RDONLY | O_CLOEXEC);
    if (-1 == res)
        throwFromErrnoWithPath("Cannot open file " + file_name, file_name,
            errno == ENOENT ? ErrorCodes::FILE_DOESNT_EXIST : ErrorCodes::CANNOT_OPEN_FILE);
    fd = res;
}

LocalPositionalInputStream::~LocalPositionalInputStream()
{
    try
    {
        close();
    }
    catch (const ErrnoException &)
    {
        tryLogCurrentException(__PRETTY_FUNCTION__);
    }
}

ssize_t LocalPositionalInputStream::readAt(UInt64 offset, char * to, size_t size)
{
    int current_fd = fd.load();
    if (current_fd == -1)
        throw Exception(ErrorCodes::FILE_ALREADY_CLOSED, "Cannot read from closed file {}", file_name);

    if (size == 0)
        return 0;

    while (true)
    {
        ssize_t res = ::pread(current_fd, to, size, offset);

        if (-1 == res)
        {
            if (errno == EINTR)
                continue;

            throwFromErrnoWithPath("Cannot read from file " + file_name, file_name, ErrorCodes::CANNOT_READ_FROM_FILE_DESCRIPTOR);
        }

        if (res == 0)
            return END_OF_STREAM;
        return res;
    }
}

void LocalPositionalInputStream::close()
{
    int current_fd = fd.exchange(-1);
    if (current_fd == -1)
        return;

    if (0 != ::close(current_fd))
        throwFromErrnoWithPath("Cannot close file " + file_name, file_name, ErrorCodes::CANNOT_CLOSE_FILE);
}


LocalFileSystemClient::LocalFileSystemClient()
    : log(&Poco::Logger::get("LocalFileSystemClient"))
{
}

String LocalFileSystemClient::toLocalPath(const String & path)
{
    FileNameParts parts = splitFileName(path);
    if (!parts.scheme.empty() && parts.scheme != "file")
        throw Exception(ErrorCodes::BAD_ARGUMENTS, "File {} does not belong to the local filesystem", path);
    return parts.path;
}

PositionalInputStreamPtr LocalFileSystemClient::openPositionalStream(const String & path, size_t buffer_size)
{
    String local_path = toLocalPath(path);
    LOG_TRACE(log, "Opening {} (buffer size hint {} is not used)", local_path, buffer_size);
    return std::make_shared<LocalPositionalInputStream>(local_path);
}

UInt64 LocalFileSystemClient::getFileSize(const String & path)
{
    String local_path = toLocalPath(path);

    struct stat st;
    if (0 != ::stat(local_path.c_str(), &st))
        throwFromErrnoWithPath("Cannot stat file " + local_path, local_path,
            errno == ENOENT ? ErrorCodes::FILE_DOESNT_EXIST : ErrorCodes::CANNOT_STAT);

    return st.st_size;
}

bool LocalFileSystemClient::exists(const String & path)
{
    String local_path = toLocalPath(path);

    struct stat st;
    if (0 == ::stat(local_path.c_str(), &st))
        return true;

    if (errno == ENOENT || errno == ENOTDIR)
        return false;

    throwFromErrnoWithPath("Cannot stat file " + local_path, local_path, ErrorCodes::CANNOT_STAT);
}


void registerLocalFileSystem(FileSystemFactory & factory)
{
    auto creator = [](const Poco::URI &, const RemoteChannelSettings &) -> FileSystemClientPtr
    {
        return std::make_shared<LocalFileSystemClient>();
    };

    factory.registerFileSystem("file", creator);
}

}
