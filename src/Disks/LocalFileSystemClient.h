#pragma once

#include <Disks/IFileSystemClient.h>

#include <atomic>

namespace Poco { class Logger; }

namespace SSTIO
{

/// Stream over a local file descriptor. readAt() uses pread(), so it is reentrant.
class LocalPositionalInputStream final : public IPositionalInputStream
{
public:
    explicit LocalPositionalInputStream(const String & file_name_);
    ~LocalPositionalInputStream() override;

    ssize_t readAt(UInt64 offset, char * to, size_t size) override;

    void close() override;

    bool isClosed() const override { return fd.load() == -1; }

    const String & getFileName() const { return file_name; }

private:
    String file_name;
    std::atomic<int> fd{-1};
};


/// Client of the `file` scheme: names like file:///path/to/file.
class LocalFileSystemClient final : public IFileSystemClient
{
public:
    LocalFileSystemClient();

    String getName() const override { return "local"; }

    /// `buffer_size` is ignored: pread() reads straight into the memory of the caller.
    PositionalInputStreamPtr openPositionalStream(const String & path, size_t buffer_size) override;

    UInt64 getFileSize(const String & path) override;

    bool exists(const String & path) override;

    /// file:///a/b -> /a/b
    static String toLocalPath(const String & path);

private:
    Poco::Logger * log;
};

}
