#include <Disks/FileSystemFactory.h>

#include <Disks/normalizeFileName.h>
#include <Common/Exception.h>
#include <Common/logger_useful.h>

#include <Poco/URI.h>


namespace SSTIO
{

namespace ErrorCodes
{
    extern const int LOGICAL_ERROR;
    extern const int UNKNOWN_FILESYSTEM;
}

FileSystemFactory & FileSystemFactory::instance()
{
    static FileSystemFactory factory;
    return factory;
}

void FileSystemFactory::registerFileSystem(const String & scheme, Creator creator)
{
    std::lock_guard lock(mutex);
    if (!registry.emplace(scheme, std::move(creator)).second)
        throw Exception(ErrorCodes::LOGICAL_ERROR, "FileSystemFactory: the filesystem scheme '{}' is not unique", scheme);
}

bool FileSystemFactory::isRegistered(const String & scheme) const
{
    std::lock_guard lock(mutex);
    return registry.contains(scheme);
}

FileSystemClientPtr FileSystemFactory::get(const String & normalized_path, const RemoteChannelSettings & settings)
{
    FileNameParts parts = splitFileName(normalized_path);
    String key = parts.scheme + "://" + parts.authority;

    Creator creator;
    {
        std::lock_guard lock(mutex);

        if (settings.cache_clients)
        {
            auto it = clients.find(key);
            if (it != clients.end())
                return it->second;
        }

        auto it = registry.find(parts.scheme);
        if (it == registry.end())
            throw Exception(ErrorCodes::UNKNOWN_FILESYSTEM, "Unknown filesystem scheme '{}' of file {}", parts.scheme, normalized_path);
        creator = it->second;
    }

    Poco::URI uri;
    uri.setScheme(parts.scheme);
    uri.setAuthority(parts.authority);

    /// Without the lock: a creator may connect to a remote service or use the factory itself.
    auto client = creator(uri, settings);
    LOG_DEBUG(&Poco::Logger::get("FileSystemFactory"), "Created filesystem client {} for {}", client->getName(), key);

    if (!settings.cache_clients)
        return client;

    /// Another thread may have created a client for the same key meanwhile, then that one is kept.
    std::lock_guard lock(mutex);
    return clients.emplace(key, client).first->second;
}

void FileSystemFactory::resetCache()
{
    std::lock_guard lock(mutex);
    clients.clear();
}

}
