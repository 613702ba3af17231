#pragma once

#include <Disks/IFileSystemClient.h>
#include <IO/RemoteChannelSettings.h>

#include <boost/noncopyable.hpp>

#include <functional>
#include <mutex>
#include <unordered_map>

namespace Poco { class URI; }

namespace SSTIO
{

/**
 * Finds the filesystem client serving a normalized file name, by its scheme.
 * Clients are created by the creator registered for the scheme and,
 * unless disabled in settings, reused for every file with the same scheme and authority.
 */
class FileSystemFactory final : private boost::noncopyable
{
public:
    using Creator = std::function<FileSystemClientPtr(const Poco::URI & uri, const RemoteChannelSettings & settings)>;

    static FileSystemFactory & instance();

    void registerFileSystem(const String & scheme, Creator creator);

    bool isRegistered(const String & scheme) const;

    /// Throws UNKNOWN_FILESYSTEM if no creator is registered for the scheme of `normalized_path`.
    FileSystemClientPtr get(const String & normalized_path, const RemoteChannelSettings & settings);

    /// Forgets cached clients. Registered creators stay.
    void resetCache();

private:
    mutable std::mutex mutex;
    std::unordered_map<String, Creator> registry;
    std::unordered_map<String, FileSystemClientPtr> clients;
};

}
