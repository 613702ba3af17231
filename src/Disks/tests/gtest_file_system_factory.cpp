#include <gtest/gtest.h>

#include <Disks/FileSystemFactory.h>
#include <Disks/LocalFileSystemClient.h>
#include <Disks/registerFileSystems.h>
#include <Common/Exception.h>

#include <Poco/URI.h>

#include <atomic>
#include <mutex>


using namespace SSTIO;

namespace SSTIO::ErrorCodes
{
    extern const int LOGICAL_ERROR;
    extern const int UNKNOWN_FILESYSTEM;
}

namespace
{

std::atomic<size_t> created{0};

void registerCountingFileSystem()
{
    static std::once_flag registered;
    std::call_once(registered, []
    {
        FileSystemFactory::instance().registerFileSystem("counting",
            [](const Poco::URI &, const RemoteChannelSettings &) -> FileSystemClientPtr
            {
                ++created;
                return std::make_shared<LocalFileSystemClient>();
            });
    });
}

}


TEST(FileSystemFactory, UnknownScheme)
{
    try
    {
        FileSystemFactory::instance().get("nosuchscheme://host/data.db", {});
        FAIL() << "unknown scheme must throw";
    }
    catch (const Exception & e)
    {
        EXPECT_EQ(e.code(), ErrorCodes::UNKNOWN_FILESYSTEM);
    }
}

TEST(FileSystemFactory, ClientsAreCachedPerAuthority)
{
    registerCountingFileSystem();
    auto & factory = FileSystemFactory::instance();

    size_t before = created;
    RemoteChannelSettings settings;

    auto first = factory.get("counting://one/a.db", settings);
    auto second = factory.get("counting://one/b.db", settings);
    auto other = factory.get("counting://two/a.db", settings);

    EXPECT_EQ(first, second);
    EXPECT_NE(first, other);
    EXPECT_EQ(created - before, 2u);

    settings.cache_clients = false;
    auto uncached = factory.get("counting://one/a.db", settings);
    EXPECT_NE(uncached, first);
    EXPECT_EQ(created - before, 3u);
}

TEST(FileSystemFactory, CreatorMayUseFactory)
{
    registerCountingFileSystem();

    static std::once_flag registered;
    std::call_once(registered, []
    {
        FileSystemFactory::instance().registerFileSystem("nested",
            [](const Poco::URI & uri, const RemoteChannelSettings & settings) -> FileSystemClientPtr
            {
                return FileSystemFactory::instance().get("counting://" + uri.getAuthority() + "/", settings);
            });
    });

    RemoteChannelSettings settings;
    auto nested = FileSystemFactory::instance().get("nested://inner/data.db", settings);
    auto counting = FileSystemFactory::instance().get("counting://inner/other.db", settings);
    EXPECT_EQ(nested, counting);
    EXPECT_EQ(FileSystemFactory::instance().get("nested://inner/data.db", settings), nested);
}

TEST(FileSystemFactory, SchemeIsRegisteredOnce)
{
    registerFileSystems();
    registerFileSystems();
    EXPECT_TRUE(FileSystemFactory::instance().isRegistered("file"));

    try
    {
        FileSystemFactory::instance().registerFileSystem("file",
            [](const Poco::URI &, const RemoteChannelSettings &) -> FileSystemClientPtr { return nullptr; });
        FAIL() << "duplicate scheme must be rejected";
    }
    catch (const Exception & e)
    {
        EXPECT_EQ(e.code(), ErrorCodes::LOGICAL_ERROR);
    }

    EXPECT_EQ(FileSystemFactory::instance().get("file:///tmp/data.db", {})->getName(), "local");
}
