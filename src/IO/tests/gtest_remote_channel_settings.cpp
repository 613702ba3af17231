#include <gtest/gtest.h>

#include <IO/RemoteChannelSettings.h>
#include <Common/Exception.h>

#include <Poco/AutoPtr.h>
#include <Poco/Util/XMLConfiguration.h>

#include <sstream>


using namespace SSTIO;

namespace SSTIO::ErrorCodes
{
    extern const int BAD_ARGUMENTS;
}

namespace
{

Poco::AutoPtr<Poco::Util::XMLConfiguration> parseConfig(const std::string & xml)
{
    std::istringstream stream(xml);
    return new Poco::Util::XMLConfiguration(stream);
}

}


TEST(RemoteChannelSettings, Defaults)
{
    auto config = parseConfig("<sstio></sstio>");

    RemoteChannelSettings settings;
    settings.loadFromConfig(*config, "remote_channel");
    EXPECT_EQ(settings.buffer_size, DEFAULT_REMOTE_CHANNEL_BUFFER_SIZE);
    EXPECT_EQ(settings.default_scheme, "file");
    EXPECT_TRUE(settings.cache_clients);
}

TEST(RemoteChannelSettings, LoadFromConfig)
{
    auto config = parseConfig(R"(
<sstio>
    <remote_channel>
        <buffer_size>1048576</buffer_size>
        <default_scheme>hdfs</default_scheme>
        <cache_clients>false</cache_clients>
    </remote_channel>
</sstio>)");

    RemoteChannelSettings settings;
    settings.loadFromConfig(*config, "remote_channel");
    EXPECT_EQ(settings.buffer_size, 1048576u);
    EXPECT_EQ(settings.default_scheme, "hdfs");
    EXPECT_FALSE(settings.cache_clients);
}

TEST(RemoteChannelSettings, ZeroBufferSizeIsRejected)
{
    auto config = parseConfig("<sstio><remote_channel><buffer_size>0</buffer_size></remote_channel></sstio>");

    RemoteChannelSettings settings;
    try
    {
        settings.loadFromConfig(*config, "remote_channel");
        FAIL() << "zero buffer size must be rejected";
    }
    catch (const Exception & e)
    {
        EXPECT_EQ(e.code(), ErrorCodes::BAD_ARGUMENTS);
    }
}
