#include "RemoteChannelSettings.h"

#include <Common/Exception.h>

#include <Poco/Util/AbstractConfiguration.h>

namespace SSTIO
{

namespace ErrorCodes
{
    extern const int BAD_ARGUMENTS;
}

void RemoteChannelSettings::loadFromConfig(const Poco::Util::AbstractConfiguration & config, const std::string & config_prefix)
{
    buffer_size = config.getUInt64(config_prefix + ".buffer_size", DEFAULT_REMOTE_CHANNEL_BUFFER_SIZE);
    default_scheme = config.getString(config_prefix + ".default_scheme", "file");
    cache_clients = config.getBool(config_prefix + ".cache_clients", true);

    if (buffer_size == 0)
        throw Exception(ErrorCodes::BAD_ARGUMENTS, "Setting {}.buffer_size must be positive", config_prefix);

    if (default_scheme.empty())
        throw Exception(ErrorCodes::BAD_ARGUMENTS, "Setting {}.default_scheme must not be empty", config_prefix);
}

}
