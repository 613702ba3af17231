#pragma once

#include <base/types.h>

namespace Poco { namespace Util { class AbstractConfiguration; } }

namespace SSTIO
{

static constexpr size_t DEFAULT_REMOTE_CHANNEL_BUFFER_SIZE = 64 * 1024;

struct RemoteChannelSettings
{
    /// Buffer size hint passed to the filesystem client when a stream is opened.
    size_t buffer_size = DEFAULT_REMOTE_CHANNEL_BUFFER_SIZE;

    /// Scheme assumed for file names that don't have one.
    String default_scheme = "file";

    /// Reuse one filesystem client per scheme and authority.
    bool cache_clients = true;

    void loadFromConfig(const Poco::Util::AbstractConfiguration & config, const std::string & config_prefix);
};

}
