#pragma once

#include <string>

#include "discovery/device_record.hpp"
#include "discovery/discovery_config.hpp"
#include "discovery/i_probe.hpp"

namespace devscout {
namespace registry {
class DeviceRegistry;
}
namespace discovery {
class Scanner;
}

namespace query {

/**
 * @brief Read and refresh operations over the device registry
 *
 * The service boundary used by the HTTP adapter and the CLI. All
 * methods are safe to call from any thread.
 */
class QueryService {
public:
    QueryService(const discovery::DiscoveryConfig &config, registry::DeviceRegistry &registry,
                 discovery::Scanner &scanner, discovery::IProbe &probe);

    // Full sweep, then the resulting snapshot. On a configuration error
    // returns nullptr and leaves the registry as it was.
    discovery::DeviceMapSnapshot sweep(std::string &error);

    // Last-known content, no side effect
    discovery::DeviceMapSnapshot list_devices() const;

    // Re-probes the last-known address of one device and upserts the answer.
    // Unknown ids and failed probes leave the registry unchanged; the return
    // value only reports whether anything was refreshed.
    bool refresh_device(const std::string &id);

private:
    discovery::DiscoveryConfig config_;
    registry::DeviceRegistry &registry_;
    discovery::Scanner &scanner_;
    discovery::IProbe &probe_;
};

}  // namespace query
}  // namespace devscout
