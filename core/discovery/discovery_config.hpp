#pragma once

#include <string>

namespace devscout {
namespace discovery {

enum class SubnetSourceKind { ROUTE, STATIC };

struct DiscoveryConfig {
    int device_port = 9000;                                // Identity endpoint port on every device
    std::string identity_path = "/id";                     // Identity endpoint path
    int probe_timeout_ms = 500;                            // Per-probe connect/read bound
    int max_parallel_probes = 0;                           // 0 = one worker per address
    SubnetSourceKind subnet_source = SubnetSourceKind::ROUTE;
    std::string subnet_prefix;                             // Required for STATIC ("192.168.1")
    std::string interface_name;                            // Optional override for ROUTE
    bool scan_on_startup = false;                          // Run one sweep before serving
};

}  // namespace discovery
}  // namespace devscout
