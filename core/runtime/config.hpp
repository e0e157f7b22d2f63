#pragma once

#include <string>
#include <vector>

#include "../discovery/discovery_config.hpp"

namespace devscout {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "0.0.0.0";                        // Bind address
    int port = 8000;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    int thread_pool_size = 8;                            // Worker thread pool size
};

struct RuntimeConfig {
    HttpConfig http;
    discovery::DiscoveryConfig discovery;
    LoggingConfig logging;
};

// Loads configuration from a YAML file (validates before returning true)
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace devscout
