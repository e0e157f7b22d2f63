#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <sstream>

#include "../logging/logger.hpp"

namespace devscout {
namespace runtime {

namespace {

std::optional<discovery::SubnetSourceKind> parse_subnet_source(const std::string &source_str) {
    if (source_str == "route") {
        return discovery::SubnetSourceKind::ROUTE;
    }
    if (source_str == "static") {
        return discovery::SubnetSourceKind::STATIC;
    }
    return std::nullopt;
}

const char *subnet_source_to_string(discovery::SubnetSourceKind kind) {
    switch (kind) {
        case discovery::SubnetSourceKind::ROUTE:
            return "route";
        case discovery::SubnetSourceKind::STATIC:
            return "static";
        default:
            return "unknown";
    }
}

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            LOG_WARN("[Config] Unknown key: '" << (section.empty() ? key : section + "." + key)
                                               << "' (will be ignored)");
        }
    }
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        // One worker always stays free for reads while sweeps block
        if (config.http.thread_pool_size < 2) {
            error = "HTTP thread_pool_size must be at least 2";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
    }

    // Validate discovery settings
    const auto &discovery = config.discovery;
    if (discovery.device_port < 1 || discovery.device_port > 65535) {
        error = "discovery.device_port must be between 1 and 65535";
        return false;
    }
    if (discovery.identity_path.empty() || discovery.identity_path[0] != '/') {
        error = "discovery.identity_path must start with '/'";
        return false;
    }
    if (discovery.probe_timeout_ms <= 0) {
        error = "discovery.probe_timeout_ms must be > 0";
        return false;
    }
    if (discovery.max_parallel_probes < 0) {
        error = "discovery.max_parallel_probes must be >= 0 (0 = unbounded)";
        return false;
    }
    if (discovery.subnet_source == discovery::SubnetSourceKind::STATIC && discovery.subnet_prefix.empty()) {
        error = "discovery.subnet_prefix is required when subnet_source is static";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (!yaml.IsNull() && !yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        warn_unknown_keys(yaml, "", {"http", "discovery", "logging"});

        // Load HTTP config
        if (yaml["http"]) {
            const auto http = yaml["http"];
            warn_unknown_keys(http, "http", {"enabled", "bind", "port", "cors_allowed_origins", "thread_pool_size"});

            if (http["enabled"]) {
                config.http.enabled = http["enabled"].as<bool>();
            }
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }
            }

            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        // Load discovery config
        if (yaml["discovery"]) {
            const auto disc = yaml["discovery"];
            warn_unknown_keys(disc, "discovery",
                              {"device_port", "identity_path", "probe_timeout_ms", "max_parallel_probes",
                               "subnet_source", "subnet_prefix", "interface", "scan_on_startup"});

            if (disc["device_port"]) {
                config.discovery.device_port = disc["device_port"].as<int>();
            }
            if (disc["identity_path"]) {
                config.discovery.identity_path = disc["identity_path"].as<std::string>();
            }
            if (disc["probe_timeout_ms"]) {
                config.discovery.probe_timeout_ms = disc["probe_timeout_ms"].as<int>();
            }
            if (disc["max_parallel_probes"]) {
                config.discovery.max_parallel_probes = disc["max_parallel_probes"].as<int>();
            }
            if (disc["subnet_source"]) {
                auto source_str = disc["subnet_source"].as<std::string>();
                auto source = parse_subnet_source(source_str);
                if (!source) {
                    error = "Invalid discovery.subnet_source '" + source_str + "': must be route or static";
                    return false;
                }
                config.discovery.subnet_source = *source;
            }
            if (disc["subnet_prefix"]) {
                config.discovery.subnet_prefix = disc["subnet_prefix"].as<std::string>();
            }
            if (disc["interface"]) {
                config.discovery.interface_name = disc["interface"].as<std::string>();
            }
            if (disc["scan_on_startup"]) {
                config.discovery.scan_on_startup = disc["scan_on_startup"].as<bool>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Discovery: port " << config.discovery.device_port << config.discovery.identity_path
                                             << ", timeout " << config.discovery.probe_timeout_ms
                                             << "ms, subnet source "
                                             << subnet_source_to_string(config.discovery.subnet_source));
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const YAML::Exception &e) {
        error = "Config value error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace devscout
