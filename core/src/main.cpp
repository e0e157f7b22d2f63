// devscout
// LAN identity-endpoint discovery service with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "discovery/device_record.hpp"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

int main(int argc, char **argv) {
    std::string config_path = "devscout.yaml";  // Default
    bool config_given = false;
    bool scan_once = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            config_given = true;
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
            config_given = true;
        } else if (arg == "--scan") {
            scan_once = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: devscout [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: devscout.yaml)\n";
            std::cerr << "  --scan           Sweep once, print devices as JSON and exit\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    devscout::runtime::RuntimeConfig config;
    std::string error;

    if (std::filesystem::exists(config_path)) {
        LOG_INFO("Loading config: " << config_path);
        if (!devscout::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    } else if (config_given) {
        // Using cerr here as logger level is not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    } else {
        LOG_INFO("No " << config_path << " found, using built-in defaults");
    }

    devscout::logging::Logger::set_level(devscout::logging::string_to_level(config.logging.level));

    devscout::runtime::Runtime runtime(config);

    if (scan_once) {
        if (!runtime.initialize(error, false)) {
            LOG_ERROR("Runtime initialization failed: " << error);
            return 1;
        }

        auto devices = runtime.get_query_service().sweep(error);
        if (!devices) {
            LOG_ERROR(error);
            return 1;
        }
        std::cout << devscout::discovery::encode_device_map(*devices).dump(2) << std::endl;
        return 0;
    }

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    devscout::runtime::SignalHandler::install();

    LOG_INFO("Runtime Ready");
    LOG_INFO("  Probe: port " << config.discovery.device_port << config.discovery.identity_path << ", "
                              << config.discovery.probe_timeout_ms << "ms timeout");
    LOG_INFO("  Devices: " << runtime.get_registry().device_count());

    runtime.run();

    runtime.shutdown();
    LOG_INFO("Shutdown complete");
    return 0;
}
