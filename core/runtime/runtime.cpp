#include "runtime.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>

#include "discovery/http_probe.hpp"
#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace devscout {
namespace runtime {

namespace {
constexpr auto kMainLoopInterval = std::chrono::milliseconds(100);
}

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error, bool start_http) {
    LOG_INFO("[Runtime] Initializing devscout");

    if (!init_discovery(error)) {
        return false;
    }

    if (start_http && config_.discovery.scan_on_startup) {
        std::string sweep_error;
        if (!scanner_->sweep(sweep_error)) {
            // Not fatal: later sweeps may find a subnet once the network is up
            LOG_WARN("[Runtime] Startup sweep failed: " << sweep_error);
        }
    }

    if (start_http && !init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_discovery(std::string &error) {
    registry_ = std::make_unique<registry::DeviceRegistry>();

    const auto &discovery = config_.discovery;
    if (discovery.subnet_source == discovery::SubnetSourceKind::STATIC) {
        subnet_source_ = std::make_unique<discovery::StaticSubnetSource>(discovery.subnet_prefix);
    } else {
        subnet_source_ = std::make_unique<discovery::RouteTableSubnetSource>(discovery.interface_name);
    }
    LOG_INFO("[Runtime] Subnet source: " << subnet_source_->describe());

    probe_ = std::make_unique<discovery::HttpProbe>();

    try {
        scanner_ = std::make_unique<discovery::Scanner>(discovery, *subnet_source_, *probe_, *registry_);
    } catch (const std::invalid_argument &e) {
        error = std::string("Invalid discovery settings: ") + e.what();
        return false;
    }

    query_service_ = std::make_unique<query::QueryService>(discovery, *registry_, *scanner_, *probe_);
    return true;
}

bool Runtime::init_http(std::string &error) {
    if (!config_.http.enabled) {
        LOG_INFO("[Runtime] HTTP server disabled");
        return true;
    }

    http_server_ = std::make_unique<http::HttpServer>(config_.http, *query_service_, *scanner_, *registry_);
    if (!http_server_->start(error)) {
        error = "HTTP server failed to start: " + error;
        return false;
    }
    return true;
}

void Runtime::run() {
    running_ = true;
    LOG_INFO("[Runtime] Running (Ctrl+C to stop)");

    while (running_ && !SignalHandler::is_shutdown_requested()) {
        std::this_thread::sleep_for(kMainLoopInterval);
    }

    running_ = false;
    LOG_INFO("[Runtime] Main loop exited");
}

void Runtime::shutdown() {
    // HTTP first: handlers hold references to the discovery components
    if (http_server_) {
        http_server_->stop();
        http_server_.reset();
    }
    query_service_.reset();
    scanner_.reset();
    probe_.reset();
    subnet_source_.reset();
    registry_.reset();
}

}  // namespace runtime
}  // namespace devscout
