#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "discovery/device_record.hpp"
#include "discovery/i_probe.hpp"
#include "discovery/scanner.hpp"
#include "discovery/subnet.hpp"
#include "http/server.hpp"
#include "query/query_service.hpp"
#include "registry/device_registry.hpp"

namespace devscout {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Builds registry, subnet source, probe, scanner and query service.
    // With start_http, also binds the HTTP adapter.
    bool initialize(std::string &error, bool start_http = true);

    // Main runtime loop (blocking until stop() or a signal)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    void shutdown();

    registry::DeviceRegistry &get_registry() { return *registry_; }
    discovery::Scanner &get_scanner() { return *scanner_; }
    query::QueryService &get_query_service() { return *query_service_; }

private:
    bool init_discovery(std::string &error);
    bool init_http(std::string &error);

    RuntimeConfig config_;

    std::unique_ptr<registry::DeviceRegistry> registry_;
    std::unique_ptr<discovery::ISubnetSource> subnet_source_;
    std::unique_ptr<discovery::IProbe> probe_;
    std::unique_ptr<discovery::Scanner> scanner_;
    std::unique_ptr<query::QueryService> query_service_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace devscout
