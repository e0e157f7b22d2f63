#pragma once

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "runtime/config.hpp"

// Forward declarations
namespace devscout {
namespace query {
class QueryService;
}
namespace discovery {
class Scanner;
}
namespace registry {
class DeviceRegistry;
}
}  // namespace devscout

namespace devscout {
namespace http {

/**
 * @brief HTTP adapter over the discovery service
 *
 * Exposes sweep, listing and refresh over REST. Runs in its own thread
 * and delegates every operation to QueryService, which is thread-safe.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 * - A GET /devices request blocks its pool thread for the whole sweep
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, query::QueryService &query_service,
               const discovery::Scanner &scanner, const registry::DeviceRegistry &registry);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    query::QueryService &query_service_;
    const discovery::Scanner &scanner_;
    const registry::DeviceRegistry &registry_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    // GET /devices requests currently holding a worker (running or queued
    // on the scanner); capped below the pool size so reads are never starved
    std::atomic<int> pending_sweeps_{0};
    int max_pending_sweeps() const { return config_.thread_pool_size - 1; }

    void setup_routes();

    // Route handlers (handlers/*.cpp)
    void handle_get_devices(const httplib::Request &req, httplib::Response &res);
    void handle_get_devices_list(const httplib::Request &req, httplib::Response &res);
    void handle_get_device_refresh(const httplib::Request &req, httplib::Response &res);
    void handle_get_status(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace devscout
