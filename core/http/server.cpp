#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace devscout {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, query::QueryService &query_service,
                       const discovery::Scanner &scanner, const registry::DeviceRegistry &registry)
    : config_(config), query_service_(query_service), scanner_(scanner), registry_(registry) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to all responses (allowlist with wildcard support)
    server_->set_post_routing_handler([origins = config_.cors_allowed_origins](const httplib::Request &req,
                                                                                httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto origin_matches = [&origin](const std::string &allowed) {
            if (allowed == "*") {
                return true;
            }

            const auto wildcard_pos = allowed.find('*');
            if (wildcard_pos == std::string::npos) {
                return allowed == origin;
            }

            const std::string prefix = allowed.substr(0, wildcard_pos);
            const std::string suffix = allowed.substr(wildcard_pos + 1);
            if (origin.size() < prefix.size() + suffix.size()) {
                return false;
            }

            const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
            const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
            return prefix_ok && suffix_ok;
        };

        auto matched = std::find_if(origins.begin(), origins.end(), origin_matches);
        if (matched == origins.end()) {
            return;
        }

        const std::string response_origin = *matched == "*" ? "*" : origin;
        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    setup_routes();

    // JSON bodies for errors raised outside the handlers (unknown routes)
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        }

        res.set_content(make_error_response(code, message).dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception in " << req.method << " " << req.path << ": " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception in " << req.method << " " << req.path);
        }

        res.status = kStatusInternal;
        res.set_content(make_error_response(StatusCode::INTERNAL, msg).dump(), "application/json");
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_DEBUG("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_DEBUG("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::setup_routes() {
    // GET /devices - Sweep the subnet, return the new registry
    server_->Get("/devices",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_devices(req, res); });

    // GET /devices_list - Last-known registry, no sweep
    server_->Get("/devices_list",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_devices_list(req, res); });

    // GET /device/:id - Re-probe one device
    server_->Get(R"(/device/([^/]+))", [this](const httplib::Request &req, httplib::Response &res) {
        handle_get_device_refresh(req, res);
    });

    // GET /status - Sweep counters
    server_->Get("/status",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_status(req, res); });

    // OPTIONS catch-all for CORS preflight
    server_->Options(R"(/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   GET  /devices");
    LOG_INFO("[HTTP]   GET  /devices_list");
    LOG_INFO("[HTTP]   GET  /device/{id}");
    LOG_INFO("[HTTP]   GET  /status");
}

}  // namespace http
}  // namespace devscout
