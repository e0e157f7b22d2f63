#include "../../discovery/device_record.hpp"
#include "../../logging/logger.hpp"
#include "../../query/query_service.hpp"
#include "../server.hpp"
#include "utils.hpp"

#include <atomic>

namespace devscout {
namespace http {

namespace {

// Releases a GET /devices slot even when the sweep throws
class PendingSweepSlot {
public:
    explicit PendingSweepSlot(std::atomic<int> &counter) : counter_(counter) {}
    ~PendingSweepSlot() { counter_.fetch_sub(1); }

    PendingSweepSlot(const PendingSweepSlot &) = delete;
    PendingSweepSlot &operator=(const PendingSweepSlot &) = delete;

private:
    std::atomic<int> &counter_;
};

}  // namespace

//=============================================================================
// GET /devices
//=============================================================================
void HttpServer::handle_get_devices(const httplib::Request &, httplib::Response &res) {
    if (pending_sweeps_.fetch_add(1) >= max_pending_sweeps()) {
        pending_sweeps_.fetch_sub(1);
        LOG_WARN("[HTTP] Rejecting sweep request, " << max_pending_sweeps() << " already pending");
        send_json(res, StatusCode::UNAVAILABLE,
                  make_error_response(StatusCode::UNAVAILABLE, "Too many sweep requests in progress"));
        return;
    }

    PendingSweepSlot slot(pending_sweeps_);

    std::string error;
    auto devices = query_service_.sweep(error);
    if (!devices) {
        send_json(res, StatusCode::UNAVAILABLE, make_error_response(StatusCode::UNAVAILABLE, error));
        return;
    }

    send_json(res, StatusCode::OK, discovery::encode_device_map(*devices));
}

//=============================================================================
// GET /devices_list
//=============================================================================
void HttpServer::handle_get_devices_list(const httplib::Request &, httplib::Response &res) {
    auto devices = query_service_.list_devices();
    send_json(res, StatusCode::OK, discovery::encode_device_map(*devices));
}

//=============================================================================
// GET /device/{id}
//=============================================================================
void HttpServer::handle_get_device_refresh(const httplib::Request &req, httplib::Response &res) {
    std::string device_id;
    if (!parse_device_id(req, device_id)) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
        return;
    }

    // Best-effort: a miss is still a successful request
    bool refreshed = query_service_.refresh_device(device_id);

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"id", device_id}, {"refreshed", refreshed}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace devscout
