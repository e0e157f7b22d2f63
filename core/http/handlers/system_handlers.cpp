#include "../../discovery/scanner.hpp"
#include "../../registry/device_registry.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace devscout {
namespace http {

//=============================================================================
// GET /status
//=============================================================================
void HttpServer::handle_get_status(const httplib::Request &, httplib::Response &res) {
    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"sweep_count", scanner_.sweep_count()},
                               {"device_count", registry_.device_count()},
                               {"registry_generation", registry_.generation()},
                               {"last_sweep", encode_sweep_stats(scanner_.last_stats())}};

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace devscout
