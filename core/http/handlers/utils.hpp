#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>

#include "../errors.hpp"

namespace devscout {
namespace http {

// Helper: Parse device id from regex matches
inline bool parse_device_id(const httplib::Request &req, std::string &device_id) {
    if (req.matches.size() >= 2) {
        device_id = req.matches[1].str();
        return !device_id.empty();
    }
    return false;
}

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(), "application/json");
}

}  // namespace http
}  // namespace devscout
