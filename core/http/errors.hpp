#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace devscout {
namespace http {

/**
 * @brief Service status codes mapped to HTTP status codes
 *
 * - OK -> HTTP 200
 * - INVALID_ARGUMENT -> HTTP 400
 * - NOT_FOUND -> HTTP 404
 * - UNAVAILABLE -> HTTP 503 (no usable subnet for a sweep)
 * - INTERNAL -> HTTP 500
 */
enum class StatusCode { OK, INVALID_ARGUMENT, NOT_FOUND, UNAVAILABLE, INTERNAL };

inline int status_code_to_http(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return 200;
        case StatusCode::INVALID_ARGUMENT:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::UNAVAILABLE:
            return 503;
        case StatusCode::INTERNAL:
            return 500;
        default:
            return 500;
    }
}

inline std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::UNAVAILABLE:
            return "UNAVAILABLE";
        case StatusCode::INTERNAL:
            return "INTERNAL";
        default:
            return "INTERNAL";
    }
}

/**
 * @brief Build a JSON status object
 *
 * Error and acknowledgement responses carry a top-level "status" object
 * with code and message. Registry listings are returned bare.
 */
inline nlohmann::json make_status(StatusCode code, const std::string &message = "") {
    std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
    return {{"code", status_code_to_string(code)}, {"message", msg}};
}

inline nlohmann::json make_error_response(StatusCode code, const std::string &message) {
    return {{"status", make_status(code, message)}};
}

}  // namespace http
}  // namespace devscout
