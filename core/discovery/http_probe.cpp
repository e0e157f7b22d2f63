#include "http_probe.hpp"

#include <httplib.h>

#include <chrono>
#include <stdexcept>

#include "logging/logger.hpp"

namespace devscout {
namespace discovery {

const char *miss_reason_to_string(MissReason reason) {
    switch (reason) {
        case MissReason::UNREACHABLE:
            return "unreachable";
        case MissReason::TIMEOUT:
            return "timeout";
        case MissReason::READ_FAILED:
            return "read_failed";
        case MissReason::BAD_STATUS:
            return "bad_status";
        case MissReason::MALFORMED_BODY:
            return "malformed_body";
        case MissReason::MISSING_ID:
            return "missing_id";
        default:
            return "unknown";
    }
}

namespace {

ProbeOutcome make_miss(MissReason reason, std::string detail) {
    ProbeOutcome outcome;
    outcome.miss = reason;
    outcome.detail = std::move(detail);
    return outcome;
}

MissReason classify_transport_error(httplib::Error error) {
    switch (error) {
        case httplib::Error::ConnectionTimeout:
            return MissReason::TIMEOUT;
        case httplib::Error::Read:
            return MissReason::READ_FAILED;
        default:
            return MissReason::UNREACHABLE;
    }
}

}  // namespace

void validate_target(const ProbeTarget &target) {
    if (target.timeout.count() <= 0) {
        throw std::invalid_argument("probe timeout must be positive, got " + std::to_string(target.timeout.count()) +
                                    "ms");
    }
    if (target.ip.empty()) {
        throw std::invalid_argument("probe target has no address");
    }
    if (target.port < 1 || target.port > 65535) {
        throw std::invalid_argument("probe port out of range: " + std::to_string(target.port));
    }
}

ProbeOutcome parse_identity_body(const std::string &body, const std::string &ip) {
    if (body.empty()) {
        return make_miss(MissReason::MALFORMED_BODY, "empty body");
    }

    nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        return make_miss(MissReason::MALFORMED_BODY, "body is not JSON");
    }
    if (!parsed.is_object()) {
        return make_miss(MissReason::MALFORMED_BODY, "body is not a JSON object");
    }

    auto id_it = parsed.find("id");
    if (id_it == parsed.end()) {
        return make_miss(MissReason::MISSING_ID, "no id field");
    }

    std::string id;
    if (id_it->is_string()) {
        id = id_it->get<std::string>();
    } else if (id_it->is_number_integer()) {
        id = id_it->dump();
    } else {
        return make_miss(MissReason::MISSING_ID, "id is neither string nor integer");
    }
    if (id.empty()) {
        return make_miss(MissReason::MISSING_ID, "id is empty");
    }

    DeviceRecord record;
    record.id = id;
    record.ip = ip;
    record.attributes = std::move(parsed);

    ProbeOutcome outcome;
    outcome.record = std::move(record);
    return outcome;
}

ProbeOutcome HttpProbe::probe(const ProbeTarget &target) {
    validate_target(target);

    ProbeOutcome outcome = fetch_identity(target);
    if (outcome.hit()) {
        LOG_DEBUG("[Probe] " << target.ip << ":" << target.port << " -> " << outcome.record->id);
    } else {
        LOG_DEBUG("[Probe] " << target.ip << ":" << target.port << " miss (" << miss_reason_to_string(outcome.miss)
                             << "): " << outcome.detail);
    }
    return outcome;
}

ProbeOutcome HttpProbe::fetch_identity(const ProbeTarget &target) {
    const auto deadline = std::chrono::steady_clock::now() + target.timeout;

    httplib::Client client(target.ip, target.port);
    client.set_connection_timeout(target.timeout);
    client.set_read_timeout(target.timeout);
    client.set_write_timeout(target.timeout);
    client.set_follow_location(false);
    client.set_keep_alive(false);

    // Socket timeouts apply per wait, so a trickling peer is cut off here
    bool expired = false;
    bool oversized = false;
    std::string body;

    auto result = client.Get(
        target.path,
        [&](const httplib::Response &) {
            expired = std::chrono::steady_clock::now() >= deadline;
            return !expired;
        },
        [&](const char *data, size_t data_length) {
            if (std::chrono::steady_clock::now() >= deadline) {
                expired = true;
                return false;
            }
            if (body.size() + data_length > kMaxIdentityBodyBytes) {
                oversized = true;
                return false;
            }
            body.append(data, data_length);
            return true;
        });

    if (expired) {
        return make_miss(MissReason::TIMEOUT, "no complete response within " +
                                                  std::to_string(target.timeout.count()) + "ms");
    }
    if (oversized) {
        return make_miss(MissReason::READ_FAILED,
                         "body exceeds " + std::to_string(kMaxIdentityBodyBytes) + " bytes");
    }
    if (!result) {
        const auto error = result.error();
        return make_miss(classify_transport_error(error), httplib::to_string(error));
    }

    if (result->status < 200 || result->status >= 300) {
        return make_miss(MissReason::BAD_STATUS, "HTTP " + std::to_string(result->status));
    }

    return parse_identity_body(body, target.ip);
}

}  // namespace discovery
}  // namespace devscout
