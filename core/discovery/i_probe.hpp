#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "discovery/device_record.hpp"

namespace devscout {
namespace discovery {

// One candidate address for a single identity request
struct ProbeTarget {
    std::string ip;
    int port = 9000;
    std::string path = "/id";
    std::chrono::milliseconds timeout{500};
};

// Why a probe found no device. Every reason is an expected outcome.
enum class MissReason {
    UNREACHABLE,     // Refused, no route, reset during connect
    TIMEOUT,         // Connect did not complete in time
    READ_FAILED,     // Connected but the response never arrived in full
    BAD_STATUS,      // Non-2xx HTTP status
    MALFORMED_BODY,  // Empty, non-JSON or non-object body
    MISSING_ID       // JSON object without a usable "id"
};

const char *miss_reason_to_string(MissReason reason);

struct ProbeOutcome {
    std::optional<DeviceRecord> record;
    MissReason miss = MissReason::UNREACHABLE;  // Meaningful only when record is empty
    std::string detail;

    bool hit() const { return record.has_value(); }
};

// Interface for probes to enable mocking
class IProbe {
public:
    virtual ~IProbe() = default;

    // Must not throw for an absent or misbehaving device. Throws
    // std::invalid_argument for a target that could never be valid.
    virtual ProbeOutcome probe(const ProbeTarget &target) = 0;
};

}  // namespace discovery
}  // namespace devscout
