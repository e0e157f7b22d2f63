#pragma once

#include <cstddef>
#include <string>

#include "discovery/i_probe.hpp"

namespace devscout {
namespace discovery {

/**
 * @brief Identity probe over plain HTTP (cpp-httplib client)
 *
 * Issues a single GET to http://<ip>:<port><path>. The whole exchange
 * shares one deadline of target.timeout from the start of the probe, and
 * the body is capped at kMaxIdentityBodyBytes. No retry, no redirect
 * following. Stateless, so one instance is shared by every worker of a
 * sweep.
 */
class HttpProbe : public IProbe {
public:
    ProbeOutcome probe(const ProbeTarget &target) override;

private:
    ProbeOutcome fetch_identity(const ProbeTarget &target);
};

// Identity documents are small; anything larger is treated as a read failure
constexpr std::size_t kMaxIdentityBodyBytes = 64 * 1024;

// Throws std::invalid_argument for a non-positive timeout, an empty address
// or a port outside 1..65535
void validate_target(const ProbeTarget &target);

// Turns an identity response body into a record for the given address.
// Exposed separately so body handling is testable without a socket.
ProbeOutcome parse_identity_body(const std::string &body, const std::string &ip);

}  // namespace discovery
}  // namespace devscout
