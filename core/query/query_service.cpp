#include "query_service.hpp"

#include "discovery/scanner.hpp"
#include "logging/logger.hpp"
#include "registry/device_registry.hpp"

namespace devscout {
namespace query {

QueryService::QueryService(const discovery::DiscoveryConfig &config, registry::DeviceRegistry &registry,
                           discovery::Scanner &scanner, discovery::IProbe &probe)
    : config_(config), registry_(registry), scanner_(scanner), probe_(probe) {}

discovery::DeviceMapSnapshot QueryService::sweep(std::string &error) {
    if (!scanner_.sweep(error)) {
        return nullptr;
    }
    return registry_.get_all();
}

discovery::DeviceMapSnapshot QueryService::list_devices() const { return registry_.get_all(); }

bool QueryService::refresh_device(const std::string &id) {
    auto known = registry_.get(id);
    if (!known) {
        LOG_DEBUG("[Query] Refresh of unknown device '" << id << "' ignored");
        return false;
    }

    discovery::ProbeTarget target;
    target.ip = known->ip;
    target.port = config_.device_port;
    target.path = config_.identity_path;
    target.timeout = std::chrono::milliseconds(config_.probe_timeout_ms);

    discovery::ProbeOutcome outcome = probe_.probe(target);
    if (!outcome.hit()) {
        LOG_DEBUG("[Query] Refresh of '" << id << "' at " << target.ip
                                         << " missed: " << discovery::miss_reason_to_string(outcome.miss) << " "
                                         << outcome.detail);
        return false;
    }

    outcome.record->ip = target.ip;
    if (outcome.record->id != id) {
        LOG_WARN("[Query] Device at " << target.ip << " now reports id '" << outcome.record->id << "' (was '" << id
                                      << "')");
    }

    if (!registry_.upsert(*outcome.record)) {
        return false;
    }
    LOG_INFO("[Query] Refreshed '" << outcome.record->id << "' at " << target.ip);
    return true;
}

}  // namespace query
}  // namespace devscout
