#include "json.hpp"

namespace devscout {
namespace http {

nlohmann::json encode_sweep_stats(const discovery::SweepStats &stats) {
    nlohmann::json misses = nlohmann::json::object();
    for (size_t i = 0; i < discovery::kMissReasonCount; ++i) {
        misses[discovery::miss_reason_to_string(static_cast<discovery::MissReason>(i))] = stats.misses[i];
    }

    return {{"subnet", stats.subnet},
            {"targets", stats.targets},
            {"hits", stats.hits},
            {"devices", stats.devices},
            {"misses", misses},
            {"duration_ms", stats.duration.count()}};
}

}  // namespace http
}  // namespace devscout
