#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "discovery/discovery_config.hpp"
#include "discovery/i_probe.hpp"
#include "discovery/subnet.hpp"

namespace devscout {
namespace registry {
class DeviceRegistry;
}

namespace discovery {

constexpr int kHostsPerSubnet = 256;
constexpr size_t kMissReasonCount = 6;

// Outcome counters of one completed sweep
struct SweepStats {
    std::string subnet;  // "192.168.1" (empty before the first sweep)
    size_t targets = 0;
    size_t hits = 0;     // Successful probes, before id de-duplication
    size_t devices = 0;  // Distinct ids published to the registry
    std::array<size_t, kMissReasonCount> misses{};
    std::chrono::milliseconds duration{0};

    size_t miss_count() const;
};

/**
 * @brief Sweeps one /24 for identity endpoints
 *
 * sweep() resolves the subnet, probes every host address concurrently,
 * joins all probes and publishes the result with one registry replace.
 *
 * Thread model:
 * - One std::thread per address, or max_parallel_probes workers pulling
 *   from a shared index
 * - Hits land in a per-sweep buffer in completion order; the registry
 *   is untouched until every probe has returned
 * - Concurrent sweep() calls are serialized
 */
class Scanner {
public:
    // Throws std::invalid_argument for a non-positive probe timeout or a
    // negative max_parallel_probes
    Scanner(const DiscoveryConfig &config, ISubnetSource &subnet_source, IProbe &probe,
            registry::DeviceRegistry &registry);

    // Returns false (registry untouched) when no subnet can be determined.
    // Rethrows a probe's std::invalid_argument after joining all workers.
    bool sweep(std::string &error);

    // Candidate targets .0 through .255 for the prefix
    std::vector<ProbeTarget> build_targets(const SubnetPrefix &prefix) const;

    SweepStats last_stats() const;
    uint64_t sweep_count() const;

private:
    // Runs every target and returns hits in completion order
    std::vector<DeviceRecord> run_probes(const std::vector<ProbeTarget> &targets, SweepStats &stats);

    DiscoveryConfig config_;
    ISubnetSource &subnet_source_;
    IProbe &probe_;
    registry::DeviceRegistry &registry_;

    std::mutex sweep_mutex_;

    mutable std::mutex stats_mutex_;
    SweepStats last_stats_;
    uint64_t sweep_count_ = 0;
};

}  // namespace discovery
}  // namespace devscout
