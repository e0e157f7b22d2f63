#include "scanner.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <numeric>
#include <stdexcept>
#include <system_error>
#include <thread>

#include "logging/logger.hpp"
#include "registry/device_registry.hpp"

namespace devscout {
namespace discovery {

size_t SweepStats::miss_count() const { return std::accumulate(misses.begin(), misses.end(), size_t{0}); }

Scanner::Scanner(const DiscoveryConfig &config, ISubnetSource &subnet_source, IProbe &probe,
                 registry::DeviceRegistry &registry)
    : config_(config), subnet_source_(subnet_source), probe_(probe), registry_(registry) {
    if (config_.probe_timeout_ms <= 0) {
        throw std::invalid_argument("probe_timeout_ms must be positive, got " +
                                    std::to_string(config_.probe_timeout_ms));
    }
    if (config_.max_parallel_probes < 0) {
        throw std::invalid_argument("max_parallel_probes must be >= 0");
    }
}

std::vector<ProbeTarget> Scanner::build_targets(const SubnetPrefix &prefix) const {
    std::vector<ProbeTarget> targets;
    targets.reserve(kHostsPerSubnet);

    for (int suffix = 0; suffix < kHostsPerSubnet; ++suffix) {
        ProbeTarget target;
        target.ip = prefix.host(suffix);
        target.port = config_.device_port;
        target.path = config_.identity_path;
        target.timeout = std::chrono::milliseconds(config_.probe_timeout_ms);
        targets.push_back(std::move(target));
    }
    return targets;
}

bool Scanner::sweep(std::string &error) {
    std::lock_guard<std::mutex> sweep_lock(sweep_mutex_);

    SubnetPrefix prefix;
    if (!subnet_source_.detect(prefix, error)) {
        error = "Configuration error: " + error;
        LOG_ERROR("[Scanner] " << error);
        return false;
    }

    auto targets = build_targets(prefix);
    LOG_INFO("[Scanner] Sweeping " << prefix.to_string() << ".0/24 (" << targets.size() << " addresses, "
                                   << config_.probe_timeout_ms << "ms timeout)");

    SweepStats stats;
    stats.subnet = prefix.to_string();
    stats.targets = targets.size();

    auto started = std::chrono::steady_clock::now();
    std::vector<DeviceRecord> completed = run_probes(targets, stats);
    stats.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    // Completion order decides duplicate ids: the later hit overwrites
    DeviceMap devices;
    for (auto &record : completed) {
        if (devices.count(record.id) > 0) {
            LOG_WARN("[Scanner] Duplicate id '" << record.id << "' at " << devices[record.id].ip << " and "
                                                << record.ip << ", keeping " << record.ip);
        }
        std::string id = record.id;
        devices[id] = std::move(record);
    }
    stats.devices = devices.size();

    registry_.replace(std::move(devices));

    LOG_INFO("[Scanner] Sweep of " << stats.subnet << " done in " << stats.duration.count() << "ms: "
                                   << stats.devices << " device(s), " << stats.miss_count() << " miss(es)");
    for (size_t i = 0; i < kMissReasonCount; ++i) {
        if (stats.misses[i] > 0) {
            LOG_DEBUG("[Scanner]   " << miss_reason_to_string(static_cast<MissReason>(i)) << ": "
                                      << stats.misses[i]);
        }
    }

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        last_stats_ = stats;
        ++sweep_count_;
    }
    return true;
}

std::vector<DeviceRecord> Scanner::run_probes(const std::vector<ProbeTarget> &targets, SweepStats &stats) {
    std::vector<DeviceRecord> completed;
    std::mutex completed_mutex;

    std::array<std::atomic<size_t>, kMissReasonCount> misses{};
    std::atomic<size_t> next_index{0};

    std::exception_ptr fatal;
    std::mutex fatal_mutex;

    auto worker = [&]() {
        for (size_t i = next_index.fetch_add(1); i < targets.size(); i = next_index.fetch_add(1)) {
            const ProbeTarget &target = targets[i];
            ProbeOutcome outcome;
            try {
                outcome = probe_.probe(target);
            } catch (const std::exception &e) {
                // Not a miss: carried out of the sweep once every worker is joined
                std::lock_guard<std::mutex> lock(fatal_mutex);
                if (!fatal) {
                    LOG_ERROR("[Scanner] Probe of " << target.ip << " failed: " << e.what());
                    fatal = std::current_exception();
                }
                continue;
            }

            if (!outcome.hit() || outcome.record->id.empty()) {
                misses[static_cast<size_t>(outcome.hit() ? MissReason::MISSING_ID : outcome.miss)].fetch_add(1);
                continue;
            }

            // The record always names the address that was actually probed
            outcome.record->ip = target.ip;

            std::lock_guard<std::mutex> lock(completed_mutex);
            completed.push_back(std::move(*outcome.record));
        }
    };

    size_t worker_count = targets.size();
    if (config_.max_parallel_probes > 0) {
        worker_count = std::min(worker_count, static_cast<size_t>(config_.max_parallel_probes));
    }

    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        try {
            workers.emplace_back(worker);
        } catch (const std::system_error &e) {
            // Workers share one index, so fewer threads still cover every target
            LOG_WARN("[Scanner] Thread limit reached after " << workers.size() << " workers: " << e.what());
            break;
        }
    }

    if (workers.empty()) {
        worker();
    }

    for (auto &t : workers) {
        t.join();
    }

    if (fatal) {
        std::rethrow_exception(fatal);
    }

    stats.hits = completed.size();
    for (size_t i = 0; i < kMissReasonCount; ++i) {
        stats.misses[i] = misses[i].load();
    }
    return completed;
}

SweepStats Scanner::last_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return last_stats_;
}

uint64_t Scanner::sweep_count() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return sweep_count_;
}

}  // namespace discovery
}  // namespace devscout
