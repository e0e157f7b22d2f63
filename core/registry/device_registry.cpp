#include "device_registry.hpp"

#include <memory>
#include <mutex>

#include "logging/logger.hpp"

namespace devscout {
namespace registry {

DeviceRegistry::DeviceRegistry() : devices_(std::make_shared<const discovery::DeviceMap>()) {}

discovery::DeviceMapSnapshot DeviceRegistry::get_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_;
}

std::optional<discovery::DeviceRecord> DeviceRegistry::get(const std::string &id) const {
    auto snapshot = get_all();

    auto it = snapshot->find(id);
    if (it == snapshot->end()) {
        return std::nullopt;
    }
    return it->second;
}

void DeviceRegistry::replace(discovery::DeviceMap devices) {
    // Build the new snapshot before taking the lock
    auto next = std::make_shared<const discovery::DeviceMap>(std::move(devices));
    size_t count = next->size();

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        devices_ = std::move(next);
        ++generation_;
    }

    LOG_DEBUG("[Registry] Replaced content (" << count << " devices)");
}

bool DeviceRegistry::upsert(const discovery::DeviceRecord &record) {
    if (record.id.empty()) {
        LOG_WARN("[Registry] Rejected record without id (ip " << record.ip << ")");
        return false;
    }

    // Copy-on-write under the exclusive lock so concurrent upserts do not
    // drop each other's records
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto next = std::make_shared<discovery::DeviceMap>(*devices_);
    (*next)[record.id] = record;
    devices_ = std::move(next);
    ++generation_;
    return true;
}

size_t DeviceRegistry::device_count() const { return get_all()->size(); }

uint64_t DeviceRegistry::generation() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return generation_;
}

}  // namespace registry
}  // namespace devscout
