#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>

#include "discovery/device_record.hpp"

namespace devscout {
namespace registry {

/**
 * @brief Device Registry - id -> last successful DeviceRecord
 *
 * Thread Safety:
 * - Content is held as an immutable snapshot (shared_ptr<const DeviceMap>)
 * - Readers copy the snapshot pointer under a shared_lock and never see
 *   a half-applied change
 * - replace() publishes a complete map in one pointer swap
 * - upsert() copies the current map, applies one record and swaps
 *
 * get_all() returns the snapshot itself; holders keep it alive after
 * later swaps, so no copy of the map is needed for listing.
 */
class DeviceRegistry {
public:
    DeviceRegistry();

    discovery::DeviceMapSnapshot get_all() const;
    std::optional<discovery::DeviceRecord> get(const std::string &id) const;

    // Swap in a full sweep result
    void replace(discovery::DeviceMap devices);

    // Insert or overwrite one record without disturbing the others.
    // Records with an empty id are rejected.
    bool upsert(const discovery::DeviceRecord &record);

    size_t device_count() const;

    // Incremented on every successful replace/upsert
    uint64_t generation() const;

private:
    discovery::DeviceMapSnapshot devices_;
    uint64_t generation_ = 0;

    mutable std::shared_mutex mutex_;
};

}  // namespace registry
}  // namespace devscout
