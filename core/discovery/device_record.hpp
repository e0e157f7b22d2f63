#pragma once

#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace devscout {
namespace discovery {

// A device that answered its identity endpoint
struct DeviceRecord {
    std::string id;               // Device-assigned identifier (registry key)
    std::string ip;               // Dotted IPv4 address that was probed
    nlohmann::json attributes;    // Identity body, passed through as received

    // Identity body with "id" and "ip" set to this record's values
    nlohmann::json to_json() const;
};

bool operator==(const DeviceRecord &lhs, const DeviceRecord &rhs);
inline bool operator!=(const DeviceRecord &lhs, const DeviceRecord &rhs) { return !(lhs == rhs); }

using DeviceMap = std::map<std::string, DeviceRecord>;
using DeviceMapSnapshot = std::shared_ptr<const DeviceMap>;

// id -> record object, the shape returned to HTTP and CLI callers
nlohmann::json encode_device_map(const DeviceMap &devices);

}  // namespace discovery
}  // namespace devscout
