#include "device_record.hpp"

namespace devscout {
namespace discovery {

nlohmann::json DeviceRecord::to_json() const {
    nlohmann::json result = attributes.is_object() ? attributes : nlohmann::json::object();
    result["id"] = id;
    result["ip"] = ip;
    return result;
}

bool operator==(const DeviceRecord &lhs, const DeviceRecord &rhs) {
    return lhs.id == rhs.id && lhs.ip == rhs.ip && lhs.attributes == rhs.attributes;
}

nlohmann::json encode_device_map(const DeviceMap &devices) {
    nlohmann::json result = nlohmann::json::object();
    for (const auto &entry : devices) {
        result[entry.first] = entry.second.to_json();
    }
    return result;
}

}  // namespace discovery
}  // namespace devscout
