#include "subnet.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace devscout {
namespace discovery {

std::optional<SubnetPrefix> SubnetPrefix::parse(const std::string &text) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, '.')) {
        parts.push_back(part);
    }
    if (!text.empty() && text.back() == '.') {
        return std::nullopt;
    }
    if (parts.size() != 3 && parts.size() != 4) {
        return std::nullopt;
    }

    SubnetPrefix prefix;
    for (size_t i = 0; i < parts.size(); ++i) {
        const std::string &p = parts[i];
        if (p.empty() || p.size() > 3 || p.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        int value = std::stoi(p);
        if (value > 255) {
            return std::nullopt;
        }
        if (i < 3) {
            prefix.octets[i] = static_cast<uint8_t>(value);
        }
    }
    return prefix;
}

std::string SubnetPrefix::to_string() const {
    return std::to_string(octets[0]) + "." + std::to_string(octets[1]) + "." + std::to_string(octets[2]);
}

std::string SubnetPrefix::host(int suffix) const { return to_string() + "." + std::to_string(suffix); }

bool StaticSubnetSource::detect(SubnetPrefix &prefix, std::string &error) {
    auto parsed = SubnetPrefix::parse(prefix_);
    if (!parsed) {
        error = "Invalid static subnet prefix: '" + prefix_ + "'";
        return false;
    }
    prefix = *parsed;
    return true;
}

RouteTableSubnetSource::RouteTableSubnetSource(std::string interface_name, std::string route_table_path)
    : interface_name_(std::move(interface_name)), route_table_path_(std::move(route_table_path)) {}

std::string RouteTableSubnetSource::describe() const {
    if (!interface_name_.empty()) {
        return "interface " + interface_name_;
    }
    return "default route (" + route_table_path_ + ")";
}

bool RouteTableSubnetSource::detect(SubnetPrefix &prefix, std::string &error) {
    std::string interface_name = interface_name_;

    if (interface_name.empty()) {
        std::ifstream table(route_table_path_);
        if (table) {
            auto route_interface = parse_default_route_interface(table);
            if (route_interface) {
                interface_name = *route_interface;
                LOG_DEBUG("[Subnet] Default route via " << interface_name);
            } else {
                LOG_WARN("[Subnet] No default route in " << route_table_path_
                                                         << ", falling back to first active interface");
            }
        } else {
            LOG_WARN("[Subnet] Cannot read " << route_table_path_ << ", falling back to first active interface");
        }
    }

    auto address = interface_ipv4_address(interface_name);
    if (!address) {
        error = interface_name.empty() ? "No active non-loopback IPv4 interface found"
                                       : "No IPv4 address on interface '" + interface_name + "'";
        return false;
    }

    auto parsed = SubnetPrefix::parse(*address);
    if (!parsed) {
        error = "Unparseable local address: " + *address;
        return false;
    }

    LOG_INFO("[Subnet] Local address " << *address << " -> subnet " << parsed->to_string() << ".0/24");
    prefix = *parsed;
    return true;
}

std::optional<std::string> parse_default_route_interface(std::istream &table) {
    std::string line;

    // Header: Iface Destination Gateway Flags RefCnt Use Metric Mask ...
    if (!std::getline(table, line)) {
        return std::nullopt;
    }

    while (std::getline(table, line)) {
        std::istringstream fields(line);
        std::string iface, destination, gateway, flags, refcnt, use, metric, mask;
        if (!(fields >> iface >> destination >> gateway >> flags >> refcnt >> use >> metric >> mask)) {
            continue;
        }
        if (destination == "00000000" && mask == "00000000") {
            return iface;
        }
    }
    return std::nullopt;
}

std::optional<std::string> interface_ipv4_address(const std::string &interface_name) {
    struct ifaddrs *ifaddr = nullptr;
    if (getifaddrs(&ifaddr) != 0) {
        LOG_ERROR("[Subnet] getifaddrs failed: " << std::strerror(errno));
        return std::nullopt;
    }

    std::optional<std::string> result;
    for (auto *it = ifaddr; it != nullptr; it = it->ifa_next) {
        if (it->ifa_addr == nullptr || it->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (interface_name.empty()) {
            if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) {
                continue;
            }
        } else if (interface_name != it->ifa_name) {
            continue;
        }

        char buf[INET_ADDRSTRLEN] = {0};
        const auto *sin = reinterpret_cast<const sockaddr_in *>(it->ifa_addr);
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) == nullptr) {
            continue;
        }
        result = std::string(buf);
        break;
    }

    freeifaddrs(ifaddr);
    return result;
}

}  // namespace discovery
}  // namespace devscout
