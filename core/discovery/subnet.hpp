#pragma once

#include <array>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace devscout {
namespace discovery {

// First three octets of a local IPv4 address ("192.168.1")
struct SubnetPrefix {
    std::array<uint8_t, 3> octets{{0, 0, 0}};

    // Accepts "a.b.c" or a full "a.b.c.d" address (the host octet is dropped)
    static std::optional<SubnetPrefix> parse(const std::string &text);

    std::string to_string() const;
    std::string host(int suffix) const;
};

inline bool operator==(const SubnetPrefix &lhs, const SubnetPrefix &rhs) { return lhs.octets == rhs.octets; }

// Determines which /24 to sweep
class ISubnetSource {
public:
    virtual ~ISubnetSource() = default;

    // Returns false with a message when no usable IPv4 subnet exists
    virtual bool detect(SubnetPrefix &prefix, std::string &error) = 0;
    virtual std::string describe() const = 0;
};

// Fixed prefix from configuration
class StaticSubnetSource : public ISubnetSource {
public:
    explicit StaticSubnetSource(std::string prefix) : prefix_(std::move(prefix)) {}

    bool detect(SubnetPrefix &prefix, std::string &error) override;
    std::string describe() const override { return "static " + prefix_; }

private:
    std::string prefix_;
};

/**
 * @brief Subnet of the interface that carries the default route
 *
 * Reads the kernel routing table to find the default-route interface,
 * then takes that interface's IPv4 address. Without a default route the
 * first up, non-loopback IPv4 interface is used. A configured interface
 * name skips the routing table entirely.
 */
class RouteTableSubnetSource : public ISubnetSource {
public:
    explicit RouteTableSubnetSource(std::string interface_name = "",
                                    std::string route_table_path = "/proc/net/route");

    bool detect(SubnetPrefix &prefix, std::string &error) override;
    std::string describe() const override;

private:
    std::string interface_name_;
    std::string route_table_path_;
};

// Interface named by the first default (destination 0.0.0.0, mask 0) entry
// of a /proc/net/route style table
std::optional<std::string> parse_default_route_interface(std::istream &table);

// IPv4 address of an interface; the empty name selects the first up,
// non-loopback interface
std::optional<std::string> interface_ipv4_address(const std::string &interface_name);

}  // namespace discovery
}  // namespace devscout
