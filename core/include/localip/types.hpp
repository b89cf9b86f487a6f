#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace localip {

// Address family of a NetworkAddress
enum class AddressFamily {
    IPV4,
    IPV6
};

std::string to_string(AddressFamily family);

// An IPv4 or IPv6 address. Octets are always stored in network order.
class NetworkAddress {
public:
    using V4Bytes = std::array<uint8_t, 4>;
    using V6Bytes = std::array<uint8_t, 16>;

    // Unspecified IPv4 address (0.0.0.0)
    NetworkAddress();

    explicit NetworkAddress(const V4Bytes& octets);
    explicit NetworkAddress(const V6Bytes& bytes);

    static NetworkAddress from_ipv4(uint8_t a, uint8_t b, uint8_t c, uint8_t d);

    // Builds an IPv4 address from an integer whose most significant byte is
    // the first octet (192.0.2.1 == 0xC0000201).
    static NetworkAddress from_host_order(uint32_t value);

    // Parses dotted-quad IPv4 or RFC 4291 IPv6 text.
    // Throws std::invalid_argument on malformed input.
    static NetworkAddress parse(const std::string& text);

    AddressFamily family() const;
    bool is_ipv4() const { return std::holds_alternative<V4Bytes>(bytes_); }
    bool is_ipv6() const { return std::holds_alternative<V6Bytes>(bytes_); }

    bool is_loopback() const;
    bool is_unspecified() const;

    // Only valid for IPv4 addresses, throws std::logic_error otherwise
    const V4Bytes& v4_bytes() const;
    uint32_t to_host_order() const;

    // Only valid for IPv6 addresses, throws std::logic_error otherwise
    const V6Bytes& v6_bytes() const;

    std::string to_string() const;

    bool operator==(const NetworkAddress& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const NetworkAddress& other) const { return !(*this == other); }

private:
    std::variant<V4Bytes, V6Bytes> bytes_;
};

std::ostream& operator<<(std::ostream& os, const NetworkAddress& address);

// One (interface, address) record of a query snapshot
struct InterfaceEntry {
    std::string name;
    NetworkAddress address;
    bool is_loopback = false;
    bool is_default_route = false;  // Only set by backends that read the routing table
};

// Result of a single decoder run
struct Snapshot {
    std::vector<InterfaceEntry> entries;  // Kernel enumeration order
    bool route_hints = false;             // is_default_route flags are meaningful
};

// (name, address) pairs as returned by list_interfaces()
using InterfaceList = std::vector<std::pair<std::string, NetworkAddress>>;

} // namespace localip
