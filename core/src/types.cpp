#include "localip/types.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#endif

namespace localip {

std::string to_string(AddressFamily family) {
    switch (family) {
        case AddressFamily::IPV4: return "ipv4";
        case AddressFamily::IPV6: return "ipv6";
    }
    return "unknown";
}

NetworkAddress::NetworkAddress()
    : bytes_(V4Bytes{0, 0, 0, 0}) {
}

NetworkAddress::NetworkAddress(const V4Bytes& octets)
    : bytes_(octets) {
}

NetworkAddress::NetworkAddress(const V6Bytes& bytes)
    : bytes_(bytes) {
}

NetworkAddress NetworkAddress::from_ipv4(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
    return NetworkAddress(V4Bytes{a, b, c, d});
}

NetworkAddress NetworkAddress::from_host_order(uint32_t value) {
    return NetworkAddress(V4Bytes{
        static_cast<uint8_t>(value >> 24),
        static_cast<uint8_t>(value >> 16),
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value)});
}

NetworkAddress NetworkAddress::parse(const std::string& text) {
    V4Bytes v4{};
    if (inet_pton(AF_INET, text.c_str(), v4.data()) == 1) {
        return NetworkAddress(v4);
    }

    V6Bytes v6{};
    if (inet_pton(AF_INET6, text.c_str(), v6.data()) == 1) {
        return NetworkAddress(v6);
    }

    throw std::invalid_argument("Invalid IP address: '" + text + "'");
}

AddressFamily NetworkAddress::family() const {
    return is_ipv4() ? AddressFamily::IPV4 : AddressFamily::IPV6;
}

bool NetworkAddress::is_loopback() const {
    if (is_ipv4()) {
        return v4_bytes()[0] == 127;
    }
    const auto& bytes = v6_bytes();
    return std::all_of(bytes.begin(), bytes.end() - 1, [](uint8_t b) { return b == 0; }) &&
           bytes[15] == 1;
}

bool NetworkAddress::is_unspecified() const {
    return std::visit([](const auto& bytes) {
        return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    }, bytes_);
}

const NetworkAddress::V4Bytes& NetworkAddress::v4_bytes() const {
    if (!is_ipv4()) {
        throw std::logic_error("Not an IPv4 address: " + to_string());
    }
    return std::get<V4Bytes>(bytes_);
}

uint32_t NetworkAddress::to_host_order() const {
    const auto& octets = v4_bytes();
    return (static_cast<uint32_t>(octets[0]) << 24) |
           (static_cast<uint32_t>(octets[1]) << 16) |
           (static_cast<uint32_t>(octets[2]) << 8) |
           static_cast<uint32_t>(octets[3]);
}

const NetworkAddress::V6Bytes& NetworkAddress::v6_bytes() const {
    if (!is_ipv6()) {
        throw std::logic_error("Not an IPv6 address: " + to_string());
    }
    return std::get<V6Bytes>(bytes_);
}

std::string NetworkAddress::to_string() const {
    char buffer[INET6_ADDRSTRLEN];
    const char* result = nullptr;

    if (is_ipv4()) {
        result = inet_ntop(AF_INET, std::get<V4Bytes>(bytes_).data(), buffer, sizeof(buffer));
    } else {
        result = inet_ntop(AF_INET6, std::get<V6Bytes>(bytes_).data(), buffer, sizeof(buffer));
    }

    return result != nullptr ? std::string(result) : std::string();
}

std::ostream& operator<<(std::ostream& os, const NetworkAddress& address) {
    return os << address.to_string();
}

} // namespace localip
