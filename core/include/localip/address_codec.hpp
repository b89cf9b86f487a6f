#pragma once

#include "localip/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace localip {

enum class Endian {
    LITTLE,
    BIG
};

// Byte order of the build target
constexpr Endian native_endian() {
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    return Endian::BIG;
#else
    return Endian::LITTLE;
#endif
}

constexpr uint32_t swap_bytes(uint32_t value) {
    return ((value & 0x000000FFu) << 24) |
           ((value & 0x0000FF00u) << 8) |
           ((value & 0x00FF0000u) >> 8) |
           ((value & 0xFF000000u) >> 24);
}

// Decodes the raw 32-bit s_addr word of a sockaddr_in as read into a native
// integer on a machine of the given byte order. The word holds the address in
// network order, so a little-endian reader sees it reversed.
NetworkAddress decode_ipv4_word(uint32_t raw, Endian target = native_endian());

// Inverse of decode_ipv4_word
uint32_t encode_ipv4_word(const NetworkAddress& address, Endian target = native_endian());

// 4 or 16 network-order bytes, as carried by netlink attributes and socket
// address structures. Any other length is a strategy failure.
NetworkAddress decode_address_bytes(const uint8_t* data, size_t length);

// Interface name from a kernel byte string. Exactly one trailing NUL is
// stripped; interior NUL bytes or invalid UTF-8 raise ErrorKind::INVALID_NAME.
std::string parse_interface_name(const uint8_t* data, size_t length);
std::string parse_interface_name(const std::string& bytes);

// NUL-terminated C string (getifaddrs ifa_name)
std::string parse_interface_name(const char* c_name);

// UTF-16 adapter names (Windows). Unpaired surrogates raise INVALID_NAME.
std::string decode_utf16_name(const char16_t* units, size_t length);
std::string decode_utf16_name(const char16_t* nul_terminated);

} // namespace localip
