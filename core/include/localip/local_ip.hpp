#pragma once

#include "localip/options.hpp"
#include "localip/types.hpp"
#include <string>
#include <vector>

namespace localip {

// Primary address of this machine for the given family
NetworkAddress get_local_ip(AddressFamily family = AddressFamily::IPV4,
                            const Options& options = {});

NetworkAddress get_local_ipv6(const Options& options = {});

// All IPv4 and IPv6 addresses, loopback included, in kernel order
InterfaceList list_interfaces(const Options& options = {});

// Same as list_interfaces() but keeps the loopback/default-route flags
std::vector<InterfaceEntry> list_interface_entries(const Options& options = {});

// Variants bound to an explicit OS identifier (see Decoder::create_for).
// They always query the host they run on: on Linux, "freebsd" or "macos"
// select the getifaddrs backend rather than netlink, and "windows" throws
// ErrorKind::PLATFORM_NOT_SUPPORTED.
NetworkAddress get_local_ip_for_platform(const std::string& platform_id,
                                         AddressFamily family = AddressFamily::IPV4,
                                         const Options& options = {});

InterfaceList list_interfaces_for_platform(const std::string& platform_id,
                                           const Options& options = {});

} // namespace localip
