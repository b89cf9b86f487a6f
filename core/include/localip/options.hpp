#pragma once

#include "localip/types.hpp"
#include <cstddef>
#include <string>

namespace localip {

// Tunables shared by all backends. Defaults work everywhere; a YAML file can
// override any subset of them:
//
//   ipv4_probe: 192.0.2.0
//   ipv6_probe: "2001:db8::"
//   netlink_receive_buffer: 32768
//   adapter_buffer_size: 15000
//   adapter_max_attempts: 3
//   include_down_interfaces: true
struct Options {
    // Route lookup destinations for the netlink backend. Nothing is sent to
    // them, they only need to be outside any directly connected network.
    NetworkAddress ipv4_probe = NetworkAddress::from_ipv4(192, 0, 2, 0);
    NetworkAddress ipv6_probe = NetworkAddress(NetworkAddress::V6Bytes{0x20, 0x01, 0x0d, 0xb8});

    size_t netlink_receive_buffer = 32768;

    // GetAdaptersAddresses buffer growth. The size must fit a ULONG and at
    // most 10 attempts are accepted from configuration.
    size_t adapter_buffer_size = 15000;
    int adapter_max_attempts = 3;

    bool include_down_interfaces = true;

    const NetworkAddress& probe_for(AddressFamily family) const {
        return family == AddressFamily::IPV4 ? ipv4_probe : ipv6_probe;
    }
};

// Throws std::invalid_argument on malformed YAML or out of range values
Options load_options(const std::string& yaml_text);
Options load_options_from_file(const std::string& file_path);

} // namespace localip
