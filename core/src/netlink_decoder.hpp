#pragma once

#include "netlink_protocol.hpp"
#include <localip/decoder.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace localip {

// Linux backend speaking rtnetlink. The primary address is the kernel's
// preferred source towards a probe destination; enumeration joins an address
// dump with a link dump.
class NetlinkDecoder : public Decoder {
public:
    using TransportFactory = std::function<std::unique_ptr<netlink::Transport>()>;

    explicit NetlinkDecoder(const Options& options);
    NetlinkDecoder(const Options& options, TransportFactory transport_factory);
    ~NetlinkDecoder() override = default;

    std::string strategy_name() const override { return "netlink"; }
    SelectionPolicy selection_policy() const override { return SelectionPolicy::PREFERRED_SOURCE; }

    Snapshot decode() override;
    std::optional<NetworkAddress> preferred_source(AddressFamily family) override;

private:
    struct Link {
        std::string name;
        uint32_t flags = 0;
    };

    std::map<int32_t, Link> dump_links(netlink::Transport& transport);
    std::optional<NetworkAddress> lookup_route(netlink::Transport& transport, AddressFamily family);
    std::optional<NetworkAddress> first_universe_address(netlink::Transport& transport,
                                                         AddressFamily family);

    uint32_t next_sequence() { return ++sequence_; }

    Options options_;
    TransportFactory transport_factory_;
    uint32_t sequence_ = 0;
};

} // namespace localip
