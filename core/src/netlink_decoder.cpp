#include "netlink_decoder.hpp"
#include "netlink_socket.hpp"
#include <localip/address_codec.hpp>
#include <localip/error.hpp>
#include <glog/logging.h>
#include <net/if.h>
#include <sys/socket.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <utility>

namespace localip {

namespace {

uint8_t family_code(AddressFamily family) {
    return family == AddressFamily::IPV4 ? AF_INET : AF_INET6;
}

} // anonymous namespace

NetlinkDecoder::NetlinkDecoder(const Options& options)
    : NetlinkDecoder(options, [size = options.netlink_receive_buffer]() {
          return std::unique_ptr<netlink::Transport>(std::make_unique<netlink::Socket>(size));
      }) {
}

NetlinkDecoder::NetlinkDecoder(const Options& options, TransportFactory transport_factory)
    : options_(options), transport_factory_(std::move(transport_factory)) {
}

Snapshot NetlinkDecoder::decode() {
    auto transport = transport_factory_();
    const auto links = dump_links(*transport);

    Snapshot snapshot;
    netlink::Exchange exchange(*transport, netlink::Exchange::Kind::DUMP, RTM_NEWADDR);
    const uint32_t sequence = next_sequence();

    exchange.run(netlink::build_dump_request(RTM_GETADDR, sequence, AF_UNSPEC), sequence,
                 [&](const netlink::Message& message) {
        auto record = netlink::parse_address_message(message);
        if (record.family != AF_INET && record.family != AF_INET6) {
            throw Error::strategy_failure("Netlink payload has unsupported family: " +
                                          std::to_string(record.family));
        }

        std::optional<NetworkAddress> local;
        std::optional<NetworkAddress> address;
        std::optional<std::string> label;

        for (const auto& attribute : record.attributes) {
            switch (attribute.type) {
                case IFA_LABEL:
                    label = parse_interface_name(attribute.data, attribute.length);
                    break;
                case IFA_LOCAL:
                    local = netlink::attribute_address(attribute, record.family);
                    break;
                case IFA_ADDRESS:
                    address = netlink::attribute_address(attribute, record.family);
                    break;
                default:
                    break;
            }
        }

        // IFA_LOCAL is the assigned address; on point-to-point links
        // IFA_ADDRESS is the peer.
        const auto& chosen = local ? local : address;
        if (!chosen) {
            VLOG(2) << "Address record for index " << record.index << " carries no address";
            return;
        }

        auto link = links.find(static_cast<int32_t>(record.index));
        InterfaceEntry entry;
        entry.address = *chosen;

        if (label) {
            entry.name = *label;
        } else if (link != links.end()) {
            entry.name = link->second.name;
        } else {
            LOG(WARNING) << "Skipping " << entry.address << ": no interface with index " << record.index;
            return;
        }

        if (link != links.end()) {
            entry.is_loopback = (link->second.flags & IFF_LOOPBACK) != 0;
            if (!options_.include_down_interfaces && !(link->second.flags & IFF_UP)) {
                VLOG(2) << "Skipping " << entry.address << " on down interface " << entry.name;
                return;
            }
        }

        VLOG(2) << "netlink: " << entry.name << " " << entry.address
                << (entry.is_loopback ? " (loopback)" : "");
        snapshot.entries.push_back(std::move(entry));
    });

    VLOG(1) << "netlink returned " << snapshot.entries.size() << " addresses on "
            << links.size() << " links";
    return snapshot;
}

std::optional<NetworkAddress> NetlinkDecoder::preferred_source(AddressFamily family) {
    auto transport = transport_factory_();

    auto address = lookup_route(*transport, family);
    if (address) {
        LOG(INFO) << "Preferred " << to_string(family) << " source address: " << *address;
        return address;
    }

    VLOG(1) << "Route lookup returned no preferred source, scanning " << to_string(family) << " addresses";
    return first_universe_address(*transport, family);
}

std::map<int32_t, NetlinkDecoder::Link> NetlinkDecoder::dump_links(netlink::Transport& transport) {
    std::map<int32_t, Link> links;
    netlink::Exchange exchange(transport, netlink::Exchange::Kind::DUMP, RTM_NEWLINK);
    const uint32_t sequence = next_sequence();

    exchange.run(netlink::build_dump_request(RTM_GETLINK, sequence, AF_UNSPEC), sequence,
                 [&](const netlink::Message& message) {
        auto record = netlink::parse_link_message(message);
        for (const auto& attribute : record.attributes) {
            if (attribute.type == IFLA_IFNAME) {
                links[record.index] = Link{parse_interface_name(attribute.data, attribute.length),
                                           record.flags};
                break;
            }
        }
    });

    return links;
}

std::optional<NetworkAddress> NetlinkDecoder::lookup_route(netlink::Transport& transport,
                                                           AddressFamily family) {
    const NetworkAddress& probe = options_.probe_for(family);
    if (probe.family() != family) {
        throw Error::strategy_failure("Probe destination " + probe.to_string() +
                                      " does not belong to family " + to_string(family));
    }

    std::optional<NetworkAddress> source;
    netlink::Exchange exchange(transport, netlink::Exchange::Kind::ROUTE_LOOKUP, RTM_NEWROUTE);
    const uint32_t sequence = next_sequence();

    exchange.run(netlink::build_route_request(sequence, probe), sequence,
                 [&](const netlink::Message& message) {
        auto route = netlink::parse_route_message(message);
        if (route.scope != RT_SCOPE_UNIVERSE) {
            VLOG(1) << "Ignoring route with scope " << static_cast<int>(route.scope);
            return;
        }
        if (route.family != family_code(family)) {
            throw Error::strategy_failure("Invalid address family in Netlink payload: " +
                                          std::to_string(route.family));
        }

        for (const auto& attribute : route.attributes) {
            if (attribute.type == RTA_PREFSRC) {
                source = netlink::attribute_address(attribute, route.family);
                break;
            }
        }
    });

    return source;
}

std::optional<NetworkAddress> NetlinkDecoder::first_universe_address(netlink::Transport& transport,
                                                                     AddressFamily family) {
    std::optional<NetworkAddress> found;
    netlink::Exchange exchange(transport, netlink::Exchange::Kind::DUMP, RTM_NEWADDR);
    const uint32_t sequence = next_sequence();

    exchange.run(netlink::build_dump_request(RTM_GETADDR, sequence, family_code(family)), sequence,
                 [&](const netlink::Message& message) {
        // The dump has to be drained even after a match
        if (found) {
            return;
        }

        auto record = netlink::parse_address_message(message);
        if (record.scope != RT_SCOPE_UNIVERSE) {
            return;
        }
        if (record.family != family_code(family)) {
            throw Error::strategy_failure("Invalid family in Netlink payload: " +
                                          std::to_string(record.family));
        }

        std::optional<NetworkAddress> address;
        for (const auto& attribute : record.attributes) {
            if (attribute.type == IFA_LOCAL) {
                found = netlink::attribute_address(attribute, record.family);
                return;
            }
            if (attribute.type == IFA_ADDRESS && !address) {
                address = netlink::attribute_address(attribute, record.family);
            }
        }
        found = address;
    });

    return found;
}

} // namespace localip
