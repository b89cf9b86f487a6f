#include "localip/selector.hpp"
#include "localip/error.hpp"
#include <glog/logging.h>

namespace localip {

std::optional<NetworkAddress> select_first_non_loopback(const std::vector<InterfaceEntry>& entries,
                                                        AddressFamily family) {
    for (const auto& entry : entries) {
        if (entry.is_loopback || entry.address.family() != family) {
            continue;
        }
        VLOG(1) << "Selected " << entry.address << " on interface " << entry.name;
        return entry.address;
    }
    return std::nullopt;
}

std::optional<NetworkAddress> select_default_route(const Snapshot& snapshot,
                                                   AddressFamily family) {
    if (!snapshot.route_hints) {
        VLOG(1) << "No routing table information, falling back to first non-loopback address";
        return select_first_non_loopback(snapshot.entries, family);
    }

    for (const auto& entry : snapshot.entries) {
        if (!entry.is_default_route || entry.address.family() != family) {
            continue;
        }
        VLOG(1) << "Selected " << entry.address << " on default route interface " << entry.name;
        return entry.address;
    }
    return std::nullopt;
}

NetworkAddress select_primary_address(Decoder& decoder, AddressFamily family) {
    std::optional<NetworkAddress> selected;

    switch (decoder.selection_policy()) {
        case SelectionPolicy::PREFERRED_SOURCE:
            selected = decoder.preferred_source(family);
            break;
        case SelectionPolicy::FIRST_NON_LOOPBACK:
            selected = select_first_non_loopback(decoder.decode().entries, family);
            break;
        case SelectionPolicy::DEFAULT_ROUTE:
            selected = select_default_route(decoder.decode(), family);
            break;
    }

    if (!selected) {
        LOG(WARNING) << "No " << to_string(family) << " address found using "
                     << decoder.strategy_name() << " (" << to_string(decoder.selection_policy()) << ")";
        throw Error::not_found();
    }

    return *selected;
}

} // namespace localip
