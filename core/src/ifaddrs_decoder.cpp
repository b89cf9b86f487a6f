#include "ifaddrs_decoder.hpp"
#include <localip/address_codec.hpp>
#include <localip/error.hpp>
#include <glog/logging.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <utility>

namespace localip {

IfAddrsApi IfAddrsApi::system() {
    IfAddrsApi api;
    api.acquire = [](ifaddrs** list) { return ::getifaddrs(list); };
    api.release = [](ifaddrs* list) { ::freeifaddrs(list); };
    return api;
}

IfAddrsList::IfAddrsList(const IfAddrsApi& api)
    : api_(api) {
    if (api_.acquire(&head_) != 0) {
        int saved_errno = errno;
        head_ = nullptr;
        LOG(ERROR) << "Failed to get network interfaces: " << strerror(saved_errno);
        throw Error::from_errno("getifaddrs", saved_errno);
    }
}

IfAddrsList::~IfAddrsList() {
    if (head_ != nullptr) {
        api_.release(head_);
    }
}

IfAddrsDecoder::IfAddrsDecoder(const Options& options, IfAddrsApi api)
    : options_(options), api_(std::move(api)) {
}

Snapshot IfAddrsDecoder::decode() {
    Snapshot snapshot;
    IfAddrsList list(api_);

    for (const ifaddrs* ifa = list.head(); ifa != nullptr; ifa = ifa->ifa_next) {
        // Tunnels and some virtual interfaces carry no address
        if (ifa->ifa_addr == nullptr) {
            continue;
        }

        if (!options_.include_down_interfaces && !(ifa->ifa_flags & IFF_UP)) {
            continue;
        }

        InterfaceEntry entry;
        switch (ifa->ifa_addr->sa_family) {
            case AF_INET: {
                const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
                uint32_t raw;
                std::memcpy(&raw, &sin->sin_addr.s_addr, sizeof(raw));
                entry.address = decode_ipv4_word(raw);
                break;
            }
            case AF_INET6: {
                const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(ifa->ifa_addr);
                entry.address = decode_address_bytes(sin6->sin6_addr.s6_addr, 16);
                break;
            }
            default:
                continue;
        }

        entry.name = parse_interface_name(ifa->ifa_name);
        entry.is_loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;

        VLOG(2) << "getifaddrs: " << entry.name << " " << entry.address
                << (entry.is_loopback ? " (loopback)" : "");
        snapshot.entries.push_back(std::move(entry));
    }

    VLOG(1) << "getifaddrs returned " << snapshot.entries.size() << " addresses";
    return snapshot;
}

} // namespace localip
