// Windows headers must precede glog
#include <winsock2.h>
#include <ws2tcpip.h>
#include <iphlpapi.h>
#include <netioapi.h>
#include <windows.h>

#include "adapters_decoder.hpp"
#include "owned_buffer.hpp"
#include <localip/address_codec.hpp>
#include <localip/error.hpp>
#include <glog/logging.h>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace localip {

namespace {

std::string system_message(DWORD code) {
    char* text = nullptr;
    DWORD length = FormatMessageA(
        FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr, code, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
        reinterpret_cast<LPSTR>(&text), 0, nullptr);

    std::string message = "error " + std::to_string(code);
    if (length != 0 && text != nullptr) {
        std::string system_text(text, length);
        while (!system_text.empty() && (system_text.back() == '\n' || system_text.back() == '\r')) {
            system_text.pop_back();
        }
        message += ": " + system_text;
    }
    if (text != nullptr) {
        LocalFree(text);
    }
    return message;
}

struct MibTableDeleter {
    void operator()(MIB_IPFORWARD_TABLE2* table) const {
        FreeMibTable(table);
    }
};

struct DefaultRoutes {
    std::set<NET_IFINDEX> ipv4;
    std::set<NET_IFINDEX> ipv6;
};

// Interfaces carrying a 0.0.0.0/0 or ::/0 route. std::nullopt when the
// routing table cannot be read.
std::optional<DefaultRoutes> read_default_routes() {
    MIB_IPFORWARD_TABLE2* raw_table = nullptr;
    DWORD status = GetIpForwardTable2(AF_UNSPEC, &raw_table);
    if (status != NO_ERROR) {
        LOG(WARNING) << "GetIpForwardTable2 failed, no default route information: "
                     << system_message(status);
        return std::nullopt;
    }
    std::unique_ptr<MIB_IPFORWARD_TABLE2, MibTableDeleter> table(raw_table);

    DefaultRoutes routes;
    for (ULONG i = 0; i < table->NumEntries; ++i) {
        const MIB_IPFORWARD_ROW2& row = table->Table[i];
        if (row.DestinationPrefix.PrefixLength != 0) {
            continue;
        }
        if (row.DestinationPrefix.Prefix.si_family == AF_INET) {
            routes.ipv4.insert(row.InterfaceIndex);
        } else if (row.DestinationPrefix.Prefix.si_family == AF_INET6) {
            routes.ipv6.insert(row.InterfaceIndex);
        }
    }

    VLOG(1) << "Default routes on " << routes.ipv4.size() << " IPv4 and "
            << routes.ipv6.size() << " IPv6 interfaces";
    return routes;
}

} // anonymous namespace

AdaptersDecoder::AdaptersDecoder(const Options& options)
    : options_(options) {
}

Snapshot AdaptersDecoder::decode() {
    const ULONG flags = GAA_FLAG_SKIP_ANYCAST | GAA_FLAG_SKIP_MULTICAST | GAA_FLAG_SKIP_DNS_SERVER;
    bool no_adapters = false;

    OwnedBuffer buffer = fill_with_growth(
        options_.adapter_buffer_size, options_.adapter_max_attempts,
        [&](OwnedBuffer& candidate, size_t& required_size) {
            ULONG size = static_cast<ULONG>(candidate.size());
            ULONG status = GetAdaptersAddresses(AF_UNSPEC, flags, nullptr,
                                                candidate.as<IP_ADAPTER_ADDRESSES>(), &size);
            if (status == ERROR_BUFFER_OVERFLOW) {
                required_size = size;
                return FillStatus::TOO_SMALL;
            }
            if (status == ERROR_NO_DATA) {
                no_adapters = true;
                return FillStatus::DONE;
            }
            if (status != NO_ERROR) {
                LOG(ERROR) << "GetAdaptersAddresses failed: " << system_message(status);
                throw Error::strategy_failure("Failed to get adapter addresses. " + system_message(status));
            }
            return FillStatus::DONE;
        });

    Snapshot snapshot;
    if (no_adapters) {
        LOG(WARNING) << "GetAdaptersAddresses reported no adapters";
        return snapshot;
    }

    const auto routes = read_default_routes();
    snapshot.route_hints = routes.has_value();

    for (const IP_ADAPTER_ADDRESSES* adapter = buffer.as<IP_ADAPTER_ADDRESSES>();
         adapter != nullptr; adapter = adapter->Next) {
        if (!options_.include_down_interfaces && adapter->OperStatus != IfOperStatusUp) {
            continue;
        }

        static_assert(sizeof(wchar_t) == sizeof(char16_t), "UTF-16 wchar_t expected");
        const std::string name = decode_utf16_name(reinterpret_cast<const char16_t*>(adapter->FriendlyName));
        const bool loopback = adapter->IfType == IF_TYPE_SOFTWARE_LOOPBACK;

        for (const IP_ADAPTER_UNICAST_ADDRESS* unicast = adapter->FirstUnicastAddress;
             unicast != nullptr; unicast = unicast->Next) {
            const SOCKADDR* socket_address = unicast->Address.lpSockaddr;
            if (socket_address == nullptr) {
                continue;
            }

            InterfaceEntry entry;
            entry.name = name;
            entry.is_loopback = loopback;

            if (socket_address->sa_family == AF_INET) {
                // in_addr bytes are already laid out in address order
                const auto* sin = reinterpret_cast<const SOCKADDR_IN*>(socket_address);
                const auto& b = sin->sin_addr.S_un.S_un_b;
                entry.address = NetworkAddress::from_ipv4(b.s_b1, b.s_b2, b.s_b3, b.s_b4);
                entry.is_default_route = routes && routes->ipv4.count(adapter->IfIndex) != 0;
            } else if (socket_address->sa_family == AF_INET6) {
                const auto* sin6 = reinterpret_cast<const SOCKADDR_IN6*>(socket_address);
                entry.address = decode_address_bytes(sin6->sin6_addr.u.Byte, 16);
                entry.is_default_route = routes && routes->ipv6.count(adapter->Ipv6IfIndex) != 0;
            } else {
                continue;
            }

            VLOG(2) << "adapter: " << entry.name << " " << entry.address
                    << (entry.is_loopback ? " (loopback)" : "")
                    << (entry.is_default_route ? " (default route)" : "");
            snapshot.entries.push_back(std::move(entry));
        }
    }

    VLOG(1) << "GetAdaptersAddresses returned " << snapshot.entries.size() << " addresses";
    return snapshot;
}

} // namespace localip
