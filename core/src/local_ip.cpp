#include "localip/local_ip.hpp"
#include "localip/decoder.hpp"
#include "localip/interface_list.hpp"
#include "localip/selector.hpp"
#include <glog/logging.h>

namespace localip {

namespace {

NetworkAddress primary_address(Decoder& decoder, AddressFamily family) {
    NetworkAddress address = select_primary_address(decoder, family);
    LOG(INFO) << "Primary " << to_string(family) << " address: " << address
              << " (" << decoder.strategy_name() << ")";
    return address;
}

} // anonymous namespace

NetworkAddress get_local_ip(AddressFamily family, const Options& options) {
    auto decoder = Decoder::create(options);
    return primary_address(*decoder, family);
}

NetworkAddress get_local_ipv6(const Options& options) {
    return get_local_ip(AddressFamily::IPV6, options);
}

InterfaceList list_interfaces(const Options& options) {
    return to_interface_list(list_interface_entries(options));
}

std::vector<InterfaceEntry> list_interface_entries(const Options& options) {
    auto decoder = Decoder::create(options);
    return decoder->decode().entries;
}

NetworkAddress get_local_ip_for_platform(const std::string& platform_id,
                                         AddressFamily family,
                                         const Options& options) {
    auto decoder = Decoder::create_for(platform_id, options);
    return primary_address(*decoder, family);
}

InterfaceList list_interfaces_for_platform(const std::string& platform_id, const Options& options) {
    auto decoder = Decoder::create_for(platform_id, options);
    return to_interface_list(decoder->decode().entries);
}

} // namespace localip
