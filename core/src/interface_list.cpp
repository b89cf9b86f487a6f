#include "localip/interface_list.hpp"

namespace localip {

InterfaceList to_interface_list(const std::vector<InterfaceEntry>& entries) {
    InterfaceList list;
    list.reserve(entries.size());
    for (const auto& entry : entries) {
        list.emplace_back(entry.name, entry.address);
    }
    return list;
}

std::vector<InterfaceEntry> filter_by_family(const std::vector<InterfaceEntry>& entries,
                                             AddressFamily family) {
    std::vector<InterfaceEntry> filtered;
    for (const auto& entry : entries) {
        if (entry.address.family() == family) {
            filtered.push_back(entry);
        }
    }
    return filtered;
}

} // namespace localip
