#pragma once

#include "localip/types.hpp"
#include <vector>

namespace localip {

// Drops the loopback/default-route flags, keeping kernel order
InterfaceList to_interface_list(const std::vector<InterfaceEntry>& entries);

// Entries whose address belongs to `family`, in kernel order
std::vector<InterfaceEntry> filter_by_family(const std::vector<InterfaceEntry>& entries,
                                             AddressFamily family);

} // namespace localip
