#pragma once

#include "localip/decoder.hpp"
#include "localip/types.hpp"
#include <optional>
#include <vector>

namespace localip {

// First non-loopback entry of the requested family
std::optional<NetworkAddress> select_first_non_loopback(const std::vector<InterfaceEntry>& entries,
                                                        AddressFamily family);

// First entry of the requested family on a default-route interface. Without
// route hints this is the same as select_first_non_loopback().
std::optional<NetworkAddress> select_default_route(const Snapshot& snapshot,
                                                   AddressFamily family);

// Applies decoder.selection_policy(). Throws ErrorKind::NOT_FOUND when no
// address qualifies.
NetworkAddress select_primary_address(Decoder& decoder, AddressFamily family);

} // namespace localip
