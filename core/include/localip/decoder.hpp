#pragma once

#include "localip/options.hpp"
#include "localip/types.hpp"
#include <memory>
#include <optional>
#include <string>

namespace localip {

// How the primary address is chosen for a given backend
enum class SelectionPolicy {
    PREFERRED_SOURCE,    // Kernel route lookup (netlink)
    FIRST_NON_LOOPBACK,  // First non-loopback entry (getifaddrs)
    DEFAULT_ROUTE        // First entry on a default-route interface (Windows)
};

std::string to_string(SelectionPolicy policy);

// OS identifier of the build target ("linux", "macos", "windows", ...)
std::string current_platform();

// Platform address decoder: turns the kernel's live network configuration
// into a Snapshot. Each call re-queries the kernel; nothing is cached and no
// state is shared between calls, so one instance per thread (or per call) is
// enough for concurrent use.
class Decoder {
public:
    virtual ~Decoder() = default;

    // Backend of the build target
    static std::unique_ptr<Decoder> create(const Options& options = {});

    // Backend for an explicit OS identifier. Backends are fixed when the
    // library is built, so the identifier only picks among the compiled-in
    // ones: on any POSIX build every getifaddrs identifier ("macos",
    // "freebsd", "android", ...) resolves to the local getifaddrs backend,
    // which on Linux means create_for("freebsd") queries the running Linux
    // kernel through getifaddrs instead of netlink. Throws
    // ErrorKind::PLATFORM_NOT_SUPPORTED carrying the identifier when it is
    // unknown or its backend is not part of this build.
    static std::unique_ptr<Decoder> create_for(const std::string& platform_id,
                                               const Options& options = {});

    virtual std::string strategy_name() const = 0;
    virtual SelectionPolicy selection_policy() const = 0;

    virtual Snapshot decode() = 0;

    // Kernel-computed source address towards an external destination.
    // Backends without a route lookup return std::nullopt.
    virtual std::optional<NetworkAddress> preferred_source(AddressFamily family) {
        (void)family;
        return std::nullopt;
    }
};

} // namespace localip
