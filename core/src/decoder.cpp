#include "localip/decoder.hpp"
#include "localip/error.hpp"
#include <glog/logging.h>
#include <set>

#if defined(_WIN32)
#include "adapters_decoder.hpp"
#else
#include "ifaddrs_decoder.hpp"
#endif

#if defined(__linux__) && !defined(__ANDROID__)
#include "netlink_decoder.hpp"
#endif

#if defined(__APPLE__)
#include <TargetConditionals.h>
#endif

namespace localip {

std::string to_string(SelectionPolicy policy) {
    switch (policy) {
        case SelectionPolicy::PREFERRED_SOURCE: return "preferred_source";
        case SelectionPolicy::FIRST_NON_LOOPBACK: return "first_non_loopback";
        case SelectionPolicy::DEFAULT_ROUTE: return "default_route";
    }
    return "unknown";
}

std::string current_platform() {
#if defined(_WIN32)
    return "windows";
#elif defined(__ANDROID__)
    return "android";
#elif defined(__linux__)
    return "linux";
#elif defined(__APPLE__) && TARGET_OS_IPHONE
    return "ios";
#elif defined(__APPLE__)
    return "macos";
#elif defined(__FreeBSD__)
    return "freebsd";
#elif defined(__OpenBSD__)
    return "openbsd";
#elif defined(__NetBSD__)
    return "netbsd";
#elif defined(__DragonFly__)
    return "dragonfly";
#else
    return "unknown";
#endif
}

std::unique_ptr<Decoder> Decoder::create(const Options& options) {
    return create_for(current_platform(), options);
}

std::unique_ptr<Decoder> Decoder::create_for(const std::string& platform_id, const Options& options) {
#if defined(__linux__) && !defined(__ANDROID__)
    if (platform_id == "linux") {
        return std::make_unique<NetlinkDecoder>(options);
    }
#endif

#if defined(_WIN32)
    if (platform_id == "windows") {
        return std::make_unique<AdaptersDecoder>(options);
    }
#else
    // getifaddrs family; the same walk works on every POSIX libc that has it
    static const std::set<std::string> getifaddrs_platforms = {
        "macos", "ios", "freebsd", "openbsd", "netbsd", "dragonfly", "android"};
    if (getifaddrs_platforms.count(platform_id) != 0) {
        return std::make_unique<IfAddrsDecoder>(options);
    }
#endif

    LOG(ERROR) << "No address decoder for platform '" << platform_id << "' in this build ("
               << current_platform() << ")";
    throw Error::platform_not_supported(platform_id);
}

} // namespace localip
