#include "localip/error.hpp"
#include <cstring>
#include <utility>

namespace localip {

namespace {

std::string make_message(ErrorKind kind, const std::string& detail) {
    switch (kind) {
        case ErrorKind::NOT_FOUND:
            return "The Local IP Address wasn't available in the network interfaces list/table";
        case ErrorKind::STRATEGY_FAILURE:
            return "An error occurred executing the underlying strategy error.\n" + detail;
        case ErrorKind::PLATFORM_NOT_SUPPORTED:
            return "The current platform: `" + detail + "`, is not supported";
        case ErrorKind::INVALID_NAME:
            return "Invalid interface name: " + detail;
    }
    return detail;
}

} // anonymous namespace

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "not_found";
        case ErrorKind::STRATEGY_FAILURE: return "strategy_failure";
        case ErrorKind::PLATFORM_NOT_SUPPORTED: return "platform_not_supported";
        case ErrorKind::INVALID_NAME: return "invalid_name";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, std::string detail)
    : std::runtime_error(make_message(kind, detail)),
      kind_(kind),
      detail_(std::move(detail)) {
}

Error Error::not_found() {
    return Error(ErrorKind::NOT_FOUND, "");
}

Error Error::strategy_failure(const std::string& detail) {
    return Error(ErrorKind::STRATEGY_FAILURE, detail);
}

Error Error::platform_not_supported(const std::string& os_name) {
    return Error(ErrorKind::PLATFORM_NOT_SUPPORTED, os_name);
}

Error Error::invalid_name(const std::string& detail) {
    return Error(ErrorKind::INVALID_NAME, detail);
}

Error Error::from_errno(const std::string& call, int error_number) {
    return strategy_failure(call + ": " + std::strerror(error_number));
}

} // namespace localip
