#pragma once

#include <stdexcept>
#include <string>

namespace localip {

enum class ErrorKind {
    NOT_FOUND,               // No address satisfied the selection rule
    STRATEGY_FAILURE,        // A kernel/OS call failed or returned malformed data
    PLATFORM_NOT_SUPPORTED,  // No backend for the requested OS
    INVALID_NAME             // An interface name is not valid text
};

std::string to_string(ErrorKind kind);

// Every failure of a query is reported as an Error. None of them are retried
// by the library.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, std::string detail);

    static Error not_found();
    static Error strategy_failure(const std::string& detail);
    static Error platform_not_supported(const std::string& os_name);
    static Error invalid_name(const std::string& detail);

    // Strategy failure built from an errno value, e.g. "socket(): Permission denied"
    static Error from_errno(const std::string& call, int error_number);

    ErrorKind kind() const noexcept { return kind_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ErrorKind kind_;
    std::string detail_;
};

} // namespace localip
