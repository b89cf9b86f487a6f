#pragma once

// Main header file for the localip library

#include "localip/types.hpp"
#include "localip/error.hpp"
#include "localip/options.hpp"
#include "localip/decoder.hpp"
#include "localip/selector.hpp"
#include "localip/local_ip.hpp"

namespace localip {

// Version information
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace localip
