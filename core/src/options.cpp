#include "localip/options.hpp"
#include <yaml-cpp/yaml.h>
#include <glog/logging.h>
#include <cstdint>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <stdexcept>

namespace localip {

namespace {

NetworkAddress parse_probe(const YAML::Node& node, const std::string& key, AddressFamily family) {
    NetworkAddress address = NetworkAddress::parse(node.as<std::string>());
    if (address.family() != family) {
        throw std::invalid_argument(key + " must be an " + to_string(family) + " address, got " +
                                    address.to_string());
    }
    return address;
}

// Upper bound for adapter_max_attempts
constexpr long long MAX_ADAPTER_ATTEMPTS = 10;

template <typename T>
T parse_positive(const YAML::Node& node, const std::string& key,
                 unsigned long long limit = std::numeric_limits<T>::max()) {
    auto value = node.as<long long>();
    if (value <= 0) {
        throw std::invalid_argument(key + " must be positive, got " + std::to_string(value));
    }
    if (static_cast<unsigned long long>(value) > limit) {
        throw std::invalid_argument(key + " must be at most " + std::to_string(limit) +
                                    ", got " + std::to_string(value));
    }
    return static_cast<T>(value);
}

} // anonymous namespace

Options load_options(const std::string& yaml_text) {
    static const std::set<std::string> known_keys = {
        "ipv4_probe", "ipv6_probe", "netlink_receive_buffer",
        "adapter_buffer_size", "adapter_max_attempts", "include_down_interfaces"};

    Options options;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (!root || root.IsNull()) {
            return options;
        }
        if (!root.IsMap()) {
            throw std::invalid_argument("Options must be a YAML mapping");
        }

        for (auto it = root.begin(); it != root.end(); ++it) {
            std::string key = it->first.as<std::string>();
            if (known_keys.count(key) == 0) {
                LOG(WARNING) << "Ignoring unknown option '" << key << "'";
            }
        }

        if (root["ipv4_probe"]) {
            options.ipv4_probe = parse_probe(root["ipv4_probe"], "ipv4_probe", AddressFamily::IPV4);
        }
        if (root["ipv6_probe"]) {
            options.ipv6_probe = parse_probe(root["ipv6_probe"], "ipv6_probe", AddressFamily::IPV6);
        }
        if (root["netlink_receive_buffer"]) {
            options.netlink_receive_buffer =
                parse_positive<size_t>(root["netlink_receive_buffer"], "netlink_receive_buffer");
        }
        if (root["adapter_buffer_size"]) {
            options.adapter_buffer_size =
                parse_positive<size_t>(root["adapter_buffer_size"], "adapter_buffer_size",
                                   std::numeric_limits<uint32_t>::max());
        }
        if (root["adapter_max_attempts"]) {
            options.adapter_max_attempts =
                parse_positive<int>(root["adapter_max_attempts"], "adapter_max_attempts",
                                MAX_ADAPTER_ATTEMPTS);
        }
        if (root["include_down_interfaces"]) {
            options.include_down_interfaces = root["include_down_interfaces"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse options: " << e.what();
        throw std::invalid_argument("Invalid options YAML: " + std::string(e.what()));
    }

    return options;
}

Options load_options_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw std::invalid_argument("Failed to open file: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_options(buffer.str());
}

} // namespace localip
