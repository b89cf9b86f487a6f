#include <localip/localip.hpp>
#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using json = nlohmann::json;

namespace {

struct ToolArguments {
    bool want_ipv4 = true;
    bool want_ipv6 = true;
    bool as_json = false;
    std::optional<std::string> config_file;
    std::optional<std::string> platform;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --family=FAMILY       ipv4, ipv6 or all (default: all)\n"
              << "  --json                Print a JSON document instead of text\n"
              << "  --config=FILE         YAML options file\n"
              << "  --platform=ID         Use the decoder for ID instead of this build's platform\n"
              << "  --help, -h            Show this help message\n";
}

json error_to_json(const localip::Error& e) {
    return json{{"kind", localip::to_string(e.kind())}, {"message", e.what()}};
}

class Tool {
public:
    Tool(const ToolArguments& args, const localip::Options& options)
        : args_(args), options_(options) {
    }

    int run() {
        if (args_.want_ipv4) {
            query_primary(localip::AddressFamily::IPV4, "local_ipv4", "Local IPv4");
        }
        if (args_.want_ipv6) {
            query_primary(localip::AddressFamily::IPV6, "local_ipv6", "Local IPv6");
        }
        query_interfaces();

        if (args_.as_json) {
            std::cout << document_.dump(2) << std::endl;
        }
        return failed_ ? 1 : 0;
    }

private:
    void query_primary(localip::AddressFamily family, const std::string& key, const std::string& label) {
        try {
            localip::NetworkAddress address = args_.platform
                ? localip::get_local_ip_for_platform(*args_.platform, family, options_)
                : localip::get_local_ip(family, options_);
            document_[key] = address.to_string();
            if (!args_.as_json) {
                std::cout << label << ": " << address << std::endl;
            }
        } catch (const localip::Error& e) {
            failed_ = true;
            document_[key] = json{{"error", error_to_json(e)}};
            if (!args_.as_json) {
                std::cout << "Failed to get " << label << ": " << e.what() << std::endl;
            }
        }
    }

    void query_interfaces() {
        try {
            localip::InterfaceList interfaces = args_.platform
                ? localip::list_interfaces_for_platform(*args_.platform, options_)
                : localip::list_interfaces(options_);

            json entries = json::array();
            for (const auto& [name, address] : interfaces) {
                if (!wanted(address.family())) {
                    continue;
                }
                entries.push_back(json{{"name", name},
                                       {"address", address.to_string()},
                                       {"family", localip::to_string(address.family())}});
            }
            document_["interfaces"] = entries;

            if (!args_.as_json) {
                std::cout << "Got " << entries.size() << " interfaces" << std::endl;
                for (const auto& entry : entries) {
                    std::cout << "IF: " << entry["name"].get<std::string>()
                              << ", IP: " << entry["address"].get<std::string>() << std::endl;
                }
            }
        } catch (const localip::Error& e) {
            failed_ = true;
            document_["interfaces"] = json{{"error", error_to_json(e)}};
            if (!args_.as_json) {
                std::cout << "Failed to get list of network interfaces: " << e.what() << std::endl;
            }
        }
    }

    bool wanted(localip::AddressFamily family) const {
        return family == localip::AddressFamily::IPV4 ? args_.want_ipv4 : args_.want_ipv6;
    }

    ToolArguments args_;
    localip::Options options_;
    json document_ = json::object();
    bool failed_ = false;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Initialize Google logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = true;

    // Parse command line arguments
    ToolArguments args;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg.find("--family=") == 0) {
            std::string family = arg.substr(9);
            if (family == "ipv4") {
                args.want_ipv6 = false;
            } else if (family == "ipv6") {
                args.want_ipv4 = false;
            } else if (family != "all") {
                std::cerr << "Unknown family: " << family << std::endl;
                return 2;
            }
        } else if (arg == "--json") {
            args.as_json = true;
        } else if (arg.find("--config=") == 0) {
            args.config_file = arg.substr(9);
        } else if (arg.find("--platform=") == 0) {
            args.platform = arg.substr(11);
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 2;
        }
    }

    localip::Options options;
    if (args.config_file) {
        try {
            options = localip::load_options_from_file(*args.config_file);
        } catch (const std::invalid_argument& e) {
            LOG(ERROR) << "Failed to load options: " << e.what();
            std::cerr << e.what() << std::endl;
            return 2;
        }
    }

    LOG(INFO) << "localip " << localip::VERSION << " on " << localip::current_platform();
    return Tool(args, options).run();
}
