#include <gtest/gtest.h>
#include <localip/options.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace localip;

TEST(OptionsTest, Defaults) {
    Options options;
    EXPECT_EQ(options.ipv4_probe.to_string(), "192.0.2.0");
    EXPECT_EQ(options.ipv6_probe.to_string(), "2001:db8::");
    EXPECT_EQ(options.netlink_receive_buffer, 32768u);
    EXPECT_EQ(options.adapter_buffer_size, 15000u);
    EXPECT_EQ(options.adapter_max_attempts, 3);
    EXPECT_TRUE(options.include_down_interfaces);
    EXPECT_EQ(options.probe_for(AddressFamily::IPV6), options.ipv6_probe);
}

TEST(OptionsTest, EmptyDocumentKeepsDefaults) {
    Options options = load_options("");
    EXPECT_EQ(options.adapter_max_attempts, 3);
    EXPECT_EQ(options.ipv4_probe.to_string(), "192.0.2.0");
}

TEST(OptionsTest, LoadsAllKeys) {
    Options options = load_options(R"(
ipv4_probe: 198.51.100.1
ipv6_probe: "2001:db8:1::1"
netlink_receive_buffer: 65536
adapter_buffer_size: 20000
adapter_max_attempts: 5
include_down_interfaces: false
)");

    EXPECT_EQ(options.ipv4_probe, NetworkAddress::from_ipv4(198, 51, 100, 1));
    EXPECT_EQ(options.ipv6_probe, NetworkAddress::parse("2001:db8:1::1"));
    EXPECT_EQ(options.netlink_receive_buffer, 65536u);
    EXPECT_EQ(options.adapter_buffer_size, 20000u);
    EXPECT_EQ(options.adapter_max_attempts, 5);
    EXPECT_FALSE(options.include_down_interfaces);
}

TEST(OptionsTest, UnknownKeysAreIgnored) {
    Options options = load_options("colour: blue\nadapter_max_attempts: 2\n");
    EXPECT_EQ(options.adapter_max_attempts, 2);
}

TEST(OptionsTest, RejectsProbeOfWrongFamily) {
    EXPECT_THROW(load_options("ipv4_probe: \"2001:db8::1\"\n"), std::invalid_argument);
    EXPECT_THROW(load_options("ipv6_probe: 192.0.2.1\n"), std::invalid_argument);
    EXPECT_THROW(load_options("ipv4_probe: nowhere\n"), std::invalid_argument);
}

TEST(OptionsTest, RejectsNonPositiveSizes) {
    EXPECT_THROW(load_options("adapter_max_attempts: 0\n"), std::invalid_argument);
    EXPECT_THROW(load_options("netlink_receive_buffer: -1\n"), std::invalid_argument);
}

TEST(OptionsTest, RejectsValuesOutOfRange) {
    // Would wrap to 0 when narrowed to int
    EXPECT_THROW(load_options("adapter_max_attempts: 4294967296\n"), std::invalid_argument);
    EXPECT_THROW(load_options("adapter_max_attempts: 2147483648\n"), std::invalid_argument);
    EXPECT_THROW(load_options("adapter_max_attempts: 11\n"), std::invalid_argument);
    EXPECT_THROW(load_options("adapter_buffer_size: 4294967296\n"), std::invalid_argument);
    EXPECT_THROW(load_options("netlink_receive_buffer: 99999999999999999999999\n"), std::invalid_argument);

    EXPECT_EQ(load_options("adapter_max_attempts: 10\n").adapter_max_attempts, 10);
    EXPECT_EQ(load_options("adapter_buffer_size: 4294967295\n").adapter_buffer_size, 4294967295u);
}

TEST(OptionsTest, RejectsMalformedYaml) {
    EXPECT_THROW(load_options("adapter_max_attempts: [1, 2\n"), std::invalid_argument);
    EXPECT_THROW(load_options("adapter_max_attempts: many\n"), std::invalid_argument);
    EXPECT_THROW(load_options("- just\n- a list\n"), std::invalid_argument);
}

TEST(OptionsTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "localip_options_test.yaml";
    {
        std::ofstream file(path);
        file << "adapter_buffer_size: 4096\n";
    }

    Options options = load_options_from_file(path);
    EXPECT_EQ(options.adapter_buffer_size, 4096u);
    std::remove(path.c_str());

    EXPECT_THROW(load_options_from_file(path), std::invalid_argument);
}
