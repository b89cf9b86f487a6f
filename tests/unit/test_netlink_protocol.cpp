#include <gtest/gtest.h>
#include "netlink_protocol.hpp"
#include "netlink_test_util.hpp"
#include <localip/error.hpp>
#include <cerrno>

using namespace localip;
using namespace localip::test_util;

namespace {

ErrorKind kind_of(const std::function<void()>& action) {
    try {
        action();
    } catch (const Error& e) {
        return e.kind();
    }
    ADD_FAILURE() << "Expected localip::Error";
    return ErrorKind::NOT_FOUND;
}

// Transport that replays a fixed list of datagrams
class ReplayTransport : public netlink::Transport {
public:
    explicit ReplayTransport(std::vector<Bytes> datagrams) : datagrams_(std::move(datagrams)) {}

    void send(const Bytes& request) override { sent.push_back(request); }

    Bytes receive() override {
        if (next_ >= datagrams_.size()) {
            return {};
        }
        return datagrams_[next_++];
    }

    std::vector<Bytes> sent;
    size_t received() const { return next_; }

private:
    std::vector<Bytes> datagrams_;
    size_t next_ = 0;
};

} // anonymous namespace

TEST(NetlinkProtocolTest, SplitsConcatenatedMessages) {
    Bytes datagram = concat({link_message(5, 1, 0, "lo"), link_message(5, 2, 0, "eth0"), done_message(5)});
    auto messages = netlink::split_messages(datagram.data(), datagram.size());

    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].type, RTM_NEWLINK);
    EXPECT_EQ(messages[0].sequence, 5u);
    EXPECT_EQ(messages[2].type, NLMSG_DONE);

    auto link = netlink::parse_link_message(messages[1]);
    EXPECT_EQ(link.index, 2);
    ASSERT_EQ(link.attributes.size(), 1u);
    EXPECT_EQ(link.attributes[0].type, IFLA_IFNAME);
    EXPECT_EQ(link.attributes[0].length, 5u);  // "eth0" plus NUL
}

TEST(NetlinkProtocolTest, RejectsTruncatedHeader) {
    Bytes datagram = link_message(1, 1, 0, "lo");
    EXPECT_EQ(kind_of([&] { netlink::split_messages(datagram.data(), 8); }), ErrorKind::STRATEGY_FAILURE);
}

TEST(NetlinkProtocolTest, RejectsLengthPastDatagram) {
    Bytes datagram = link_message(1, 1, 0, "lo");
    nlmsghdr header;
    std::memcpy(&header, datagram.data(), sizeof(header));
    header.nlmsg_len = static_cast<uint32_t>(datagram.size() + 16);
    std::memcpy(datagram.data(), &header, sizeof(header));

    EXPECT_EQ(kind_of([&] { netlink::split_messages(datagram.data(), datagram.size()); }),
              ErrorKind::STRATEGY_FAILURE);
}

TEST(NetlinkProtocolTest, RejectsAttributeLongerThanPayload) {
    Bytes payload(RTA_SPACE(4), 0);
    rtattr header{};
    header.rta_len = static_cast<unsigned short>(RTA_LENGTH(64));
    header.rta_type = IFA_ADDRESS;
    std::memcpy(payload.data(), &header, sizeof(header));

    EXPECT_EQ(kind_of([&] { netlink::parse_attributes(payload.data(), payload.size()); }),
              ErrorKind::STRATEGY_FAILURE);
}

TEST(NetlinkProtocolTest, RejectsTruncatedFixedHeader) {
    Bytes datagram = NetlinkMessageBuilder(RTM_NEWADDR, 1).fixed(uint16_t{0}).build();
    auto messages = netlink::split_messages(datagram.data(), datagram.size());
    ASSERT_EQ(messages.size(), 1u);

    EXPECT_EQ(kind_of([&] { netlink::parse_address_message(messages[0]); }), ErrorKind::STRATEGY_FAILURE);
}

TEST(NetlinkProtocolTest, AttributeAddressChecksLength) {
    const uint8_t bytes[16] = {0x20, 0x01, 0x0d, 0xb8};
    netlink::Attribute attribute{IFA_ADDRESS, bytes, 16};

    EXPECT_EQ(netlink::attribute_address(attribute, AF_INET6), NetworkAddress::parse("2001:db8::"));
    EXPECT_EQ(kind_of([&] { netlink::attribute_address(attribute, AF_INET); }), ErrorKind::STRATEGY_FAILURE);

    attribute.length = 4;
    EXPECT_EQ(netlink::attribute_address(attribute, AF_INET), NetworkAddress::from_ipv4(0x20, 0x01, 0x0d, 0xb8));
}

TEST(NetlinkProtocolTest, RouteRequestLayout) {
    Bytes request = netlink::build_route_request(9, NetworkAddress::from_ipv4(192, 0, 2, 0));
    ASSERT_EQ(request.size(), NLMSG_SPACE(sizeof(rtmsg)) + RTA_SPACE(4));

    nlmsghdr header;
    std::memcpy(&header, request.data(), sizeof(header));
    EXPECT_EQ(header.nlmsg_len, request.size());
    EXPECT_EQ(header.nlmsg_type, RTM_GETROUTE);
    EXPECT_EQ(header.nlmsg_flags, NLM_F_REQUEST);
    EXPECT_EQ(header.nlmsg_seq, 9u);

    rtmsg route;
    std::memcpy(&route, request.data() + NLMSG_HDRLEN, sizeof(route));
    EXPECT_EQ(route.rtm_family, AF_INET);
    EXPECT_EQ(route.rtm_dst_len, 32);

    const uint8_t* dst = request.data() + NLMSG_SPACE(sizeof(rtmsg)) + RTA_LENGTH(0);
    EXPECT_EQ(dst[0], 192);
    EXPECT_EQ(dst[1], 0);
    EXPECT_EQ(dst[2], 2);
    EXPECT_EQ(dst[3], 0);

    Bytes request6 = netlink::build_route_request(10, NetworkAddress::parse("2001:db8::"));
    std::memcpy(&route, request6.data() + NLMSG_HDRLEN, sizeof(route));
    EXPECT_EQ(route.rtm_family, AF_INET6);
    EXPECT_EQ(route.rtm_dst_len, 128);
}

TEST(NetlinkProtocolTest, DumpRequestLayout) {
    Bytes request = netlink::build_dump_request(RTM_GETADDR, 3, AF_INET6);
    ASSERT_EQ(request.size(), NLMSG_SPACE(sizeof(ifaddrmsg)));

    nlmsghdr header;
    std::memcpy(&header, request.data(), sizeof(header));
    EXPECT_EQ(header.nlmsg_type, RTM_GETADDR);
    EXPECT_EQ(header.nlmsg_flags, NLM_F_REQUEST | NLM_F_DUMP);

    ifaddrmsg address;
    std::memcpy(&address, request.data() + NLMSG_HDRLEN, sizeof(address));
    EXPECT_EQ(address.ifa_family, AF_INET6);

    EXPECT_EQ(netlink::build_dump_request(RTM_GETLINK, 4, AF_UNSPEC).size(), NLMSG_SPACE(sizeof(ifinfomsg)));
}

TEST(NetlinkExchangeTest, AcknowledgementCompletes) {
    ReplayTransport transport({error_message(7, 0)});
    netlink::Exchange exchange(transport, netlink::Exchange::Kind::DUMP, RTM_NEWADDR);

    int handled = 0;
    exchange.run(netlink::build_dump_request(RTM_GETADDR, 7, AF_UNSPEC), 7,
                 [&](const netlink::Message&) { handled++; });
    EXPECT_EQ(handled, 0);
    EXPECT_EQ(transport.sent.size(), 1u);
}

TEST(NetlinkExchangeTest, NoopIsSkipped) {
    ReplayTransport transport({concat({NetlinkMessageBuilder(NLMSG_NOOP, 2).build(),
                                       NetlinkMessageBuilder(RTM_NEWROUTE, 2, 0).fixed(route_header(AF_INET)).build()})});
    netlink::Exchange exchange(transport, netlink::Exchange::Kind::ROUTE_LOOKUP, RTM_NEWROUTE);

    int handled = 0;
    exchange.run(netlink::build_route_request(2, NetworkAddress::from_ipv4(192, 0, 2, 0)), 2,
                 [&](const netlink::Message&) { handled++; });
    EXPECT_EQ(handled, 1);
}

TEST(NetlinkExchangeTest, RouteLookupStopsAfterFirstReply) {
    ReplayTransport transport({NetlinkMessageBuilder(RTM_NEWROUTE, 4, 0).fixed(route_header(AF_INET)).build(),
                               NetlinkMessageBuilder(RTM_NEWROUTE, 4, 0).fixed(route_header(AF_INET)).build()});
    netlink::Exchange exchange(transport, netlink::Exchange::Kind::ROUTE_LOOKUP, RTM_NEWROUTE);

    exchange.run(netlink::build_route_request(4, NetworkAddress::from_ipv4(192, 0, 2, 0)), 4,
                 [](const netlink::Message&) {});
    EXPECT_EQ(transport.received(), 1u);
}

TEST(NetlinkExchangeTest, HostUnreachableIsNotFoundOnlyForRouteLookups) {
    ReplayTransport route_transport({error_message(1, EHOSTUNREACH)});
    netlink::Exchange lookup(route_transport, netlink::Exchange::Kind::ROUTE_LOOKUP, RTM_NEWROUTE);
    EXPECT_EQ(kind_of([&] {
                  lookup.run(netlink::build_route_request(1, NetworkAddress::from_ipv4(192, 0, 2, 0)), 1,
                             [](const netlink::Message&) {});
              }),
              ErrorKind::NOT_FOUND);

    ReplayTransport dump_transport({error_message(1, ENETUNREACH)});
    netlink::Exchange dump(dump_transport, netlink::Exchange::Kind::DUMP, RTM_NEWADDR);
    EXPECT_EQ(kind_of([&] {
                  dump.run(netlink::build_dump_request(RTM_GETADDR, 1, AF_UNSPEC), 1,
                           [](const netlink::Message&) {});
              }),
              ErrorKind::STRATEGY_FAILURE);
}

TEST(NetlinkExchangeTest, DumpEndingWithErrnoIsStrategyFailure) {
    int status = -ENOBUFS;
    ReplayTransport transport({concat({link_message(7, 1, 0, "lo"),
                                       NetlinkMessageBuilder(NLMSG_DONE, 7).fixed(status).build()})});
    netlink::Exchange exchange(transport, netlink::Exchange::Kind::DUMP, RTM_NEWLINK);

    int handled = 0;
    EXPECT_EQ(kind_of([&] {
                  exchange.run(netlink::build_dump_request(RTM_GETLINK, 7, AF_UNSPEC), 7,
                               [&](const netlink::Message&) { handled++; });
              }),
              ErrorKind::STRATEGY_FAILURE);
    EXPECT_EQ(handled, 1);
}

TEST(NetlinkExchangeTest, DoneWithoutStatusCompletes) {
    ReplayTransport transport({NetlinkMessageBuilder(NLMSG_DONE, 8).build()});
    netlink::Exchange exchange(transport, netlink::Exchange::Kind::DUMP, RTM_NEWADDR);

    exchange.run(netlink::build_dump_request(RTM_GETADDR, 8, AF_UNSPEC), 8,
                 [](const netlink::Message&) {});
    EXPECT_EQ(transport.received(), 1u);
}
