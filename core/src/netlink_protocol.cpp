#include "netlink_protocol.hpp"
#include <localip/address_codec.hpp>
#include <localip/error.hpp>
#include <glog/logging.h>
#include <sys/socket.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace localip {
namespace netlink {

namespace {

template <typename Header>
Header read_fixed_header(const Message& message, const char* what) {
    if (message.payload_length < NLMSG_ALIGN(sizeof(Header))) {
        throw Error::strategy_failure(std::string("Truncated ") + what + " payload (" +
                                      std::to_string(message.payload_length) + " bytes)");
    }
    Header header;
    std::memcpy(&header, message.payload, sizeof(Header));
    return header;
}

template <typename Header>
std::vector<Attribute> trailing_attributes(const Message& message) {
    const size_t offset = NLMSG_ALIGN(sizeof(Header));
    return parse_attributes(message.payload + offset, message.payload_length - offset);
}

template <typename Header>
void append(std::vector<uint8_t>& buffer, size_t offset, const Header& header) {
    std::memcpy(buffer.data() + offset, &header, sizeof(Header));
}

} // anonymous namespace

std::vector<Message> split_messages(const uint8_t* data, size_t length) {
    std::vector<Message> messages;
    size_t offset = 0;

    while (offset < length) {
        if (length - offset < sizeof(nlmsghdr)) {
            throw Error::strategy_failure("Truncated netlink message header at offset " +
                                          std::to_string(offset));
        }

        nlmsghdr header;
        std::memcpy(&header, data + offset, sizeof(header));

        if (header.nlmsg_len < NLMSG_HDRLEN || header.nlmsg_len > length - offset) {
            throw Error::strategy_failure("Invalid netlink message length " +
                                          std::to_string(header.nlmsg_len) + " at offset " +
                                          std::to_string(offset));
        }

        Message message;
        message.type = header.nlmsg_type;
        message.flags = header.nlmsg_flags;
        message.sequence = header.nlmsg_seq;
        message.port_id = header.nlmsg_pid;
        message.payload = data + offset + NLMSG_HDRLEN;
        message.payload_length = header.nlmsg_len - NLMSG_HDRLEN;
        messages.push_back(message);

        offset += NLMSG_ALIGN(header.nlmsg_len);
    }

    return messages;
}

std::vector<Attribute> parse_attributes(const uint8_t* data, size_t length) {
    std::vector<Attribute> attributes;
    size_t offset = 0;

    while (offset < length) {
        if (length - offset < sizeof(rtattr)) {
            throw Error::strategy_failure("Truncated netlink attribute header at offset " +
                                          std::to_string(offset));
        }

        rtattr header;
        std::memcpy(&header, data + offset, sizeof(header));

        if (header.rta_len < RTA_LENGTH(0) || header.rta_len > length - offset) {
            throw Error::strategy_failure("Invalid netlink attribute length " +
                                          std::to_string(header.rta_len) + " for type " +
                                          std::to_string(header.rta_type));
        }

        Attribute attribute;
        attribute.type = header.rta_type;
        attribute.data = data + offset + RTA_LENGTH(0);
        attribute.length = header.rta_len - RTA_LENGTH(0);
        attributes.push_back(attribute);

        offset += RTA_ALIGN(header.rta_len);
    }

    return attributes;
}

RouteMessage parse_route_message(const Message& message) {
    auto header = read_fixed_header<rtmsg>(message, "route");
    RouteMessage route;
    route.family = header.rtm_family;
    route.scope = header.rtm_scope;
    route.attributes = trailing_attributes<rtmsg>(message);
    return route;
}

AddressMessage parse_address_message(const Message& message) {
    auto header = read_fixed_header<ifaddrmsg>(message, "address");
    AddressMessage address;
    address.family = header.ifa_family;
    address.scope = header.ifa_scope;
    address.index = header.ifa_index;
    address.attributes = trailing_attributes<ifaddrmsg>(message);
    return address;
}

LinkMessage parse_link_message(const Message& message) {
    auto header = read_fixed_header<ifinfomsg>(message, "link");
    LinkMessage link;
    link.index = header.ifi_index;
    link.flags = header.ifi_flags;
    link.attributes = trailing_attributes<ifinfomsg>(message);
    return link;
}

NetworkAddress attribute_address(const Attribute& attribute, uint8_t family) {
    const size_t expected = family == AF_INET ? 4 : family == AF_INET6 ? 16 : 0;
    if (expected == 0 || attribute.length != expected) {
        throw Error::strategy_failure("An error occurred retrieving Netlink's route payload attribute: type " +
                                      std::to_string(attribute.type) + ", family " +
                                      std::to_string(family) + ", length " +
                                      std::to_string(attribute.length));
    }
    return decode_address_bytes(attribute.data, attribute.length);
}

std::vector<uint8_t> build_route_request(uint32_t sequence, const NetworkAddress& destination) {
    const size_t address_length = destination.is_ipv4() ? 4 : 16;
    const size_t total = NLMSG_SPACE(sizeof(rtmsg)) + RTA_SPACE(address_length);
    std::vector<uint8_t> buffer(total, 0);

    nlmsghdr header{};
    header.nlmsg_len = static_cast<uint32_t>(total);
    header.nlmsg_type = RTM_GETROUTE;
    header.nlmsg_flags = NLM_F_REQUEST;
    header.nlmsg_seq = sequence;
    header.nlmsg_pid = 0;

    rtmsg route{};
    route.rtm_family = destination.is_ipv4() ? AF_INET : AF_INET6;
    route.rtm_dst_len = static_cast<uint8_t>(address_length * 8);
    route.rtm_table = RT_TABLE_UNSPEC;
    route.rtm_protocol = RTPROT_UNSPEC;
    route.rtm_scope = RT_SCOPE_UNIVERSE;
    route.rtm_type = RTN_UNSPEC;
#ifdef RTM_F_LOOKUP_TABLE
    route.rtm_flags = RTM_F_LOOKUP_TABLE;
#endif

    rtattr destination_attr{};
    destination_attr.rta_len = static_cast<unsigned short>(RTA_LENGTH(address_length));
    destination_attr.rta_type = RTA_DST;

    const size_t attr_offset = NLMSG_SPACE(sizeof(rtmsg));
    append(buffer, 0, header);
    append(buffer, NLMSG_HDRLEN, route);
    append(buffer, attr_offset, destination_attr);

    uint8_t* payload = buffer.data() + attr_offset + RTA_LENGTH(0);
    if (destination.is_ipv4()) {
        std::memcpy(payload, destination.v4_bytes().data(), 4);
    } else {
        std::memcpy(payload, destination.v6_bytes().data(), 16);
    }

    return buffer;
}

std::vector<uint8_t> build_dump_request(uint16_t type, uint32_t sequence, uint8_t family) {
    const bool link_request = type == RTM_GETLINK;
    const size_t body = link_request ? sizeof(ifinfomsg) : sizeof(ifaddrmsg);
    const size_t total = NLMSG_SPACE(body);
    std::vector<uint8_t> buffer(total, 0);

    nlmsghdr header{};
    header.nlmsg_len = static_cast<uint32_t>(total);
    header.nlmsg_type = type;
    header.nlmsg_flags = NLM_F_REQUEST | NLM_F_DUMP;
    header.nlmsg_seq = sequence;
    header.nlmsg_pid = 0;
    append(buffer, 0, header);

    if (link_request) {
        ifinfomsg link{};
        link.ifi_family = family;
        append(buffer, NLMSG_HDRLEN, link);
    } else {
        ifaddrmsg address{};
        address.ifa_family = family;
        append(buffer, NLMSG_HDRLEN, address);
    }

    return buffer;
}

Exchange::Exchange(Transport& transport, Kind kind, uint16_t expected_type)
    : transport_(transport), kind_(kind), expected_type_(expected_type) {
}

void Exchange::run(const std::vector<uint8_t>& request, uint32_t sequence, const Handler& handler) {
    state_ = State::AWAITING_REPLY;
    transport_.send(request);

    while (state_ == State::AWAITING_REPLY) {
        std::vector<uint8_t> datagram = transport_.receive();
        if (datagram.empty()) {
            throw Error::strategy_failure("Netlink socket returned an empty datagram");
        }

        for (const auto& message : split_messages(datagram.data(), datagram.size())) {
            if (message.sequence != sequence) {
                VLOG(2) << "Ignoring netlink message with sequence " << message.sequence
                        << " (expected " << sequence << ")";
                continue;
            }

            if (message.type == NLMSG_NOOP) {
                continue;
            } else if (message.type == NLMSG_DONE) {
                // A dump cut short by the kernel ends with a negative errno
                handle_done_message(message);
                state_ = State::COMPLETE;
            } else if (message.type == NLMSG_ERROR) {
                handle_error_message(message);
                state_ = State::COMPLETE;  // Plain acknowledgement
            } else if (message.type == expected_type_) {
                handler(message);
                if (kind_ != Kind::DUMP) {
                    state_ = State::COMPLETE;
                }
            } else {
                throw Error::strategy_failure("The Netlink header type is not the expected: got " +
                                              std::to_string(message.type) + ", expected " +
                                              std::to_string(expected_type_));
            }

            if (state_ == State::COMPLETE) {
                break;
            }
        }
    }
}

void Exchange::handle_done_message(const Message& message) {
    if (message.payload_length < sizeof(int)) {
        return;
    }

    int error = 0;
    std::memcpy(&error, message.payload, sizeof(error));
    if (error != 0) {
        handle_error_message(message);
    }
}

void Exchange::handle_error_message(const Message& message) {
    if (message.payload_length < sizeof(int)) {
        throw Error::strategy_failure("Truncated netlink error message");
    }

    int error = 0;
    std::memcpy(&error, message.payload, sizeof(error));
    if (error == 0) {
        return;
    }

    const int error_number = -error;
    if (kind_ == Kind::ROUTE_LOOKUP && (error_number == ENETUNREACH || error_number == EHOSTUNREACH)) {
        LOG(INFO) << "No route towards the probe destination: " << strerror(error_number);
        throw Error::not_found();
    }

    LOG(ERROR) << "Netlink request failed: " << strerror(error_number);
    throw Error::from_errno("An error occurred retrieving Netlink's socket response", error_number);
}

} // namespace netlink
} // namespace localip
