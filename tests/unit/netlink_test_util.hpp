#pragma once

#include "netlink_protocol.hpp"
#include <localip/types.hpp>
#include <sys/socket.h>
#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <cstring>
#include <deque>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace localip {
namespace test_util {

using Bytes = std::vector<uint8_t>;

// Builds one rtnetlink message the way the kernel lays it out
class NetlinkMessageBuilder {
public:
    NetlinkMessageBuilder(uint16_t type, uint32_t sequence, uint16_t flags = NLM_F_MULTI)
        : type_(type), sequence_(sequence), flags_(flags) {
    }

    template <typename T>
    NetlinkMessageBuilder& fixed(const T& header) {
        append_padded(&header, sizeof(header), NLMSG_ALIGN(sizeof(header)));
        return *this;
    }

    NetlinkMessageBuilder& attribute(uint16_t type, const void* data, size_t length) {
        rtattr header{};
        header.rta_len = static_cast<unsigned short>(RTA_LENGTH(length));
        header.rta_type = type;
        append_padded(&header, sizeof(header), RTA_LENGTH(0));
        append_padded(data, length, RTA_ALIGN(length));
        return *this;
    }

    NetlinkMessageBuilder& attribute(uint16_t type, const std::string& text) {
        // Kernel strings carry their terminating NUL
        return attribute(type, text.c_str(), text.size() + 1);
    }

    NetlinkMessageBuilder& attribute(uint16_t type, const NetworkAddress& address) {
        if (address.is_ipv4()) {
            return attribute(type, address.v4_bytes().data(), 4);
        }
        return attribute(type, address.v6_bytes().data(), 16);
    }

    Bytes build() const {
        nlmsghdr header{};
        header.nlmsg_len = static_cast<uint32_t>(NLMSG_HDRLEN + body_.size());
        header.nlmsg_type = type_;
        header.nlmsg_flags = flags_;
        header.nlmsg_seq = sequence_;
        header.nlmsg_pid = 0;

        Bytes message(NLMSG_HDRLEN, 0);
        std::memcpy(message.data(), &header, sizeof(header));
        message.insert(message.end(), body_.begin(), body_.end());
        return message;
    }

private:
    void append_padded(const void* data, size_t length, size_t padded) {
        const size_t offset = body_.size();
        body_.resize(offset + padded, 0);
        std::memcpy(body_.data() + offset, data, length);
    }

    uint16_t type_;
    uint32_t sequence_;
    uint16_t flags_;
    Bytes body_;
};

inline Bytes link_message(uint32_t sequence, int index, unsigned flags, const std::string& name) {
    ifinfomsg link{};
    link.ifi_family = AF_UNSPEC;
    link.ifi_index = index;
    link.ifi_flags = flags;
    return NetlinkMessageBuilder(RTM_NEWLINK, sequence).fixed(link).attribute(IFLA_IFNAME, name).build();
}

inline ifaddrmsg address_header(uint8_t family, uint32_t index, uint8_t scope = RT_SCOPE_UNIVERSE) {
    ifaddrmsg header{};
    header.ifa_family = family;
    header.ifa_prefixlen = family == AF_INET ? 24 : 64;
    header.ifa_scope = scope;
    header.ifa_index = index;
    return header;
}

inline rtmsg route_header(uint8_t family, uint8_t scope = RT_SCOPE_UNIVERSE) {
    rtmsg header{};
    header.rtm_family = family;
    header.rtm_dst_len = family == AF_INET ? 32 : 128;
    header.rtm_table = RT_TABLE_MAIN;
    header.rtm_protocol = RTPROT_UNSPEC;
    header.rtm_scope = scope;
    header.rtm_type = RTN_UNICAST;
    return header;
}

inline Bytes done_message(uint32_t sequence) {
    int status = 0;
    return NetlinkMessageBuilder(NLMSG_DONE, sequence).fixed(status).build();
}

// NLMSG_ERROR with a negative errno, as the kernel reports it
inline Bytes error_message(uint32_t sequence, int error_number) {
    nlmsgerr error{};
    error.error = -error_number;
    return NetlinkMessageBuilder(NLMSG_ERROR, sequence, 0).fixed(error).build();
}

inline Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

// Requests observed by a ScriptedTransport
struct TransportLog {
    std::vector<uint16_t> request_types;
    std::vector<Bytes> requests;
    int transports_created = 0;
};

// Answers each request with the datagrams a script produces for its type and
// sequence number
class ScriptedTransport : public netlink::Transport {
public:
    using Script = std::function<std::vector<Bytes>(uint16_t type, uint32_t sequence)>;

    ScriptedTransport(Script script, TransportLog& log)
        : script_(std::move(script)), log_(log) {
    }

    void send(const Bytes& request) override {
        nlmsghdr header{};
        std::memcpy(&header, request.data(), sizeof(header));
        log_.request_types.push_back(header.nlmsg_type);
        log_.requests.push_back(request);

        for (auto& datagram : script_(header.nlmsg_type, header.nlmsg_seq)) {
            pending_.push_back(std::move(datagram));
        }
    }

    Bytes receive() override {
        if (pending_.empty()) {
            return {};
        }
        Bytes datagram = std::move(pending_.front());
        pending_.pop_front();
        return datagram;
    }

private:
    Script script_;
    TransportLog& log_;
    std::deque<Bytes> pending_;
};

} // namespace test_util
} // namespace localip
