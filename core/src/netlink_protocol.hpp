#pragma once

#include <localip/types.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace localip {
namespace netlink {

// A typed attribute (struct rtattr + payload). `data` points into the
// receive buffer and is only valid while the message handler runs.
struct Attribute {
    uint16_t type = 0;
    const uint8_t* data = nullptr;
    size_t length = 0;
};

// One message out of a received datagram, header already validated
struct Message {
    uint16_t type = 0;
    uint16_t flags = 0;
    uint32_t sequence = 0;
    uint32_t port_id = 0;
    const uint8_t* payload = nullptr;
    size_t payload_length = 0;
};

// Decoded fixed headers of the rtnetlink payloads we consume
struct RouteMessage {
    uint8_t family = 0;
    uint8_t scope = 0;
    std::vector<Attribute> attributes;
};

struct AddressMessage {
    uint8_t family = 0;
    uint8_t scope = 0;
    uint32_t index = 0;
    std::vector<Attribute> attributes;
};

struct LinkMessage {
    int32_t index = 0;
    uint32_t flags = 0;
    std::vector<Attribute> attributes;
};

// All parsers throw ErrorKind::STRATEGY_FAILURE on truncated or inconsistent
// lengths instead of reading past the buffer.
std::vector<Message> split_messages(const uint8_t* data, size_t length);
std::vector<Attribute> parse_attributes(const uint8_t* data, size_t length);

RouteMessage parse_route_message(const Message& message);
AddressMessage parse_address_message(const Message& message);
LinkMessage parse_link_message(const Message& message);

// Address carried by an attribute; its length must match `family`
NetworkAddress attribute_address(const Attribute& attribute, uint8_t family);

// RTM_GETROUTE for a single destination
std::vector<uint8_t> build_route_request(uint32_t sequence, const NetworkAddress& destination);

// RTM_GETLINK / RTM_GETADDR dump for `family` (AF_UNSPEC for all)
std::vector<uint8_t> build_dump_request(uint16_t type, uint32_t sequence, uint8_t family);

// Datagram channel to the kernel
class Transport {
public:
    virtual ~Transport() = default;

    virtual void send(const std::vector<uint8_t>& request) = 0;

    // Blocks until one datagram arrives
    virtual std::vector<uint8_t> receive() = 0;
};

// One request/response round trip:
//
//   AWAITING_REPLY --(reply of expected type)--> handler
//        |  \--(NLMSG_DONE, or first reply when not a dump)--> COMPLETE
//        |--(NLMSG_ERROR, or NLMSG_DONE carrying an errno)--> Error
//        \--(any other type)--> STRATEGY_FAILURE
//
// Messages carrying another sequence number are ignored.
class Exchange {
public:
    enum class Kind {
        ROUTE_LOOKUP,  // ENETUNREACH/EHOSTUNREACH map to ErrorKind::NOT_FOUND
        DUMP
    };

    using Handler = std::function<void(const Message&)>;

    Exchange(Transport& transport, Kind kind, uint16_t expected_type);

    void run(const std::vector<uint8_t>& request, uint32_t sequence, const Handler& handler);

private:
    enum class State {
        AWAITING_REPLY,
        COMPLETE
    };

    void handle_done_message(const Message& message);
    void handle_error_message(const Message& message);

    Transport& transport_;
    Kind kind_;
    uint16_t expected_type_;
    State state_ = State::AWAITING_REPLY;
};

} // namespace netlink
} // namespace localip
