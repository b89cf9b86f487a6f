#pragma once

#include "netlink_protocol.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace localip {
namespace netlink {

// NETLINK_ROUTE socket, closed when the object goes away
class Socket : public Transport {
public:
    explicit Socket(size_t receive_buffer_size);
    ~Socket() override;

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    void send(const std::vector<uint8_t>& request) override;
    std::vector<uint8_t> receive() override;

private:
    int fd_ = -1;
    size_t receive_buffer_size_;
};

} // namespace netlink
} // namespace localip
