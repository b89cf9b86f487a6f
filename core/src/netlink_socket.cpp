#include "netlink_socket.hpp"
#include <localip/error.hpp>
#include <glog/logging.h>
#include <sys/socket.h>
#include <linux/netlink.h>
#include <sys/uio.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace localip {
namespace netlink {

Socket::Socket(size_t receive_buffer_size)
    : receive_buffer_size_(receive_buffer_size) {
    fd_ = ::socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC, NETLINK_ROUTE);
    if (fd_ < 0) {
        int saved_errno = errno;
        LOG(ERROR) << "Failed to create netlink socket: " << strerror(saved_errno);
        throw Error::from_errno("socket(AF_NETLINK)", saved_errno);
    }

    sockaddr_nl local{};
    local.nl_family = AF_NETLINK;
    if (::bind(fd_, reinterpret_cast<const sockaddr*>(&local), sizeof(local)) < 0) {
        int saved_errno = errno;
        ::close(fd_);
        fd_ = -1;
        LOG(ERROR) << "Failed to bind netlink socket: " << strerror(saved_errno);
        throw Error::from_errno("bind(AF_NETLINK)", saved_errno);
    }

    VLOG(2) << "Opened netlink socket " << fd_;
}

Socket::~Socket() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void Socket::send(const std::vector<uint8_t>& request) {
    sockaddr_nl kernel{};
    kernel.nl_family = AF_NETLINK;

    ssize_t sent;
    do {
        sent = ::sendto(fd_, request.data(), request.size(), 0,
                        reinterpret_cast<const sockaddr*>(&kernel), sizeof(kernel));
    } while (sent < 0 && errno == EINTR);

    if (sent < 0) {
        throw Error::from_errno("sendto(netlink)", errno);
    }
    if (static_cast<size_t>(sent) != request.size()) {
        throw Error::strategy_failure("Short write on netlink socket");
    }
}

std::vector<uint8_t> Socket::receive() {
    std::vector<uint8_t> buffer(receive_buffer_size_);

    iovec io{};
    io.iov_base = buffer.data();
    io.iov_len = buffer.size();

    sockaddr_nl sender{};
    msghdr header{};
    header.msg_name = &sender;
    header.msg_namelen = sizeof(sender);
    header.msg_iov = &io;
    header.msg_iovlen = 1;

    ssize_t received;
    do {
        received = ::recvmsg(fd_, &header, 0);
    } while (received < 0 && errno == EINTR);

    if (received < 0) {
        throw Error::from_errno("recvmsg(netlink)", errno);
    }
    if (header.msg_flags & MSG_TRUNC) {
        throw Error::strategy_failure("Netlink datagram larger than the receive buffer (" +
                                      std::to_string(receive_buffer_size_) + " bytes)");
    }
    if (sender.nl_pid != 0) {
        // Only the kernel talks to this socket
        throw Error::strategy_failure("Netlink message from unexpected sender " +
                                      std::to_string(sender.nl_pid));
    }

    buffer.resize(static_cast<size_t>(received));
    return buffer;
}

} // namespace netlink
} // namespace localip
