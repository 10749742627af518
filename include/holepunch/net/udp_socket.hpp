#pragma once

#include "address.hpp"
#include <optional>

namespace holepunch::net {

// Minimal UDP socket. Only used to ask the kernel which source address it
// would pick for a destination: connect() on a datagram socket sends nothing.
class UdpSocket {
public:
    UdpSocket() = default;

    // Non-copyable
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    // Movable
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    ~UdpSocket();

    // Create the socket (if needed) for the family of `to` and set its
    // default destination
    bool connect(const SocketAddress& to);

    // Get bound address
    std::optional<SocketAddress> local_address() const;

    int fd() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

    // errno of the last failed call
    int last_error() const { return last_error_; }

    void close();

private:
    int fd_ = -1;
    int last_error_ = 0;
};

} // namespace holepunch::net
