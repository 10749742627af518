#pragma once

#include "tcp_socket.hpp"
#include <optional>

namespace holepunch::net {

// Creates TCP sockets that can share one local port: the listening socket and
// every outbound attempt of a simultaneous open bind the same port.
class ReusableSocketFactory {
public:
    // Bind to 0.0.0.0
    ReusableSocketFactory() = default;

    explicit ReusableSocketFactory(IpAddress bind_address)
        : bind_address_(bind_address) {}

    // Create a socket with SO_REUSEADDR and, where supported, SO_REUSEPORT,
    // bound to (bind_address, local_port). On failure returns nullopt and
    // stores the errno in `os_error`. A failed SO_REUSEPORT is not a failure.
    std::optional<TcpSocket> create(uint16_t local_port, int& os_error) const;

    const IpAddress& bind_address() const { return bind_address_; }

private:
    IpAddress bind_address_ = IPv4Address::any();
};

} // namespace holepunch::net
