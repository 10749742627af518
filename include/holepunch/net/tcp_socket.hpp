#pragma once

#include "address.hpp"
#include <optional>
#include <span>
#include <cstdint>
#include <sys/types.h>

namespace holepunch::net {

// Result of starting a non-blocking connect
enum class ConnectStart {
    Connected,   // Completed immediately (typical for loopback)
    InProgress,  // EINPROGRESS, wait for writability then check pending_error()
    Failed       // Failed outright, see last_error()
};

// RAII wrapper around a TCP socket descriptor
class TcpSocket {
public:
    TcpSocket() = default;

    // Take ownership of an existing descriptor
    explicit TcpSocket(int fd) : fd_(fd) {}

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    ~TcpSocket();

    // Create the descriptor for the given family (AF_INET / AF_INET6)
    bool open(int family = AF_INET);

    // SO_REUSEADDR
    bool set_reuse_address(bool enable);

    // SO_REUSEPORT; returns false where the option does not exist
    bool set_reuse_port(bool enable);

    bool bind(const SocketAddress& addr);

    bool listen(int backlog);

    // Accept one pending connection. Returns nullopt with last_error() set to
    // EAGAIN/EWOULDBLOCK when nothing is pending on a non-blocking socket.
    std::optional<TcpSocket> accept(SocketAddress* peer = nullptr);

    ConnectStart connect(const SocketAddress& to);

    // SO_ERROR: outcome of an in-progress connect (0 on success)
    int pending_error();

    bool set_nonblocking(bool nonblocking);

    bool set_nodelay(bool enable);

    // Returns bytes sent, or -1 on error
    ssize_t send(std::span<const uint8_t> data);

    // Send everything, retrying short writes
    bool send_all(std::span<const uint8_t> data);

    // Returns bytes received, 0 on orderly shutdown, -1 on error
    ssize_t recv(std::span<uint8_t> buffer);

    // Half-close: the peer reads EOF, receiving still works
    bool shutdown_write();

    std::optional<SocketAddress> local_address() const;
    std::optional<SocketAddress> peer_address() const;

    int fd() const { return fd_; }
    bool is_open() const { return fd_ >= 0; }

    // errno of the last failed call on this socket
    int last_error() const { return last_error_; }

    void close();

private:
    bool fail();

    int fd_ = -1;
    int last_error_ = 0;
};

} // namespace holepunch::net
