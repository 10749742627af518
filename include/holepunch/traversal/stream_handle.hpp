#pragma once

#include "holepunch/net/tcp_socket.hpp"
#include <span>
#include <string_view>

namespace holepunch::traversal {

// Which half of a simultaneous open produced a stream
enum class TraversalPath {
    Listen,   // Accepted an inbound connection on the local port
    Connect   // Outbound connect from the local port succeeded
};

std::string_view to_string(TraversalPath path);

// An established TCP stream. Move-only: whoever holds it owns the socket,
// which is closed exactly once when the handle is destroyed or close()d.
class StreamHandle {
public:
    StreamHandle(net::TcpSocket socket,
                 net::SocketAddress local,
                 net::SocketAddress remote,
                 TraversalPath path);

    StreamHandle(StreamHandle&&) noexcept = default;
    StreamHandle& operator=(StreamHandle&&) noexcept = default;

    StreamHandle(const StreamHandle&) = delete;
    StreamHandle& operator=(const StreamHandle&) = delete;

    const net::SocketAddress& local_endpoint() const { return local_; }
    const net::SocketAddress& remote_endpoint() const { return remote_; }
    TraversalPath path() const { return path_; }

    bool is_open() const { return socket_.is_open(); }

    // Blocking write of the whole buffer
    bool write_all(std::span<const uint8_t> data);

    // Blocking read; 0 means the peer closed its side
    ssize_t read_some(std::span<uint8_t> buffer);

    // Signal end of our data; reads continue until the peer closes
    bool close_write() { return socket_.shutdown_write(); }

    int fd() const { return socket_.fd(); }

    net::TcpSocket& socket() { return socket_; }

    void close() { socket_.close(); }

private:
    net::TcpSocket socket_;
    net::SocketAddress local_;
    net::SocketAddress remote_;
    TraversalPath path_;
};

} // namespace holepunch::traversal
