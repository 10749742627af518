#include "holepunch/traversal/stream_handle.hpp"

namespace holepunch::traversal {

std::string_view to_string(TraversalPath path) {
    switch (path) {
        case TraversalPath::Listen: return "listen";
        case TraversalPath::Connect: return "connect";
    }
    return "unknown";
}

StreamHandle::StreamHandle(net::TcpSocket socket,
                           net::SocketAddress local,
                           net::SocketAddress remote,
                           TraversalPath path)
    : socket_(std::move(socket))
    , local_(local)
    , remote_(remote)
    , path_(path)
{}

bool StreamHandle::write_all(std::span<const uint8_t> data) {
    return socket_.send_all(data);
}

ssize_t StreamHandle::read_some(std::span<uint8_t> buffer) {
    return socket_.recv(buffer);
}

} // namespace holepunch::traversal
