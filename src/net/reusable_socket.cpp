#include "holepunch/net/reusable_socket.hpp"
#include "holepunch/util/logger.hpp"
#include <cstring>

namespace holepunch::net {

std::optional<TcpSocket> ReusableSocketFactory::create(uint16_t local_port, int& os_error) const {
    TcpSocket sock;
    os_error = 0;

    if (!sock.open(bind_address_.is_v4() ? AF_INET : AF_INET6)) {
        os_error = sock.last_error();
        return std::nullopt;
    }

    if (!sock.set_reuse_address(true)) {
        os_error = sock.last_error();
        return std::nullopt;
    }

    if (!sock.set_reuse_port(true)) {
        // Not critical, continue
        LOG_TRACE("SO_REUSEPORT unavailable on port {}: {}",
                  local_port, std::strerror(sock.last_error()));
    }

    if (!sock.bind(SocketAddress(bind_address_, local_port))) {
        os_error = sock.last_error();
        return std::nullopt;
    }

    return sock;
}

} // namespace holepunch::net
