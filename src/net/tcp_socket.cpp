#include "holepunch/net/tcp_socket.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <cerrno>

namespace holepunch::net {

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : fd_(other.fd_), last_error_(other.last_error_) {
    other.fd_ = -1;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        last_error_ = other.last_error_;
        other.fd_ = -1;
    }
    return *this;
}

TcpSocket::~TcpSocket() {
    close();
}

bool TcpSocket::fail() {
    last_error_ = errno;
    return false;
}

bool TcpSocket::open(int family) {
    if (fd_ >= 0) return true;

    fd_ = socket(family, SOCK_STREAM, 0);
    if (fd_ < 0) return fail();

    return true;
}

bool TcpSocket::set_reuse_address(bool enable) {
    int value = enable ? 1 : 0;
    if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &value, sizeof(value)) < 0) {
        return fail();
    }
    return true;
}

bool TcpSocket::set_reuse_port(bool enable) {
#ifdef SO_REUSEPORT
    int value = enable ? 1 : 0;
    if (setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &value, sizeof(value)) < 0) {
        return fail();
    }
    return true;
#else
    (void)enable;
    last_error_ = ENOPROTOOPT;
    return false;
#endif
}

bool TcpSocket::bind(const SocketAddress& addr) {
    sockaddr_storage storage;
    socklen_t len = addr.to_sockaddr(&storage);

    if (::bind(fd_, reinterpret_cast<sockaddr*>(&storage), len) < 0) {
        return fail();
    }
    return true;
}

bool TcpSocket::listen(int backlog) {
    if (::listen(fd_, backlog) < 0) {
        return fail();
    }
    return true;
}

std::optional<TcpSocket> TcpSocket::accept(SocketAddress* peer) {
    sockaddr_storage storage;
    socklen_t len = sizeof(storage);

    int client = ::accept(fd_, reinterpret_cast<sockaddr*>(&storage), &len);
    if (client < 0) {
        last_error_ = errno;
        return std::nullopt;
    }

    if (peer) {
        *peer = SocketAddress::from_sockaddr(reinterpret_cast<sockaddr*>(&storage), len);
    }
    return TcpSocket(client);
}

ConnectStart TcpSocket::connect(const SocketAddress& to) {
    sockaddr_storage storage;
    socklen_t len = to.to_sockaddr(&storage);

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&storage), len) == 0) {
        return ConnectStart::Connected;
    }

    last_error_ = errno;
    if (errno == EINPROGRESS || errno == EINTR) {
        return ConnectStart::InProgress;
    }
    return ConnectStart::Failed;
}

int TcpSocket::pending_error() {
    int error = 0;
    socklen_t len = sizeof(error);
    if (getsockopt(fd_, SOL_SOCKET, SO_ERROR, &error, &len) < 0) {
        error = errno;
    }
    if (error != 0) {
        last_error_ = error;
    }
    return error;
}

bool TcpSocket::set_nonblocking(bool nonblocking) {
    int flags = fcntl(fd_, F_GETFL, 0);
    if (flags < 0) return fail();

    if (nonblocking) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }

    if (fcntl(fd_, F_SETFL, flags) != 0) return fail();
    return true;
}

bool TcpSocket::set_nodelay(bool enable) {
    int value = enable ? 1 : 0;
    if (setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &value, sizeof(value)) < 0) {
        return fail();
    }
    return true;
}

bool TcpSocket::shutdown_write() {
    if (::shutdown(fd_, SHUT_WR) < 0) {
        return fail();
    }
    return true;
}

ssize_t TcpSocket::send(std::span<const uint8_t> data) {
    ssize_t sent = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
    if (sent < 0) last_error_ = errno;
    return sent;
}

bool TcpSocket::send_all(std::span<const uint8_t> data) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t sent = send(data.subspan(offset));
        if (sent < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        offset += static_cast<size_t>(sent);
    }
    return true;
}

ssize_t TcpSocket::recv(std::span<uint8_t> buffer) {
    ssize_t received = ::recv(fd_, buffer.data(), buffer.size(), 0);
    if (received < 0) last_error_ = errno;
    return received;
}

std::optional<SocketAddress> TcpSocket::local_address() const {
    if (fd_ < 0) return std::nullopt;

    sockaddr_storage storage;
    socklen_t len = sizeof(storage);
    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&storage), &len) < 0) {
        return std::nullopt;
    }
    return SocketAddress::from_sockaddr(reinterpret_cast<sockaddr*>(&storage), len);
}

std::optional<SocketAddress> TcpSocket::peer_address() const {
    if (fd_ < 0) return std::nullopt;

    sockaddr_storage storage;
    socklen_t len = sizeof(storage);
    if (getpeername(fd_, reinterpret_cast<sockaddr*>(&storage), &len) < 0) {
        return std::nullopt;
    }
    return SocketAddress::from_sockaddr(reinterpret_cast<sockaddr*>(&storage), len);
}

void TcpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace holepunch::net
