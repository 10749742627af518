#include "holepunch/net/udp_socket.hpp"
#include <unistd.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <cerrno>

namespace holepunch::net {

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : fd_(other.fd_), last_error_(other.last_error_) {
    other.fd_ = -1;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        last_error_ = other.last_error_;
        other.fd_ = -1;
    }
    return *this;
}

UdpSocket::~UdpSocket() {
    close();
}

bool UdpSocket::connect(const SocketAddress& to) {
    if (fd_ < 0) {
        fd_ = socket(to.address().is_v4() ? AF_INET : AF_INET6, SOCK_DGRAM, 0);
        if (fd_ < 0) {
            last_error_ = errno;
            return false;
        }
    }

    sockaddr_storage storage;
    socklen_t len = to.to_sockaddr(&storage);

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&storage), len) < 0) {
        last_error_ = errno;
        return false;
    }

    return true;
}

std::optional<SocketAddress> UdpSocket::local_address() const {
    if (fd_ < 0) return std::nullopt;

    sockaddr_storage storage;
    socklen_t len = sizeof(storage);

    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&storage), &len) < 0) {
        return std::nullopt;
    }

    return SocketAddress::from_sockaddr(reinterpret_cast<sockaddr*>(&storage), len);
}

void UdpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace holepunch::net
