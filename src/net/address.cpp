#include "holepunch/net/address.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <cstring>
#include <sstream>
#include <charconv>
#include <memory>

namespace holepunch::net {

namespace {

std::optional<uint16_t> parse_port(std::string_view str) {
    if (str.empty()) return std::nullopt;

    uint16_t port;
    auto result = std::from_chars(str.data(), str.data() + str.size(), port);
    if (result.ec != std::errc{} || result.ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return port;
}

// Split "host:port" / "[host]:port" into its parts
std::optional<std::pair<std::string_view, std::string_view>> split_host_port(std::string_view str) {
    if (!str.empty() && str[0] == '[') {
        auto close_bracket = str.find(']');
        if (close_bracket == std::string_view::npos) {
            return std::nullopt;
        }
        auto rest = str.substr(close_bracket + 1);
        if (rest.empty() || rest[0] != ':') {
            return std::nullopt;
        }
        return std::make_pair(str.substr(1, close_bracket - 1), rest.substr(1));
    }

    auto colon = str.rfind(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(str.substr(0, colon), str.substr(colon + 1));
}

} // anonymous namespace

// IPv4Address implementation

IPv4Address::IPv4Address(uint32_t addr) {
    addr_[0] = static_cast<uint8_t>((addr >> 24) & 0xFF);
    addr_[1] = static_cast<uint8_t>((addr >> 16) & 0xFF);
    addr_[2] = static_cast<uint8_t>((addr >> 8) & 0xFF);
    addr_[3] = static_cast<uint8_t>(addr & 0xFF);
}

IPv4Address::IPv4Address(uint8_t a, uint8_t b, uint8_t c, uint8_t d) {
    addr_[0] = a;
    addr_[1] = b;
    addr_[2] = c;
    addr_[3] = d;
}

std::optional<IPv4Address> IPv4Address::parse(std::string_view str) {
    in_addr addr;
    std::string str_copy(str);
    if (inet_pton(AF_INET, str_copy.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return IPv4Address(ntohl(addr.s_addr));
}

uint32_t IPv4Address::to_uint32() const {
    return (static_cast<uint32_t>(addr_[0]) << 24) |
           (static_cast<uint32_t>(addr_[1]) << 16) |
           (static_cast<uint32_t>(addr_[2]) << 8) |
           static_cast<uint32_t>(addr_[3]);
}

std::string IPv4Address::to_string() const {
    std::ostringstream oss;
    oss << static_cast<int>(addr_[0]) << "."
        << static_cast<int>(addr_[1]) << "."
        << static_cast<int>(addr_[2]) << "."
        << static_cast<int>(addr_[3]);
    return oss.str();
}

// IPv6Address implementation

IPv6Address::IPv6Address(const std::array<uint8_t, 16>& bytes) : addr_(bytes) {}

IPv6Address::IPv6Address(const uint8_t* bytes) {
    std::memcpy(addr_.data(), bytes, 16);
}

std::optional<IPv6Address> IPv6Address::parse(std::string_view str) {
    in6_addr addr;
    std::string str_copy(str);
    if (inet_pton(AF_INET6, str_copy.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return IPv6Address(addr.s6_addr);
}

IPv6Address IPv6Address::any() {
    return IPv6Address(std::array<uint8_t, 16>{});
}

IPv6Address IPv6Address::loopback() {
    std::array<uint8_t, 16> addr{};
    addr[15] = 1;
    return IPv6Address(addr);
}

std::string IPv6Address::to_string() const {
    char buf[INET6_ADDRSTRLEN];
    in6_addr addr;
    std::memcpy(addr.s6_addr, addr_.data(), 16);
    inet_ntop(AF_INET6, &addr, buf, sizeof(buf));
    return buf;
}

bool IPv6Address::is_any() const {
    for (auto b : addr_) {
        if (b != 0) return false;
    }
    return true;
}

bool IPv6Address::is_loopback() const {
    for (size_t i = 0; i < 15; ++i) {
        if (addr_[i] != 0) return false;
    }
    return addr_[15] == 1;
}

bool IPv6Address::is_v4_mapped() const {
    // ::ffff:x.x.x.x
    for (size_t i = 0; i < 10; ++i) {
        if (addr_[i] != 0) return false;
    }
    return addr_[10] == 0xFF && addr_[11] == 0xFF;
}

std::optional<IPv4Address> IPv6Address::to_v4() const {
    if (!is_v4_mapped()) return std::nullopt;
    return IPv4Address(addr_[12], addr_[13], addr_[14], addr_[15]);
}

// IpAddress implementation

std::optional<IpAddress> IpAddress::parse(std::string_view str) {
    if (auto v4 = IPv4Address::parse(str)) {
        return IpAddress(*v4);
    }
    if (auto v6 = IPv6Address::parse(str)) {
        return IpAddress(*v6);
    }
    return std::nullopt;
}

std::string IpAddress::to_string() const {
    if (is_v4()) {
        return as_v4().to_string();
    }
    return as_v6().to_string();
}

// SocketAddress implementation

SocketAddress::SocketAddress(IpAddress addr, uint16_t port)
    : addr_(addr), port_(port) {}

SocketAddress::SocketAddress(IPv4Address addr, uint16_t port)
    : addr_(addr), port_(port) {}

SocketAddress::SocketAddress(IPv6Address addr, uint16_t port)
    : addr_(addr), port_(port) {}

std::optional<SocketAddress> SocketAddress::parse(std::string_view str) {
    auto parts = split_host_port(str);
    if (!parts) return std::nullopt;

    bool bracketed = !str.empty() && str[0] == '[';
    std::optional<IpAddress> ip;
    if (bracketed) {
        if (auto v6 = IPv6Address::parse(parts->first)) ip = IpAddress(*v6);
    } else {
        ip = IpAddress::parse(parts->first);
    }
    if (!ip) return std::nullopt;

    auto port = parse_port(parts->second);
    if (!port) return std::nullopt;

    return SocketAddress(*ip, *port);
}

std::optional<SocketAddress> SocketAddress::resolve(std::string_view str) {
    if (auto literal = parse(str)) {
        return literal;
    }

    auto parts = split_host_port(str);
    if (!parts || parts->first.empty()) return std::nullopt;

    auto port = parse_port(parts->second);
    if (!port) return std::nullopt;

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    std::string host(parts->first);
    if (getaddrinfo(host.c_str(), nullptr, &hints, &raw) != 0 || raw == nullptr) {
        return std::nullopt;
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> results(raw, &freeaddrinfo);

    // Prefer IPv4: simultaneous open is bound to 0.0.0.0
    const addrinfo* chosen = nullptr;
    for (auto* ai = results.get(); ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_family == AF_INET) {
            chosen = ai;
            break;
        }
        if (!chosen && ai->ai_family == AF_INET6) {
            chosen = ai;
        }
    }
    if (!chosen) return std::nullopt;

    auto addr = from_sockaddr(chosen->ai_addr, chosen->ai_addrlen);
    return SocketAddress(addr.address(), *port);
}

SocketAddress SocketAddress::from_sockaddr(const sockaddr* addr, socklen_t len) {
    if (addr->sa_family == AF_INET && len >= sizeof(sockaddr_in)) {
        return from_sockaddr_in(*reinterpret_cast<const sockaddr_in*>(addr));
    } else if (addr->sa_family == AF_INET6 && len >= sizeof(sockaddr_in6)) {
        return from_sockaddr_in6(*reinterpret_cast<const sockaddr_in6*>(addr));
    }
    return SocketAddress();
}

SocketAddress SocketAddress::from_sockaddr_in(const sockaddr_in& addr) {
    return SocketAddress(
        IPv4Address(ntohl(addr.sin_addr.s_addr)),
        ntohs(addr.sin_port)
    );
}

SocketAddress SocketAddress::from_sockaddr_in6(const sockaddr_in6& addr) {
    IPv6Address v6(addr.sin6_addr.s6_addr);
    // Report v4-mapped peers of dual-stack sockets as plain IPv4
    if (auto v4 = v6.to_v4()) {
        return SocketAddress(*v4, ntohs(addr.sin6_port));
    }
    return SocketAddress(v6, ntohs(addr.sin6_port));
}

std::string SocketAddress::to_string() const {
    if (addr_.is_v6()) {
        return "[" + addr_.to_string() + "]:" + std::to_string(port_);
    }
    return addr_.to_string() + ":" + std::to_string(port_);
}

socklen_t SocketAddress::to_sockaddr(sockaddr_storage* storage) const {
    std::memset(storage, 0, sizeof(*storage));

    if (addr_.is_v4()) {
        auto* sin = reinterpret_cast<sockaddr_in*>(storage);
        sin->sin_family = AF_INET;
        sin->sin_port = htons(port_);
        sin->sin_addr.s_addr = htonl(addr_.as_v4().to_uint32());
        return sizeof(sockaddr_in);
    } else {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(storage);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port_);
        std::memcpy(sin6->sin6_addr.s6_addr, addr_.as_v6().bytes().data(), 16);
        return sizeof(sockaddr_in6);
    }
}

} // namespace holepunch::net
