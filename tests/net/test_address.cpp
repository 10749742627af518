#include <catch2/catch.hpp>
#include "holepunch/net/address.hpp"
#include <cstring>
#include <arpa/inet.h>

using namespace holepunch::net;

TEST_CASE("IPv4Address parsing and operations", "[net][address]") {
    SECTION("Parse valid IPv4") {
        auto addr = IPv4Address::parse("192.168.1.1");
        REQUIRE(addr.has_value());
        REQUIRE(addr->to_string() == "192.168.1.1");
    }

    SECTION("Parse invalid IPv4") {
        REQUIRE_FALSE(IPv4Address::parse("256.1.1.1").has_value());
        REQUIRE_FALSE(IPv4Address::parse("not an ip").has_value());
        REQUIRE_FALSE(IPv4Address::parse("").has_value());
    }

    SECTION("Special addresses") {
        REQUIRE(IPv4Address::any().is_any());
        REQUIRE(IPv4Address::loopback().is_loopback());
        REQUIRE(IPv4Address(127, 10, 0, 1).is_loopback());
        REQUIRE_FALSE(IPv4Address(8, 8, 8, 8).is_loopback());
    }
}

TEST_CASE("IpAddress holds either family", "[net][address]") {
    auto v4 = IpAddress::parse("10.0.0.1");
    REQUIRE(v4.has_value());
    REQUIRE(v4->is_v4());
    REQUIRE(v4->to_string() == "10.0.0.1");

    auto v6 = IpAddress::parse("::1");
    REQUIRE(v6.has_value());
    REQUIRE(v6->is_v6());
    REQUIRE(v6->is_loopback());
    REQUIRE(IpAddress(IPv6Address::any()).is_any());

    REQUIRE(*v4 != IpAddress(IPv4Address(10, 0, 0, 2)));
    REQUIRE_FALSE(IpAddress::parse("203.0.113.7\n").has_value());
}

TEST_CASE("SocketAddress parsing", "[net][address]") {
    SECTION("Parse IPv4 socket address") {
        auto addr = SocketAddress::parse("192.168.1.1:40000");
        REQUIRE(addr.has_value());
        REQUIRE(addr->address().is_v4());
        REQUIRE(addr->port() == 40000);
    }

    SECTION("Parse IPv6 socket address") {
        auto addr = SocketAddress::parse("[::1]:40000");
        REQUIRE(addr.has_value());
        REQUIRE(addr->address().is_v6());
        REQUIRE(addr->to_string() == "[::1]:40000");
    }

    SECTION("Invalid formats") {
        REQUIRE_FALSE(SocketAddress::parse("192.168.1.1").has_value());
        REQUIRE_FALSE(SocketAddress::parse(":40000").has_value());
        REQUIRE_FALSE(SocketAddress::parse("[::1:40000").has_value());
        REQUIRE_FALSE(SocketAddress::parse("10.0.0.1:70000").has_value());
        REQUIRE_FALSE(SocketAddress::parse("10.0.0.1:12ab").has_value());
    }

    SECTION("Equality covers the port") {
        SocketAddress a(IPv4Address(10, 0, 0, 1), 1000);
        SocketAddress b(IPv4Address(10, 0, 0, 1), 1001);
        REQUIRE(a != b);
        REQUIRE(a == *SocketAddress::parse("10.0.0.1:1000"));
    }
}

TEST_CASE("SocketAddress resolve", "[net][address]") {
    SECTION("Literal needs no lookup") {
        auto addr = SocketAddress::resolve("127.0.0.1:8080");
        REQUIRE(addr.has_value());
        REQUIRE(addr->to_string() == "127.0.0.1:8080");
    }

    SECTION("Host name resolves to a loopback address") {
        auto addr = SocketAddress::resolve("localhost:8080");
        REQUIRE(addr.has_value());
        REQUIRE(addr->address().is_loopback());
        REQUIRE(addr->port() == 8080);
    }

    SECTION("Missing port fails") {
        REQUIRE_FALSE(SocketAddress::resolve("localhost").has_value());
    }
}

TEST_CASE("SocketAddress sockaddr conversion", "[net][address]") {
    SECTION("IPv4 round trip") {
        SocketAddress original(IPv4Address(192, 0, 2, 10), 4242);
        sockaddr_storage storage{};
        auto len = original.to_sockaddr(&storage);
        REQUIRE(len == sizeof(sockaddr_in));

        auto restored = SocketAddress::from_sockaddr(reinterpret_cast<sockaddr*>(&storage), len);
        REQUIRE(restored == original);
    }

    SECTION("V4-mapped IPv6 peer becomes IPv4") {
        sockaddr_in6 sin6{};
        sin6.sin6_family = AF_INET6;
        sin6.sin6_port = htons(5000);
        REQUIRE(inet_pton(AF_INET6, "::ffff:198.51.100.4", &sin6.sin6_addr) == 1);

        auto addr = SocketAddress::from_sockaddr_in6(sin6);
        REQUIRE(addr.address().is_v4());
        REQUIRE(addr.to_string() == "198.51.100.4:5000");
    }
}
