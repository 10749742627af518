#include <catch2/catch.hpp>
#include "holepunch/net/reusable_socket.hpp"
#include "holepunch/net/tcp_socket.hpp"
#include "traversal/test_support.hpp"
#include <cerrno>
#include <string>
#include <vector>

using namespace holepunch::net;
using holepunch::test::free_port;
using holepunch::test::loopback_listener;

TEST_CASE("TcpSocket basic operations", "[net][tcp]") {
    SECTION("Connect and exchange bytes over loopback") {
        auto listener = loopback_listener();
        auto server_addr = listener.local_address();
        REQUIRE(server_addr.has_value());

        TcpSocket client;
        REQUIRE(client.open(AF_INET));
        REQUIRE(client.connect(*server_addr) == ConnectStart::Connected);

        SocketAddress peer;
        auto accepted = listener.accept(&peer);
        REQUIRE(accepted.has_value());
        REQUIRE(peer == *client.local_address());

        std::vector<uint8_t> message = {'p', 'u', 'n', 'c', 'h'};
        REQUIRE(client.send_all(message));

        std::vector<uint8_t> buffer(16);
        auto received = accepted->recv(buffer);
        REQUIRE(received == static_cast<ssize_t>(message.size()));
        buffer.resize(static_cast<size_t>(received));
        REQUIRE(buffer == message);
    }

    SECTION("Half-close is seen as end of stream") {
        auto listener = loopback_listener();
        TcpSocket client;
        REQUIRE(client.open(AF_INET));
        REQUIRE(client.connect(*listener.local_address()) == ConnectStart::Connected);
        auto accepted = listener.accept();
        REQUIRE(accepted.has_value());

        REQUIRE(client.shutdown_write());

        std::vector<uint8_t> buffer(4);
        REQUIRE(accepted->recv(buffer) == 0);
    }

    SECTION("Non-blocking accept with nothing pending") {
        auto listener = loopback_listener();
        REQUIRE(listener.set_nonblocking(true));
        REQUIRE_FALSE(listener.accept().has_value());
        REQUIRE((listener.last_error() == EAGAIN || listener.last_error() == EWOULDBLOCK));
    }

    SECTION("Refused connect is reported") {
        TcpSocket client;
        REQUIRE(client.open(AF_INET));
        auto started = client.connect(SocketAddress(IPv4Address::loopback(), free_port()));
        REQUIRE(started == ConnectStart::Failed);
        REQUIRE(client.last_error() == ECONNREFUSED);
    }

    SECTION("Move semantics") {
        TcpSocket sock1;
        REQUIRE(sock1.open(AF_INET));
        int fd = sock1.fd();

        TcpSocket sock2 = std::move(sock1);
        REQUIRE_FALSE(sock1.is_open());
        REQUIRE(sock2.is_open());
        REQUIRE(sock2.fd() == fd);

        sock2.close();
        REQUIRE_FALSE(sock2.is_open());
    }
}

TEST_CASE("ReusableSocketFactory shares one local port", "[net][reuse]") {
    ReusableSocketFactory factory;
    uint16_t port = free_port();

    SECTION("Listener and outbound socket bind the same port") {
        int error = 0;
        auto listener = factory.create(port, error);
        REQUIRE(listener.has_value());
        REQUIRE(listener->listen(1));

        auto outbound = factory.create(port, error);
        REQUIRE(outbound.has_value());
        REQUIRE(outbound->local_address()->port() == port);

        // The outbound socket can reach a third party from the shared port
        auto remote = loopback_listener();
        REQUIRE(outbound->connect(*remote.local_address()) == ConnectStart::Connected);

        SocketAddress peer;
        auto accepted = remote.accept(&peer);
        REQUIRE(accepted.has_value());
        REQUIRE(peer.port() == port);
    }

    SECTION("Port held by a plain listener cannot be bound") {
        TcpSocket occupant;
        REQUIRE(occupant.open(AF_INET));
        REQUIRE(occupant.bind(SocketAddress(IPv4Address::any(), port)));
        REQUIRE(occupant.listen(1));

        int error = 0;
        auto sock = factory.create(port, error);
        REQUIRE_FALSE(sock.has_value());
        REQUIRE(error == EADDRINUSE);
    }

    SECTION("Bind address is configurable") {
        ReusableSocketFactory loopback(IPv4Address::loopback());
        int error = 0;
        auto sock = loopback.create(port, error);
        REQUIRE(sock.has_value());
        REQUIRE(sock->local_address()->address() == IpAddress(IPv4Address::loopback()));
    }
}
