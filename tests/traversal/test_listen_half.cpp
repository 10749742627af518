#include <catch2/catch.hpp>
#include "holepunch/traversal/listen_half.hpp"
#include "traversal/test_support.hpp"
#include <cerrno>
#include <future>

using namespace holepunch;
using namespace holepunch::traversal;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

TEST_CASE("ListenHalf accepts one inbound connection", "[traversal][listen]") {
    test::RecordingSink sink;
    core::CancellationToken cancel;
    uint16_t port = test::free_port();

    ListenHalf listen(port, 5000ms, sink);
    REQUIRE(listen.state() == ListenState::Idle);

    auto pending = std::async(std::launch::async, [&] { return listen.run(cancel); });
    REQUIRE(test::wait_until([&] { return listen.state() == ListenState::Listening; }, 2s));

    net::TcpSocket client;
    REQUIRE(client.open(AF_INET));
    REQUIRE(client.connect(net::SocketAddress(net::IPv4Address::loopback(), port)) ==
            net::ConnectStart::Connected);

    auto stream = pending.get();
    REQUIRE(stream.has_value());
    CHECK(stream->path() == TraversalPath::Listen);
    CHECK(stream->remote_endpoint() == *client.local_address());
    CHECK(stream->local_endpoint().port() == port);
    CHECK(listen.state() == ListenState::Accepted);
    CHECK(sink.count(EventKind::ListenStarted) == 1);
    CHECK(sink.count(EventKind::ListenAccepted) == 1);

    // The stream is usable in blocking mode
    std::vector<uint8_t> hello = {'h', 'i'};
    REQUIRE(client.send_all(hello));
    std::vector<uint8_t> buffer(8);
    REQUIRE(stream->read_some(buffer) == 2);

    // The listening socket is gone: a second connection is refused
    net::TcpSocket late;
    REQUIRE(late.open(AF_INET));
    CHECK(late.connect(net::SocketAddress(net::IPv4Address::loopback(), port)) ==
          net::ConnectStart::Failed);
}

TEST_CASE("ListenHalf gives up after its timeout", "[traversal][listen]") {
    test::RecordingSink sink;
    core::CancellationToken cancel;

    ListenHalf listen(test::free_port(), 200ms, sink);

    auto start = Clock::now();
    auto stream = listen.run(cancel);
    auto elapsed = Clock::now() - start;

    REQUIRE_FALSE(stream.has_value());
    CHECK(listen.state() == ListenState::TimedOut);
    CHECK(elapsed >= 200ms);
    CHECK(elapsed < 2s);
    CHECK(sink.count(EventKind::ListenTimedOut) == 1);
}

TEST_CASE("ListenHalf reports bind failure", "[traversal][listen]") {
    test::RecordingSink sink;
    core::CancellationToken cancel;
    uint16_t port = test::free_port();

    net::TcpSocket occupant;
    REQUIRE(occupant.open(AF_INET));
    REQUIRE(occupant.bind(net::SocketAddress(net::IPv4Address::any(), port)));
    REQUIRE(occupant.listen(1));

    ListenHalf listen(port, 5000ms, sink);
    auto stream = listen.run(cancel);

    REQUIRE_FALSE(stream.has_value());
    CHECK(listen.state() == ListenState::Errored);
    CHECK(listen.bind_failed());
    CHECK(listen.os_error() == EADDRINUSE);
    CHECK(sink.count(EventKind::ListenFailed) == 1);
}

TEST_CASE("ListenHalf stops when cancelled", "[traversal][listen]") {
    test::RecordingSink sink;
    core::CancellationToken cancel;

    ListenHalf listen(test::free_port(), 30000ms, sink);
    auto pending = std::async(std::launch::async, [&] { return listen.run(cancel); });
    REQUIRE(test::wait_until([&] { return listen.state() == ListenState::Listening; }, 2s));

    auto start = Clock::now();
    cancel.cancel();
    auto stream = pending.get();

    REQUIRE_FALSE(stream.has_value());
    CHECK(Clock::now() - start < 2s);
    CHECK(listen.state() == ListenState::Cancelled);
    CHECK(sink.count(EventKind::ListenCancelled) == 1);
}
