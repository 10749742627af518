#include <catch2/catch.hpp>
#include "holepunch/traversal/connect_half.hpp"
#include "traversal/test_support.hpp"
#include <cerrno>
#include <stdexcept>

using namespace holepunch;
using namespace holepunch::traversal;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

namespace {

ConnectHalf::Options fast_options(net::SocketAddress remote, int max_attempts) {
    ConnectHalf::Options options;
    options.local_port = test::free_port();
    options.remote = remote;
    options.attempt_delay = 10ms;
    options.max_attempts = max_attempts;
    options.attempt_timeout = 1000ms;
    return options;
}

net::SocketAddress refused_endpoint() {
    return net::SocketAddress(net::IPv4Address::loopback(), test::free_port());
}

} // anonymous namespace

TEST_CASE("ConnectHalf requires at least one attempt", "[traversal][connect]") {
    test::RecordingSink sink;
    REQUIRE_THROWS_AS(ConnectHalf(fast_options(refused_endpoint(), 0), sink),
                      std::invalid_argument);
}

TEST_CASE("ConnectHalf reaches a listening peer", "[traversal][connect]") {
    test::RecordingSink sink;
    core::CancellationToken cancel;
    auto listener = test::loopback_listener();
    auto remote = *listener.local_address();

    auto options = fast_options(remote, 3);
    ConnectHalf connect(options, sink);
    auto stream = connect.run(cancel);

    REQUIRE(stream.has_value());
    CHECK(stream->path() == TraversalPath::Connect);
    CHECK(stream->remote_endpoint() == remote);
    CHECK(stream->local_endpoint().port() == options.local_port);
    CHECK(connect.state() == ConnectState::Connected);
    CHECK(connect.attempts_made() == 1);
    CHECK(connect.last_status() == AttemptStatus::Connected);
    CHECK(sink.count(EventKind::ConnectSucceeded) == 1);

    // The peer sees our shared local port as the source
    net::SocketAddress peer;
    auto accepted = listener.accept(&peer);
    REQUIRE(accepted.has_value());
    CHECK(peer.port() == options.local_port);
}

TEST_CASE("ConnectHalf exhausts its attempts", "[traversal][connect]") {
    test::RecordingSink sink;
    core::CancellationToken cancel;

    ConnectHalf connect(fast_options(refused_endpoint(), 3), sink);

    auto start = Clock::now();
    auto stream = connect.run(cancel);

    REQUIRE_FALSE(stream.has_value());
    CHECK(Clock::now() - start < 5s);
    CHECK(connect.state() == ConnectState::Exhausted);
    CHECK(connect.attempts_made() == 3);
    CHECK(connect.refused_count() == 3);
    CHECK(connect.timed_out_count() == 0);
    CHECK(connect.last_status() == AttemptStatus::Refused);

    CHECK(sink.count(EventKind::AttemptStarted) == 3);
    CHECK(sink.count(EventKind::AttemptFailed) == 3);
    CHECK(sink.count(EventKind::AttemptRetrying) == 2);
    CHECK(sink.count(EventKind::ConnectExhausted) == 1);

    auto events = sink.events();
    int expected = 1;
    for (const auto& event : events) {
        if (event.kind == EventKind::AttemptStarted) {
            CHECK(event.attempt == expected);
            CHECK(event.max_attempts == 3);
            ++expected;
        }
    }
}

TEST_CASE("ConnectHalf attempt outcomes", "[traversal][connect]") {
    test::RecordingSink sink;
    core::CancellationToken cancel;
    ConnectHalf connect(fast_options(refused_endpoint(), 2), sink);

    SECTION("Failure with attempts left is a retry") {
        auto outcome = connect.attempt_once(1, cancel);
        CHECK(outcome.status == AttemptStatus::Retrying);
        CHECK(outcome.cause == AttemptStatus::Refused);
        CHECK(outcome.attempt == 1);
        CHECK_FALSE(outcome.stream.has_value());
    }

    SECTION("Failure on the last attempt is final") {
        auto outcome = connect.attempt_once(2, cancel);
        CHECK(outcome.status == AttemptStatus::Refused);
        CHECK(outcome.os_error == ECONNREFUSED);
    }

    SECTION("Cancelled during the delay") {
        cancel.cancel();
        auto outcome = connect.attempt_once(1, cancel);
        CHECK(outcome.status == AttemptStatus::Cancelled);
        CHECK(connect.attempts_made() == 0);
    }
}

TEST_CASE("ConnectHalf stops when cancelled", "[traversal][connect]") {
    test::RecordingSink sink;
    core::CancellationToken cancel;

    auto options = fast_options(refused_endpoint(), 100);
    options.attempt_delay = 200ms;
    ConnectHalf connect(options, sink);

    std::thread canceller([&] {
        std::this_thread::sleep_for(300ms);
        cancel.cancel();
    });

    auto start = Clock::now();
    auto stream = connect.run(cancel);
    canceller.join();

    REQUIRE_FALSE(stream.has_value());
    CHECK(Clock::now() - start < 3s);
    CHECK(connect.state() == ConnectState::Cancelled);
    CHECK(connect.attempts_made() < 100);
    CHECK(sink.count(EventKind::ConnectCancelled) == 1);
}
