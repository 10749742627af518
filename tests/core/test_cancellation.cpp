#include <catch2/catch.hpp>
#include "holepunch/core/cancellation.hpp"
#include <chrono>
#include <thread>
#include <poll.h>
#include <unistd.h>

using namespace holepunch::core;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

TEST_CASE("CancellationToken sleeping", "[core][cancel]") {
    CancellationToken token;

    SECTION("Uncancelled sleep runs to completion") {
        auto start = Clock::now();
        REQUIRE(token.sleep_for(50ms));
        REQUIRE(Clock::now() - start >= 50ms);
    }

    SECTION("Cancel from another thread wakes a sleeper") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(50ms);
            token.cancel();
        });

        auto start = Clock::now();
        REQUIRE_FALSE(token.sleep_for(10s));
        REQUIRE(Clock::now() - start < 5s);
        canceller.join();
    }

    SECTION("Unbounded sleep is woken by cancel") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(50ms);
            token.cancel();
        });

        REQUIRE_FALSE(token.sleep_for(std::chrono::milliseconds::max()));
        canceller.join();
    }

    SECTION("Cancel is idempotent and sticky") {
        token.cancel();
        token.cancel();
        REQUIRE(token.cancelled());
        REQUIRE_FALSE(token.sleep_for(1s));
    }
}

TEST_CASE("CancellationToken descriptor waits", "[core][cancel]") {
    CancellationToken token;
    int fds[2];
    REQUIRE(pipe(fds) == 0);

    SECTION("Times out when nothing happens") {
        REQUIRE(token.wait_fd(fds[0], POLLIN, 30ms) == WaitStatus::TimedOut);
    }

    SECTION("Ready when the descriptor is readable") {
        char byte = 'x';
        REQUIRE(write(fds[1], &byte, 1) == 1);
        REQUIRE(token.wait_fd(fds[0], POLLIN, 1s) == WaitStatus::Ready);
    }

    SECTION("Cancelled while waiting") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(50ms);
            token.cancel();
        });

        auto start = Clock::now();
        REQUIRE(token.wait_fd(fds[0], POLLIN, 10s) == WaitStatus::Cancelled);
        REQUIRE(Clock::now() - start < 5s);
        canceller.join();
    }

    SECTION("Unbounded wait still blocks until cancelled") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(50ms);
            token.cancel();
        });

        REQUIRE(token.wait_fd(fds[0], POLLIN, std::chrono::milliseconds::max()) ==
                WaitStatus::Cancelled);
        canceller.join();
    }

    SECTION("Wake descriptor becomes readable") {
        pollfd pfd{token.wake_fd(), POLLIN, 0};
        REQUIRE(poll(&pfd, 1, 0) == 0);
        token.cancel();
        REQUIRE(poll(&pfd, 1, 0) == 1);
    }

    close(fds[0]);
    close(fds[1]);
}
