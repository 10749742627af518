#include <catch2/catch.hpp>
#include "holepunch/traversal/types.hpp"
#include <stdexcept>
#include <string>

using namespace holepunch::traversal;
using namespace holepunch::net;
using namespace std::chrono_literals;

namespace {

TraversalConfig valid_config() {
    TraversalConfig config;
    config.local_port = 40000;
    config.remote_endpoint = SocketAddress(IPv4Address(203, 0, 113, 7), 40000);
    return config;
}

} // anonymous namespace

TEST_CASE("TraversalConfig validate", "[traversal][config]") {
    auto config = valid_config();
    REQUIRE_NOTHROW(config.validate());

    SECTION("Local port required") {
        config.local_port = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Remote port required") {
        config.remote_endpoint = SocketAddress(IPv4Address(203, 0, 113, 7), 0);
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Remote address must be concrete") {
        config.remote_endpoint = SocketAddress(IPv4Address::any(), 40000);
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Zero attempts") {
        config.max_connect_attempts = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Non-positive timeouts") {
        config.listen_timeout = 0ms;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Durations are capped at a day") {
        config.overall_timeout = max_duration;
        REQUIRE_NOTHROW(config.validate());
        config.overall_timeout = Duration::max();
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.overall_timeout = 35s;
        config.startup_stagger = max_duration + 1ms;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Negative delay") {
        config.connect_attempt_delay = -5ms;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }
}

TEST_CASE("TraversalResult describe", "[traversal][result]") {
    TraversalResult result;
    REQUIRE_FALSE(result.succeeded());
    REQUIRE_FALSE(static_cast<bool>(result));

    SECTION("Refusals are told apart from silence") {
        result.error = TraversalError::ConnectRefused;
        result.connect_attempts = 3;
        result.refused_attempts = 3;
        REQUIRE(result.peer_refused());
        REQUIRE(result.describe().find("refused every connection attempt") != std::string::npos);
    }

    SECTION("Timeouts read as nobody answering") {
        result.error = TraversalError::ConnectTimeout;
        result.connect_attempts = 2;
        result.timed_out_attempts = 2;
        REQUIRE_FALSE(result.peer_refused());
        REQUIRE(result.describe().find("nobody answered") != std::string::npos);
    }

    SECTION("Counts are included") {
        result.error = TraversalError::AttemptsExhausted;
        result.connect_attempts = 5;
        result.refused_attempts = 2;
        result.timed_out_attempts = 3;
        auto text = result.describe();
        REQUIRE(text.find("5 attempt(s)") != std::string::npos);
        REQUIRE(text.find("attempts exhausted") != std::string::npos);
    }
}

TEST_CASE("Enum names", "[traversal][result]") {
    REQUIRE(to_string(TraversalError::BindFailure) == "bind failure");
    REQUIRE(to_string(ListenState::TimedOut) == "timed out");
    REQUIRE(to_string(ConnectState::Exhausted) == "exhausted");
    REQUIRE(to_string(AttemptStatus::Refused) == "refused");
    REQUIRE(to_string(TraversalPath::Listen) == "listen");
}
