#include "holepunch/traversal/types.hpp"
#include <format>
#include <initializer_list>
#include <stdexcept>
#include <cstring>

namespace holepunch::traversal {

void TraversalConfig::validate() const {
    if (local_port == 0) {
        throw std::invalid_argument("local port must be non-zero");
    }
    if (remote_endpoint.port() == 0) {
        throw std::invalid_argument("remote endpoint port must be non-zero");
    }
    if (remote_endpoint.address().is_any()) {
        throw std::invalid_argument("remote endpoint address must not be unspecified");
    }
    if (max_connect_attempts < 1) {
        throw std::invalid_argument("max connect attempts must be at least 1");
    }
    if (listen_timeout.count() <= 0) {
        throw std::invalid_argument("listen timeout must be positive");
    }
    if (connect_attempt_timeout.count() <= 0) {
        throw std::invalid_argument("connect attempt timeout must be positive");
    }
    if (overall_timeout.count() <= 0) {
        throw std::invalid_argument("overall timeout must be positive");
    }
    if (connect_attempt_delay.count() < 0 || startup_stagger.count() < 0) {
        throw std::invalid_argument("delays must not be negative");
    }
    for (Duration value : {listen_timeout, connect_attempt_delay, connect_attempt_timeout,
                           overall_timeout, startup_stagger}) {
        if (value > max_duration) {
            throw std::invalid_argument("timeouts and delays must not exceed 24 hours");
        }
    }
}

std::string_view to_string(ListenState state) {
    switch (state) {
        case ListenState::Idle: return "idle";
        case ListenState::Listening: return "listening";
        case ListenState::Accepted: return "accepted";
        case ListenState::TimedOut: return "timed out";
        case ListenState::Errored: return "errored";
        case ListenState::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string_view to_string(ConnectState state) {
    switch (state) {
        case ConnectState::Idle: return "idle";
        case ConnectState::Delay: return "delay";
        case ConnectState::Binding: return "binding";
        case ConnectState::Connecting: return "connecting";
        case ConnectState::Connected: return "connected";
        case ConnectState::Exhausted: return "exhausted";
        case ConnectState::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string_view to_string(AttemptStatus status) {
    switch (status) {
        case AttemptStatus::Connected: return "connected";
        case AttemptStatus::Refused: return "refused";
        case AttemptStatus::TimedOut: return "timed out";
        case AttemptStatus::OsError: return "os error";
        case AttemptStatus::Retrying: return "retrying";
        case AttemptStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string_view to_string(TraversalError error) {
    switch (error) {
        case TraversalError::None: return "none";
        case TraversalError::BindFailure: return "bind failure";
        case TraversalError::ListenTimeout: return "listen timeout";
        case TraversalError::ConnectRefused: return "connect refused";
        case TraversalError::ConnectTimeout: return "connect timeout";
        case TraversalError::OsLevelSocketError: return "socket error";
        case TraversalError::AttemptsExhausted: return "attempts exhausted";
        case TraversalError::OverallTimeout: return "overall timeout";
        case TraversalError::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string TraversalResult::describe() const {
    if (stream) {
        return std::format("connected via {} path: {} -> {}",
                           to_string(stream->path()),
                           stream->local_endpoint().to_string(),
                           stream->remote_endpoint().to_string());
    }

    std::string summary;
    switch (error) {
        case TraversalError::ConnectRefused:
            summary = "peer explicitly refused every connection attempt";
            break;
        case TraversalError::ConnectTimeout:
        case TraversalError::ListenTimeout:
        case TraversalError::OverallTimeout:
            summary = "nobody answered";
            break;
        case TraversalError::BindFailure:
            summary = std::format("could not bind local port: {}",
                                  std::strerror(listen_os_error));
            break;
        case TraversalError::Cancelled:
            summary = "traversal cancelled";
            break;
        default:
            summary = "traversal failed";
            break;
    }

    return std::format("{} ({}; listen {}, connect {} after {} attempt(s), {} refused, {} timed out)",
                       summary, to_string(error),
                       to_string(listen_state), to_string(connect_state),
                       connect_attempts, refused_attempts, timed_out_attempts);
}

} // namespace holepunch::traversal
