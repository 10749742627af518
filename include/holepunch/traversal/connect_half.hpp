#pragma once

#include "events.hpp"
#include "types.hpp"
#include "holepunch/core/cancellation.hpp"
#include "holepunch/net/reusable_socket.hpp"
#include <atomic>
#include <optional>

namespace holepunch::traversal {

// Active side of a simultaneous open: repeatedly connect from the shared
// local port to the remote candidate endpoint.
//
// Every attempt waits `attempt_delay`, binds a fresh socket to `local_port`,
// and runs a non-blocking connect bounded by `attempt_timeout`. Failed
// attempts are retried until `max_attempts` have been made.
class ConnectHalf {
public:
    struct Options {
        uint16_t local_port = 0;
        net::SocketAddress remote;
        Duration attempt_delay{500};
        int max_attempts = 10;
        Duration attempt_timeout{2000};
    };

    // Throws std::invalid_argument if max_attempts < 1
    ConnectHalf(Options options,
                EventSink& events,
                net::ReusableSocketFactory factory = {});

    // Blocks until connected, exhausted or cancelled
    std::optional<StreamHandle> run(const core::CancellationToken& cancel);

    // One delay-bind-connect cycle. `attempt` is 1-based.
    AttemptOutcome attempt_once(int attempt, const core::CancellationToken& cancel);

    ConnectState state() const { return state_.load(std::memory_order_acquire); }

    int attempts_made() const { return attempts_made_; }
    int refused_count() const { return refused_; }
    int timed_out_count() const { return timed_out_; }
    int os_error_count() const { return os_errors_; }

    // Status of the most recent finished attempt
    AttemptStatus last_status() const { return last_status_; }

private:
    AttemptOutcome finish(int attempt, AttemptStatus status, int os_error);

    Options options_;
    EventSink& events_;
    net::ReusableSocketFactory factory_;

    std::atomic<ConnectState> state_{ConnectState::Idle};
    int attempts_made_ = 0;
    int refused_ = 0;
    int timed_out_ = 0;
    int os_errors_ = 0;
    AttemptStatus last_status_ = AttemptStatus::OsError;
};

} // namespace holepunch::traversal
