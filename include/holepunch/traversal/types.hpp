#pragma once

#include "stream_handle.hpp"
#include "holepunch/net/address.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace holepunch::traversal {

using Duration = std::chrono::milliseconds;

// Upper bound for every timeout and delay; keeps deadline arithmetic on
// steady_clock far from overflow.
inline constexpr Duration max_duration = std::chrono::hours(24);

// Parameters of one simultaneous-open attempt
struct TraversalConfig {
    uint16_t local_port = 0;
    net::SocketAddress remote_endpoint;

    Duration listen_timeout{30000};
    Duration connect_attempt_delay{500};
    int max_connect_attempts = 10;
    Duration connect_attempt_timeout{2000};
    Duration overall_timeout{35000};

    // Head start given to the listener before outbound attempts begin
    Duration startup_stagger{500};

    // Throws std::invalid_argument describing the first violated constraint
    void validate() const;
};

enum class ListenState {
    Idle,
    Listening,
    Accepted,
    TimedOut,
    Errored,
    Cancelled
};

enum class ConnectState {
    Idle,
    Delay,
    Binding,
    Connecting,
    Connected,
    Exhausted,
    Cancelled
};

// Result kind of a single outbound attempt
enum class AttemptStatus {
    Connected,
    Refused,
    TimedOut,
    OsError,
    Retrying,   // Failed with attempts left; `cause` says why
    Cancelled
};

struct AttemptOutcome {
    AttemptStatus status = AttemptStatus::OsError;
    int attempt = 0;
    int os_error = 0;
    AttemptStatus cause = AttemptStatus::OsError;  // Meaningful for Retrying
    std::optional<StreamHandle> stream;            // Set only for Connected
};

enum class TraversalError {
    None,
    BindFailure,
    ListenTimeout,
    ConnectRefused,
    ConnectTimeout,
    OsLevelSocketError,
    AttemptsExhausted,
    OverallTimeout,
    Cancelled
};

std::string_view to_string(ListenState state);
std::string_view to_string(ConnectState state);
std::string_view to_string(AttemptStatus status);
std::string_view to_string(TraversalError error);

// What simultaneous_open() hands back: the winning stream, or diagnostics
// explaining why there is none.
struct TraversalResult {
    std::optional<StreamHandle> stream;
    TraversalError error = TraversalError::None;

    ListenState listen_state = ListenState::Idle;
    ConnectState connect_state = ConnectState::Idle;
    int connect_attempts = 0;
    int refused_attempts = 0;
    int timed_out_attempts = 0;
    int listen_os_error = 0;

    std::chrono::steady_clock::duration elapsed{};

    bool succeeded() const { return stream.has_value(); }
    explicit operator bool() const { return succeeded(); }

    // True when the remote host actively rejected us rather than staying silent
    bool peer_refused() const { return refused_attempts > 0; }

    // Operator-facing summary
    std::string describe() const;
};

} // namespace holepunch::traversal
