#pragma once

#include "holepunch/net/address.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace holepunch::traversal {

enum class EventKind {
    TraversalStarted,
    TraversalSucceeded,
    TraversalFailed,
    ListenStarted,
    ListenAccepted,
    ListenTimedOut,
    ListenFailed,
    ListenCancelled,
    AttemptStarted,
    AttemptFailed,
    AttemptRetrying,
    ConnectSucceeded,
    ConnectExhausted,
    ConnectCancelled,
    LoserClosed,
    ProbeFailed,
    PublicAddressResolved,
    AddressResolutionDegraded
};

std::string_view to_string(EventKind kind);

struct TraversalEvent {
    EventKind kind;
    std::optional<net::SocketAddress> endpoint;
    int attempt = 0;
    int max_attempts = 0;
    int os_error = 0;
    std::string detail;
};

// Receives progress events from the resolver, both halves and the
// orchestrator. Called concurrently from the two halves' threads.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void on_event(const TraversalEvent& event) = 0;
};

// Default sink: renders events through the global Logger
class LogEventSink : public EventSink {
public:
    void on_event(const TraversalEvent& event) override;

    static LogEventSink& instance();
};

} // namespace holepunch::traversal
