#include "holepunch/traversal/events.hpp"
#include "holepunch/util/logger.hpp"
#include <cstring>

namespace holepunch::traversal {

namespace {

std::string endpoint_string(const TraversalEvent& event) {
    return event.endpoint ? event.endpoint->to_string() : std::string("-");
}

std::string error_string(int os_error) {
    return os_error != 0 ? std::strerror(os_error) : std::string("no error");
}

} // anonymous namespace

std::string_view to_string(EventKind kind) {
    switch (kind) {
        case EventKind::TraversalStarted: return "traversal-started";
        case EventKind::TraversalSucceeded: return "traversal-succeeded";
        case EventKind::TraversalFailed: return "traversal-failed";
        case EventKind::ListenStarted: return "listen-started";
        case EventKind::ListenAccepted: return "listen-accepted";
        case EventKind::ListenTimedOut: return "listen-timed-out";
        case EventKind::ListenFailed: return "listen-failed";
        case EventKind::ListenCancelled: return "listen-cancelled";
        case EventKind::AttemptStarted: return "attempt-started";
        case EventKind::AttemptFailed: return "attempt-failed";
        case EventKind::AttemptRetrying: return "attempt-retrying";
        case EventKind::ConnectSucceeded: return "connect-succeeded";
        case EventKind::ConnectExhausted: return "connect-exhausted";
        case EventKind::ConnectCancelled: return "connect-cancelled";
        case EventKind::LoserClosed: return "loser-closed";
        case EventKind::ProbeFailed: return "probe-failed";
        case EventKind::PublicAddressResolved: return "public-address-resolved";
        case EventKind::AddressResolutionDegraded: return "address-resolution-degraded";
    }
    return "unknown";
}

LogEventSink& LogEventSink::instance() {
    static LogEventSink sink;
    return sink;
}

void LogEventSink::on_event(const TraversalEvent& event) {
    switch (event.kind) {
        case EventKind::TraversalStarted:
            LOG_INFO("Simultaneous open to {}: {}", endpoint_string(event), event.detail);
            break;
        case EventKind::TraversalSucceeded:
            LOG_INFO("Traversal succeeded: {}", event.detail);
            break;
        case EventKind::TraversalFailed:
            LOG_WARNING("Traversal failed: {}", event.detail);
            break;
        case EventKind::ListenStarted:
            LOG_INFO("Listening on {} for hole punch", endpoint_string(event));
            break;
        case EventKind::ListenAccepted:
            LOG_INFO("Accepted inbound connection from {}", endpoint_string(event));
            break;
        case EventKind::ListenTimedOut:
            LOG_INFO("Listen timeout after {}", event.detail);
            break;
        case EventKind::ListenFailed:
            LOG_ERROR("Listen error ({}): {}", event.detail, error_string(event.os_error));
            break;
        case EventKind::ListenCancelled:
            LOG_DEBUG("Listen half cancelled");
            break;
        case EventKind::AttemptStarted:
            LOG_INFO("Punch attempt {}/{}: {}", event.attempt, event.max_attempts,
                     endpoint_string(event));
            break;
        case EventKind::AttemptFailed:
            LOG_DEBUG("Attempt {}/{} failed: {} ({})", event.attempt, event.max_attempts,
                      event.detail, error_string(event.os_error));
            break;
        case EventKind::AttemptRetrying:
            LOG_DEBUG("Retrying after attempt {}/{}: {}", event.attempt, event.max_attempts,
                      event.detail);
            break;
        case EventKind::ConnectSucceeded:
            LOG_INFO("Hole punch successful on attempt {} to {}", event.attempt,
                     endpoint_string(event));
            break;
        case EventKind::ConnectExhausted:
            LOG_WARNING("All {} connection attempts failed: {}", event.max_attempts,
                        event.detail);
            break;
        case EventKind::ConnectCancelled:
            LOG_DEBUG("Connect half cancelled during attempt {}", event.attempt);
            break;
        case EventKind::LoserClosed:
            LOG_DEBUG("Closed losing {} stream to {}", event.detail, endpoint_string(event));
            break;
        case EventKind::ProbeFailed:
            LOG_DEBUG("Address probe {} failed", event.detail);
            break;
        case EventKind::PublicAddressResolved:
            LOG_INFO("Public address {}", event.detail);
            break;
        case EventKind::AddressResolutionDegraded:
            LOG_WARNING("Address discovery degraded: {}", event.detail);
            break;
    }
}

} // namespace holepunch::traversal
