#pragma once

#include "events.hpp"
#include "types.hpp"
#include "holepunch/core/cancellation.hpp"
#include "holepunch/net/reusable_socket.hpp"
#include <atomic>
#include <optional>

namespace holepunch::traversal {

// Passive side of a simultaneous open: accept at most one inbound connection
// on the shared local port within `listen_timeout`.
class ListenHalf {
public:
    ListenHalf(uint16_t local_port,
               Duration listen_timeout,
               EventSink& events,
               net::ReusableSocketFactory factory = {});

    // Blocks until accepted, timed out, errored or cancelled. Never throws
    // for socket failures; the listening socket is closed on every exit.
    std::optional<StreamHandle> run(const core::CancellationToken& cancel);

    ListenState state() const { return state_.load(std::memory_order_acquire); }

    // errno behind an Errored state
    int os_error() const { return os_error_; }

    // Errored because bind() failed, as opposed to listen()/accept()
    bool bind_failed() const { return bind_failed_; }

private:
    std::optional<StreamHandle> fail(const char* stage, int error);

    uint16_t local_port_;
    Duration listen_timeout_;
    EventSink& events_;
    net::ReusableSocketFactory factory_;

    std::atomic<ListenState> state_{ListenState::Idle};
    int os_error_ = 0;
    bool bind_failed_ = false;
};

} // namespace holepunch::traversal
