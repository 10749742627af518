#pragma once

#include "connect_half.hpp"
#include "events.hpp"
#include "listen_half.hpp"
#include "types.hpp"
#include "holepunch/core/cancellation.hpp"
#include "holepunch/core/thread_pool.hpp"
#include "holepunch/net/reusable_socket.hpp"
#include <mutex>

namespace holepunch::traversal {

// Races a ListenHalf against a ConnectHalf on the same local port and keeps
// whichever produces a stream first.
//
// One traversal runs at a time per orchestrator; concurrent calls to
// simultaneous_open() are serialized.
class TraversalOrchestrator {
public:
    explicit TraversalOrchestrator(EventSink& events = LogEventSink::instance(),
                                   net::ReusableSocketFactory factory = {});

    TraversalOrchestrator(const TraversalOrchestrator&) = delete;
    TraversalOrchestrator& operator=(const TraversalOrchestrator&) = delete;

    // Run one simultaneous open. Returns the winning stream, or no stream
    // plus diagnostics. Expected failures (timeouts, refusals, bind errors)
    // never throw. An invalid config, or a remote whose address family
    // differs from the factory's bind address, throws std::invalid_argument.
    //
    // Both halves have finished and every losing socket is closed by the
    // time this returns.
    TraversalResult simultaneous_open(const TraversalConfig& config);

    // Abort the traversal in flight, if any. Safe from any thread.
    void cancel();

private:
    EventSink& events_;
    net::ReusableSocketFactory factory_;
    core::ThreadPool pool_;

    std::mutex run_mutex_;

    std::mutex active_mutex_;
    core::CancellationToken* active_ = nullptr;
    bool cancel_requested_ = false;
};

} // namespace holepunch::traversal
