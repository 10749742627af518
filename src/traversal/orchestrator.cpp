#include "holepunch/traversal/orchestrator.hpp"
#include "holepunch/traversal/result_slot.hpp"
#include <algorithm>
#include <format>
#include <future>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace holepunch::traversal {

namespace {

using Clock = std::chrono::steady_clock;

// Publishes the running traversal's token to cancel() and withdraws it on
// every exit path
class ActiveRegistration {
public:
    ActiveRegistration(std::mutex& mutex, core::CancellationToken*& active,
                       bool& cancel_requested, core::CancellationToken& token)
        : mutex_(mutex), active_(active), cancel_requested_(cancel_requested) {
        std::lock_guard lock(mutex_);
        active_ = &token;
        cancel_requested_ = false;
    }

    ~ActiveRegistration() { withdraw(); }

    ActiveRegistration(const ActiveRegistration&) = delete;
    ActiveRegistration& operator=(const ActiveRegistration&) = delete;

    // Returns true if cancel() reached the traversal while it was published
    bool withdraw() {
        std::lock_guard lock(mutex_);
        active_ = nullptr;
        return cancel_requested_;
    }

private:
    std::mutex& mutex_;
    core::CancellationToken*& active_;
    bool& cancel_requested_;
};

TraversalError classify_connect_failure(const ConnectHalf& connect) {
    int attempts = connect.attempts_made();
    if (attempts > 0 && connect.refused_count() == attempts) {
        return TraversalError::ConnectRefused;
    }
    if (attempts > 0 && connect.timed_out_count() == attempts) {
        return TraversalError::ConnectTimeout;
    }
    if (attempts > 0 && connect.os_error_count() == attempts) {
        return TraversalError::OsLevelSocketError;
    }
    return TraversalError::AttemptsExhausted;
}

TraversalError classify_listen_failure(const ListenHalf& listen) {
    switch (listen.state()) {
        case ListenState::TimedOut:
            return TraversalError::ListenTimeout;
        case ListenState::Errored:
            return listen.bind_failed() ? TraversalError::BindFailure
                                        : TraversalError::OsLevelSocketError;
        case ListenState::Cancelled:
            return TraversalError::Cancelled;
        default:
            return TraversalError::OsLevelSocketError;
    }
}

} // anonymous namespace

TraversalOrchestrator::TraversalOrchestrator(EventSink& events, net::ReusableSocketFactory factory)
    : events_(events)
    , factory_(std::move(factory))
    , pool_(2)
{}

void TraversalOrchestrator::cancel() {
    std::lock_guard lock(active_mutex_);
    if (active_) {
        cancel_requested_ = true;
        active_->cancel();
    }
}

TraversalResult TraversalOrchestrator::simultaneous_open(const TraversalConfig& config) {
    config.validate();
    if (config.remote_endpoint.address().is_v4() != factory_.bind_address().is_v4()) {
        throw std::invalid_argument(std::format(
            "remote endpoint {} is not reachable from sockets bound to {}",
            config.remote_endpoint.to_string(), factory_.bind_address().to_string()));
    }

    std::lock_guard run_lock(run_mutex_);

    auto started = Clock::now();
    auto deadline = started + config.overall_timeout;
    TraversalResult result;

    // Published before the first event so a cancel() issued from here on,
    // including from an event sink, reaches this traversal
    std::unique_ptr<core::CancellationToken> cancel;
    try {
        cancel = std::make_unique<core::CancellationToken>();
    } catch (const std::system_error& e) {
        result.error = TraversalError::OsLevelSocketError;
        result.elapsed = Clock::now() - started;
        events_.on_event({EventKind::TraversalFailed, config.remote_endpoint, 0, 0,
                          e.code().value(), e.what()});
        return result;
    }

    ActiveRegistration registration(active_mutex_, active_, cancel_requested_, *cancel);

    events_.on_event({EventKind::TraversalStarted, config.remote_endpoint, 0,
                      config.max_connect_attempts, 0,
                      std::format("local port {}", config.local_port)});

    ListenHalf listen(config.local_port, config.listen_timeout, events_, factory_);

    ConnectHalf::Options connect_options;
    connect_options.local_port = config.local_port;
    connect_options.remote = config.remote_endpoint;
    connect_options.attempt_delay = config.connect_attempt_delay;
    connect_options.max_attempts = config.max_connect_attempts;
    connect_options.attempt_timeout = config.connect_attempt_timeout;
    ConnectHalf connect(connect_options, events_, factory_);

    ResultSlot slot;

    auto run_half = [&](TraversalPath path, auto& half) {
        auto loser = slot.complete(path, half.run(*cancel));
        if (loser) {
            events_.on_event({EventKind::LoserClosed, loser->remote_endpoint(), 0, 0, 0,
                              std::string(to_string(path))});
            loser->close();
        }
    };

    auto listen_done = pool_.submit([&] { run_half(TraversalPath::Listen, listen); });

    // Give the listener a head start; skip the connect half entirely if the
    // listener already gave up (e.g. the port could not be bound)
    std::future<void> connect_done;
    auto stagger_deadline = std::min(started + config.startup_stagger, deadline);
    if (!slot.wait_first(stagger_deadline) && Clock::now() < deadline) {
        connect_done = pool_.submit([&] { run_half(TraversalPath::Connect, connect); });
    }

    bool finished = slot.wait_first(deadline);

    // Stop whichever half is still running and wait for it to close its socket
    cancel->cancel();
    listen_done.wait();
    if (connect_done.valid()) {
        connect_done.wait();
    }

    bool externally_cancelled = registration.withdraw();

    // Rethrow anything unexpected (e.g. std::bad_alloc) now that both are done
    listen_done.get();
    if (connect_done.valid()) {
        connect_done.get();
    }

    result.stream = slot.take_winner();
    result.listen_state = listen.state();
    result.connect_state = connect.state();
    result.connect_attempts = connect.attempts_made();
    result.refused_attempts = connect.refused_count();
    result.timed_out_attempts = connect.timed_out_count();
    result.listen_os_error = listen.os_error();
    result.elapsed = Clock::now() - started;

    if (result.stream) {
        events_.on_event({EventKind::TraversalSucceeded, result.stream->remote_endpoint(), 0, 0, 0,
                          result.describe()});
        return result;
    }

    if (externally_cancelled) {
        result.error = TraversalError::Cancelled;
    } else if (!finished) {
        result.error = TraversalError::OverallTimeout;
    } else if (slot.first_finished() == TraversalPath::Connect) {
        result.error = classify_connect_failure(connect);
    } else {
        result.error = classify_listen_failure(listen);
    }

    events_.on_event({EventKind::TraversalFailed, config.remote_endpoint, 0, 0,
                      result.listen_os_error, result.describe()});
    return result;
}

} // namespace holepunch::traversal
