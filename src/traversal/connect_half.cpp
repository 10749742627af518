#include "holepunch/traversal/connect_half.hpp"
#include <cerrno>
#include <format>
#include <stdexcept>
#include <poll.h>

namespace holepunch::traversal {

namespace {

AttemptStatus classify(int error) {
    switch (error) {
        case ECONNREFUSED:
        case ECONNRESET:
            return AttemptStatus::Refused;
        case ETIMEDOUT:
            return AttemptStatus::TimedOut;
        default:
            return AttemptStatus::OsError;
    }
}

} // anonymous namespace

ConnectHalf::ConnectHalf(Options options,
                         EventSink& events,
                         net::ReusableSocketFactory factory)
    : options_(std::move(options))
    , events_(events)
    , factory_(std::move(factory))
{
    if (options_.max_attempts < 1) {
        throw std::invalid_argument("ConnectHalf requires at least one attempt");
    }
}

AttemptOutcome ConnectHalf::finish(int attempt, AttemptStatus status, int os_error) {
    switch (status) {
        case AttemptStatus::Refused: ++refused_; break;
        case AttemptStatus::TimedOut: ++timed_out_; break;
        case AttemptStatus::OsError: ++os_errors_; break;
        default: break;
    }
    last_status_ = status;

    if (status != AttemptStatus::Cancelled) {
        events_.on_event({EventKind::AttemptFailed, options_.remote, attempt,
                          options_.max_attempts, os_error,
                          std::string(to_string(status))});
    }

    AttemptOutcome outcome;
    outcome.status = status;
    outcome.attempt = attempt;
    outcome.os_error = os_error;
    outcome.cause = status;
    if (status != AttemptStatus::Cancelled && attempt < options_.max_attempts) {
        outcome.status = AttemptStatus::Retrying;
    }
    return outcome;
}

AttemptOutcome ConnectHalf::attempt_once(int attempt, const core::CancellationToken& cancel) {
    state_.store(ConnectState::Delay, std::memory_order_release);
    if (!cancel.sleep_for(options_.attempt_delay)) {
        return finish(attempt, AttemptStatus::Cancelled, 0);
    }

    attempts_made_ = attempt;
    events_.on_event({EventKind::AttemptStarted, options_.remote, attempt, options_.max_attempts});

    state_.store(ConnectState::Binding, std::memory_order_release);
    int error = 0;
    auto sock = factory_.create(options_.local_port, error);
    if (!sock) {
        return finish(attempt, AttemptStatus::OsError, error);
    }

    if (!sock->set_nonblocking(true)) {
        return finish(attempt, AttemptStatus::OsError, sock->last_error());
    }

    state_.store(ConnectState::Connecting, std::memory_order_release);
    auto started = sock->connect(options_.remote);
    if (started == net::ConnectStart::Failed) {
        return finish(attempt, classify(sock->last_error()), sock->last_error());
    }

    if (started == net::ConnectStart::InProgress) {
        auto status = cancel.wait_fd(sock->fd(), POLLOUT, options_.attempt_timeout);
        switch (status) {
            case core::WaitStatus::Cancelled:
                return finish(attempt, AttemptStatus::Cancelled, 0);
            case core::WaitStatus::TimedOut:
                return finish(attempt, AttemptStatus::TimedOut, ETIMEDOUT);
            case core::WaitStatus::Error:
                return finish(attempt, AttemptStatus::OsError, errno);
            case core::WaitStatus::Ready:
                break;
        }

        int pending = sock->pending_error();
        if (pending != 0) {
            return finish(attempt, classify(pending), pending);
        }
    }

    if (!sock->set_nonblocking(false)) {
        return finish(attempt, AttemptStatus::OsError, sock->last_error());
    }

    auto local = sock->local_address().value_or(
        net::SocketAddress(factory_.bind_address(), options_.local_port));
    auto remote = sock->peer_address().value_or(options_.remote);

    last_status_ = AttemptStatus::Connected;
    state_.store(ConnectState::Connected, std::memory_order_release);
    events_.on_event({EventKind::ConnectSucceeded, remote, attempt, options_.max_attempts});

    AttemptOutcome outcome;
    outcome.status = AttemptStatus::Connected;
    outcome.attempt = attempt;
    outcome.cause = AttemptStatus::Connected;
    outcome.stream.emplace(std::move(*sock), local, remote, TraversalPath::Connect);
    return outcome;
}

std::optional<StreamHandle> ConnectHalf::run(const core::CancellationToken& cancel) {
    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        auto outcome = attempt_once(attempt, cancel);

        if (outcome.status == AttemptStatus::Connected) {
            return std::move(outcome.stream);
        }

        if (outcome.status == AttemptStatus::Cancelled) {
            state_.store(ConnectState::Cancelled, std::memory_order_release);
            events_.on_event({EventKind::ConnectCancelled, options_.remote, attempt,
                              options_.max_attempts});
            return std::nullopt;
        }

        if (outcome.status != AttemptStatus::Retrying) {
            break;
        }

        // The failed socket was closed when attempt_once() returned
        events_.on_event({EventKind::AttemptRetrying, options_.remote, attempt,
                          options_.max_attempts, outcome.os_error,
                          std::string(to_string(outcome.cause))});
    }

    state_.store(ConnectState::Exhausted, std::memory_order_release);
    events_.on_event({EventKind::ConnectExhausted, options_.remote, options_.max_attempts,
                      options_.max_attempts, 0,
                      std::format("{} refused, {} timed out, {} other errors",
                                  refused_, timed_out_, os_errors_)});
    return std::nullopt;
}

} // namespace holepunch::traversal
