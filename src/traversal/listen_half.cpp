#include "holepunch/traversal/listen_half.hpp"
#include "holepunch/util/logger.hpp"
#include <cerrno>
#include <format>
#include <poll.h>

namespace holepunch::traversal {

ListenHalf::ListenHalf(uint16_t local_port,
                       Duration listen_timeout,
                       EventSink& events,
                       net::ReusableSocketFactory factory)
    : local_port_(local_port)
    , listen_timeout_(listen_timeout)
    , events_(events)
    , factory_(std::move(factory))
{}

std::optional<StreamHandle> ListenHalf::fail(const char* stage, int error) {
    os_error_ = error;
    state_.store(ListenState::Errored, std::memory_order_release);
    events_.on_event({EventKind::ListenFailed,
                      net::SocketAddress(factory_.bind_address(), local_port_),
                      0, 0, error, stage});
    return std::nullopt;
}

std::optional<StreamHandle> ListenHalf::run(const core::CancellationToken& cancel) {
    using Clock = std::chrono::steady_clock;

    int error = 0;
    auto listener = factory_.create(local_port_, error);
    if (!listener) {
        bind_failed_ = true;
        return fail("bind", error);
    }

    if (!listener->listen(1) || !listener->set_nonblocking(true)) {
        return fail("listen", listener->last_error());
    }

    state_.store(ListenState::Listening, std::memory_order_release);
    events_.on_event({EventKind::ListenStarted,
                      net::SocketAddress(factory_.bind_address(), local_port_)});

    auto deadline = Clock::now() + listen_timeout_;

    while (true) {
        auto remaining = std::chrono::duration_cast<Duration>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            state_.store(ListenState::TimedOut, std::memory_order_release);
            events_.on_event({EventKind::ListenTimedOut, std::nullopt, 0, 0, 0,
                              std::format("{}ms", listen_timeout_.count())});
            return std::nullopt;
        }

        auto status = cancel.wait_fd(listener->fd(), POLLIN, remaining);
        if (status == core::WaitStatus::Cancelled) {
            state_.store(ListenState::Cancelled, std::memory_order_release);
            events_.on_event({EventKind::ListenCancelled});
            return std::nullopt;
        }
        if (status == core::WaitStatus::Error) {
            return fail("poll", errno);
        }
        if (status == core::WaitStatus::TimedOut) {
            continue;  // Deadline check above reports it
        }

        net::SocketAddress peer;
        auto accepted = listener->accept(&peer);
        if (!accepted) {
            int accept_error = listener->last_error();
            // The SYN may be withdrawn between poll() and accept()
            if (accept_error == EAGAIN || accept_error == EWOULDBLOCK ||
                accept_error == ECONNABORTED || accept_error == EINTR) {
                continue;
            }
            return fail("accept", accept_error);
        }

        // Streams are handed out in blocking mode
        if (!accepted->set_nonblocking(false)) {
            LOG_WARNING("Could not make accepted socket blocking: errno {}",
                        accepted->last_error());
        }

        auto local = accepted->local_address().value_or(
            net::SocketAddress(factory_.bind_address(), local_port_));

        state_.store(ListenState::Accepted, std::memory_order_release);
        events_.on_event({EventKind::ListenAccepted, peer});

        // Listener closes on return; no further connections are accepted
        return StreamHandle(std::move(*accepted), local, peer, TraversalPath::Listen);
    }
}

} // namespace holepunch::traversal
