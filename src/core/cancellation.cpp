#include "holepunch/core/cancellation.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <limits>
#include <system_error>

namespace holepunch::core {

namespace {

// poll() takes an int; longer waits are cut to about 24 days
constexpr std::chrono::milliseconds max_wait(std::numeric_limits<int>::max());

} // anonymous namespace

CancellationToken::CancellationToken() {
    if (pipe(wake_pipe_) < 0) {
        throw std::system_error(errno, std::generic_category(), "cancellation pipe");
    }

    for (int fd : wake_pipe_) {
        fcntl(fd, F_SETFD, FD_CLOEXEC);
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags >= 0) {
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
    }
}

CancellationToken::~CancellationToken() {
    for (int fd : wake_pipe_) {
        if (fd >= 0) ::close(fd);
    }
}

void CancellationToken::cancel() {
    {
        std::lock_guard lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;  // Already cancelled
        }
    }

    // Never drained, so the read end stays readable
    char byte = 1;
    ssize_t written;
    do {
        written = ::write(wake_pipe_[1], &byte, 1);
    } while (written < 0 && errno == EINTR);

    condition_.notify_all();
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    std::unique_lock lock(mutex_);
    return !condition_.wait_for(lock, std::min(duration, max_wait), [this] {
        return cancelled_.load(std::memory_order_acquire);
    });
}

WaitStatus CancellationToken::wait_fd(int fd, short events, std::chrono::milliseconds timeout) const {
    using Clock = std::chrono::steady_clock;
    auto deadline = Clock::now() + std::min(timeout, max_wait);

    while (true) {
        if (cancelled()) return WaitStatus::Cancelled;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }

        pollfd fds[2] = {
            {fd, events, 0},
            {wake_pipe_[0], POLLIN, 0},
        };

        int rc = ::poll(fds, 2, static_cast<int>(std::min(remaining, max_wait).count()));
        if (rc < 0) {
            if (errno == EINTR) continue;
            return WaitStatus::Error;
        }

        if (fds[1].revents != 0) return WaitStatus::Cancelled;

        // POLLERR / POLLHUP also count as ready: the caller reads the error
        if (fds[0].revents != 0) return WaitStatus::Ready;

        if (rc == 0 && Clock::now() >= deadline) return WaitStatus::TimedOut;
    }
}

} // namespace holepunch::core
