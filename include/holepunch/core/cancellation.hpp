#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace holepunch::core {

// Outcome of waiting on a descriptor under a CancellationToken
enum class WaitStatus {
    Ready,      // Requested events are pending on the descriptor
    TimedOut,
    Cancelled,
    Error       // poll() failed, errno preserved
};

// One-shot cooperative cancellation shared by concurrently running tasks.
//
// cancel() may be called from any thread, any number of times. Once
// cancelled, every sleep_for() and wait_fd() returns immediately, and the
// read end of an internal pipe stays readable so blocking poll() calls wake.
class CancellationToken {
public:
    // Throws std::system_error if the wake pipe cannot be created
    CancellationToken();
    ~CancellationToken();

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

    // Sleep for `duration`. Returns false if cancelled before it elapsed.
    bool sleep_for(std::chrono::milliseconds duration) const;

    // poll() `fd` for `events` (POLLIN / POLLOUT) until ready, timeout or
    // cancellation. EINTR is retried with the remaining time.
    WaitStatus wait_fd(int fd, short events, std::chrono::milliseconds timeout) const;

    // Readable once cancel() has been called
    int wake_fd() const { return wake_pipe_[0]; }

private:
    std::atomic<bool> cancelled_{false};
    int wake_pipe_[2] = {-1, -1};

    mutable std::mutex mutex_;
    mutable std::condition_variable condition_;
};

} // namespace holepunch::core
