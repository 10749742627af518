#pragma once

#include "stream_handle.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace holepunch::traversal {

// Single-assignment cell shared by the two halves of a simultaneous open.
// The first stream offered is kept; any later one is handed back to its
// caller, which must close it.
class ResultSlot {
public:
    using Clock = std::chrono::steady_clock;

    // Record that `path` finished, with or without a stream. Returns the
    // stream back if another one already won.
    std::optional<StreamHandle> complete(TraversalPath path, std::optional<StreamHandle> stream);

    // True once any half has completed, false if the deadline passed first
    bool wait_first(Clock::time_point deadline);

    // The half that completed first, whether or not it produced a stream
    std::optional<TraversalPath> first_finished() const;

    std::optional<StreamHandle> take_winner();

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::optional<TraversalPath> first_finished_;
    std::optional<StreamHandle> winner_;
};

} // namespace holepunch::traversal
