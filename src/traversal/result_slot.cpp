#include "holepunch/traversal/result_slot.hpp"

namespace holepunch::traversal {

std::optional<StreamHandle> ResultSlot::complete(TraversalPath path,
                                                 std::optional<StreamHandle> stream) {
    std::optional<StreamHandle> loser;
    {
        std::lock_guard lock(mutex_);
        if (!first_finished_) {
            first_finished_ = path;
        }
        if (stream) {
            if (winner_) {
                loser = std::move(stream);
            } else {
                winner_ = std::move(stream);
            }
        }
    }
    condition_.notify_all();
    return loser;
}

bool ResultSlot::wait_first(Clock::time_point deadline) {
    std::unique_lock lock(mutex_);
    return condition_.wait_until(lock, deadline, [this] {
        return first_finished_.has_value();
    });
}

std::optional<TraversalPath> ResultSlot::first_finished() const {
    std::lock_guard lock(mutex_);
    return first_finished_;
}

std::optional<StreamHandle> ResultSlot::take_winner() {
    std::lock_guard lock(mutex_);
    std::optional<StreamHandle> winner = std::move(winner_);
    winner_.reset();
    return winner;
}

} // namespace holepunch::traversal
