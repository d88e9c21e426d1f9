#include <wardsched/algo/ward.hpp>

#include <algorithm>
#include <utility>

namespace wardsched::algo {

Ward::Ward(AdmissionPipeline pipeline)
    : pipeline_(std::move(pipeline)) {}

Ward::Ward(AdmissionPipeline pipeline, core::AllocationState initial)
    : pipeline_(std::move(pipeline))
    , state_(std::move(initial))
    , has_state_(true) {}

BatchResult Ward::run_locked(std::span<const core::FeedRow> feed,
                             BatchWindow window,
                             std::stop_token stop) {
    // Copy first so a throwing run leaves state_ as it was.
    core::AllocationState current = state_;
    auto result = pipeline_.run(feed, window, has_state_ ? &current : nullptr, std::move(stop));
    state_ = result.snapshot;
    has_state_ = true;
    next_index_ = std::min(window.start_index, feed.size()) + result.risk.size();
    return result;
}

BatchResult Ward::run_batch(std::span<const core::FeedRow> feed,
                            BatchWindow window,
                            std::stop_token stop) {
    std::lock_guard lock(mutex_);
    return run_locked(feed, window, std::move(stop));
}

BatchResult Ward::run_next_batch(std::span<const core::FeedRow> feed, std::stop_token stop) {
    std::lock_guard lock(mutex_);
    BatchWindow window{next_index_, pipeline_.config().default_batch_size};
    return run_locked(feed, window, std::move(stop));
}

core::AllocationState Ward::snapshot() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::size_t Ward::next_index() const {
    std::lock_guard lock(mutex_);
    return next_index_;
}

void Ward::reset() {
    std::lock_guard lock(mutex_);
    state_ = core::AllocationState{};
    has_state_ = false;
    next_index_ = 0;
}

} // namespace wardsched::algo
