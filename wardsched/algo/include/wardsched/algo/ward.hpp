#pragma once

#include <wardsched/algo/admission_pipeline.hpp>

#include <wardsched/core/allocation_state.hpp>
#include <wardsched/core/request.hpp>

#include <cstddef>
#include <mutex>
#include <span>
#include <stop_token>

namespace wardsched::algo {

/// @brief One deployment: the current allocation state and its pipeline.
///
/// Batches are serialised: run_batch() holds the ward's mutex for the whole
/// run, works on an exclusive copy of the current snapshot and commits the
/// new snapshot only when the run returns. A run that throws leaves the
/// current state untouched.
///
/// @ingroup algo_pipeline
class Ward {
public:
    explicit Ward(AdmissionPipeline pipeline);

    /// @brief Start from a previously saved snapshot.
    Ward(AdmissionPipeline pipeline, core::AllocationState initial);

    /// @brief Run @p window of @p feed from the current snapshot and commit.
    /// @throws RotationConflictError under ConflictPolicy::Enforce.
    BatchResult run_batch(std::span<const core::FeedRow> feed,
                          BatchWindow window,
                          std::stop_token stop = {});

    /// @brief Run the next default_batch_size requests after the last batch.
    ///
    /// The cursor advances by the number of requests actually processed, so
    /// a cancelled batch resumes where it stopped.
    BatchResult run_next_batch(std::span<const core::FeedRow> feed, std::stop_token stop = {});

    /// @brief Copy of the current snapshot.
    [[nodiscard]] core::AllocationState snapshot() const;

    /// @brief Feed index the next run_next_batch() starts from.
    [[nodiscard]] std::size_t next_index() const;

    /// @brief Forget all bookings and rewind the cursor.
    void reset();

private:
    BatchResult run_locked(std::span<const core::FeedRow> feed,
                           BatchWindow window,
                           std::stop_token stop);

    AdmissionPipeline pipeline_;
    mutable std::mutex mutex_;
    core::AllocationState state_;
    bool has_state_{false};
    std::size_t next_index_{0};
};

} // namespace wardsched::algo
