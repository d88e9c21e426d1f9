#pragma once

#include <wardsched/algo/conflict_validator.hpp>
#include <wardsched/algo/error.hpp>
#include <wardsched/algo/option_scoring.hpp>
#include <wardsched/algo/rotation_scheduler.hpp>

#include <wardsched/core/request.hpp>
#include <wardsched/core/trace_writer.hpp>

#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace wardsched::algo {

struct WardConfig;

/// @brief One request submitted to the allocator.
/// @ingroup algo_allocators
struct AllocationRequest {
    std::string request_id;
    core::RiskProfile profile;
    std::optional<std::string> duration_label;  ///< e.g. "2-3 days".
    std::vector<core::FeasibleOption> options;  ///< Candidate (staff, resource) pairs.
};

/// @brief Result of one allocator run.
/// @ingroup algo_allocators
struct BatchAllocation {
    /// One record per processed request, in processing (priority) order.
    std::vector<core::AllocationRecord> records;
    /// Rounds built jointly for every assigned request.
    RotationPlan rotation;
    /// Post-hoc check of @c rotation.
    ConflictReport conflicts;
    /// True if the run stopped before processing every request.
    bool cancelled{false};

    /// @brief Record of @p request_id, or nullptr.
    [[nodiscard]] const core::AllocationRecord* find(std::string_view request_id) const;
};

/// @brief Serial-dictatorship allocator with waitlisting.
///
/// Requests pick in descending risk-score order (stable on ties, so equal
/// scores keep submission order). Each request removes from its options
/// every (staff, resource) pair already taken in this run, scores what is
/// left and commits the best one; the first option wins ties. A request
/// left without options is waitlisted in its risk band.
///
/// Once every request is processed, rotation rounds are built for all
/// assigned requests together with one StaffLedger, so a staff member
/// shared by several requests' pools is never double-booked. The number of
/// rounds of a request follows its duration label.
///
/// The allocator is greedy, not optimal.
///
/// @ingroup algo_allocators
/// @see waitlist_band, score_option, RotationScheduler
class PriorityAllocator {
public:
    /// @param scoring  Scoring tables.
    /// @param rotation Round shape (uses interval_hours and durations).
    /// @param default_duration_hours Hours assumed for missing/unparseable labels.
    /// @param conflict_policy What to do when validation fails.
    /// @param trace    Optional trace writer.
    PriorityAllocator(ScoringPolicy scoring,
                      RotationPolicy rotation,
                      double default_duration_hours,
                      ConflictPolicy conflict_policy = ConflictPolicy::Advisory,
                      core::TraceWriter* trace = nullptr);

    /// @brief Build from a ward configuration.
    explicit PriorityAllocator(const WardConfig& config, core::TraceWriter* trace = nullptr);

    /// @brief Allocate a batch.
    ///
    /// @p stop is checked before each request; on cancellation the records
    /// already committed are kept and the rotation is built for them.
    ///
    /// @throws RotationConflictError under ConflictPolicy::Enforce when the
    ///         rotation fails validation.
    [[nodiscard]] BatchAllocation allocate(const std::vector<AllocationRequest>& batch,
                                           std::stop_token stop = {}) const;

    /// @brief Indices of @p batch in processing order.
    [[nodiscard]] static std::vector<std::size_t> processing_order(
        const std::vector<AllocationRequest>& batch);

private:
    [[nodiscard]] RotationPlan build_rotation(const std::vector<AllocationRequest>& batch,
                                              const std::vector<std::size_t>& order,
                                              std::vector<core::AllocationRecord>& records) const;

    ScoringPolicy scoring_;
    RotationPolicy rotation_;
    double default_duration_hours_;
    ConflictPolicy conflict_policy_;
    core::TraceWriter* trace_;
};

} // namespace wardsched::algo
