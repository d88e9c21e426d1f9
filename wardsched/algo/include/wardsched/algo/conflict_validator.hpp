#pragma once

#include <wardsched/algo/error.hpp>

#include <wardsched/core/request.hpp>

#include <span>
#include <string>
#include <vector>

namespace wardsched::algo {

/// @brief Two rounds of the same staff member whose windows overlap.
/// @ingroup algo_rotation
struct RotationConflict {
    std::string staff_name;
    core::RotationRound first;   ///< Round with the earlier (or equal) start.
    core::RotationRound second;

    /// @brief Human-readable description naming the staff member and both
    ///        resource/time pairs.
    [[nodiscard]] std::string describe() const;
};

/// @brief Result of validating a rotation.
/// @ingroup algo_rotation
struct ConflictReport {
    std::vector<RotationConflict> conflicts;

    [[nodiscard]] bool valid() const noexcept { return conflicts.empty(); }

    /// @brief One description per conflict, in detection order.
    [[nodiscard]] std::vector<std::string> descriptions() const;
};

/// @brief Check that no staff member holds two overlapping rounds.
///
/// Rounds are grouped by staff name and sorted by start; every pair whose
/// windows satisfy `a < d && c < b` is reported. Staff are visited in name
/// order so the report is deterministic.
///
/// @param rounds Rounds of one run (any order).
/// @return Report listing every overlapping pair.
[[nodiscard]] ConflictReport validate_rotation(std::span<const core::RotationRound> rounds);

/// @brief Apply @p policy to @p report.
/// @throws RotationConflictError when @p policy is Enforce and the report
///         holds at least one conflict.
void enforce_conflict_policy(const ConflictReport& report, ConflictPolicy policy);

} // namespace wardsched::algo
