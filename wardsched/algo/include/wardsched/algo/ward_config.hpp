#pragma once

#include <wardsched/algo/error.hpp>
#include <wardsched/algo/option_scoring.hpp>
#include <wardsched/algo/rotation_scheduler.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace wardsched::algo {

/// @brief Every tunable constant of a ward deployment, with its default.
///
/// Loaded from JSON by io::load_config; any key missing from the file
/// keeps the default below.
///
/// @ingroup algo
struct WardConfig {
    /// Need probability at or above which a resource is requested.
    double admission_threshold{0.35};

    /// Round shape (window 12 h, 4 rounds, 15/20/30 min, 4 h interval).
    RotationPolicy rotation{};

    /// Option scoring tables and the staff-load ceiling.
    ScoringPolicy scoring{default_scoring_policy()};

    /// Resources created when neither ids nor a snapshot are supplied.
    std::size_t default_resource_count{50};
    /// Explicit resource ids; empty means R1..R<default_resource_count>.
    std::vector<std::string> resource_ids;

    /// Requests handled by one batch when no count is given.
    std::size_t default_batch_size{25};

    /// Staff roster for window rotations; empty means the default roster.
    std::vector<StaffCandidate> roster;
    /// Size of the default roster (Nurse_1..Nurse_N, load 0).
    std::size_t default_roster_size{30};

    /// Hours assumed for a missing or unparseable duration label.
    double default_duration_hours{72.0};

    /// Probability reported when the need predictor fails.
    double need_fallback_probability{0.5};
    /// Hours reported when the duration predictor fails.
    double duration_fallback_hours{72.0};
    /// Plausible range predicted durations are clamped into.
    double min_duration_hours{6.0};
    double max_duration_hours{336.0};

    /// Feed columns passed to the need predictor; empty means all.
    std::vector<std::string> need_features;
    /// Feed columns passed to the duration predictor; empty means all.
    std::vector<std::string> duration_features;
    /// Name of the feed's identifier column.
    std::string id_column{"encounter_id"};

    /// What to do when the post-hoc conflict check fails.
    ConflictPolicy conflict_policy{ConflictPolicy::Advisory};

    /// @brief Check ranges and cross-field constraints.
    /// @throws core::InvalidArgumentError on the first violation.
    void validate() const;

    /// @brief The configured roster, or Nurse_1..Nurse_N when empty.
    [[nodiscard]] std::vector<StaffCandidate> effective_roster() const;
};

} // namespace wardsched::algo
