#pragma once

#include <wardsched/core/request.hpp>

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace wardsched::algo {

/// @brief Tables used to score feasible options for a risk category.
///
/// @ingroup algo_allocators
/// @see score_option, default_scoring_policy
struct ScoringPolicy {
    /// Per-category resource types, most preferred first.
    std::map<std::string, std::vector<std::string>> resource_preferences;
    /// Preference list for categories missing from @c resource_preferences.
    std::vector<std::string> default_preference;
    /// Per-category certifications a staff member should hold.
    std::map<std::string, std::set<std::string>> required_certifications;
    /// Load at which the staff-load sub-score reaches zero.
    int max_load{6};
};

/// @brief Break-down of an option's score.
/// @ingroup algo_allocators
struct OptionScore {
    double resource_fit{0.0};
    double load_fit{0.0};
    double certification_fit{0.0};

    [[nodiscard]] double total() const noexcept {
        return resource_fit + load_fit + certification_fit;
    }
};

/// @brief Preference and certification tables for the usual ward categories.
///
/// Critical prefers Negative Pressure, then Isolation, then General;
/// Stable and Low prefer General. Unknown categories fall back to
/// Negative Pressure, Isolation, General.
[[nodiscard]] ScoringPolicy default_scoring_policy();

/// @brief Resource-type fit: `1 - index / list_length`, 0 if not listed.
[[nodiscard]] double resource_type_fit(const ScoringPolicy& policy,
                                       std::string_view category,
                                       std::string_view resource_type);

/// @brief Staff-load fit: `max(0, 1 - load / max_load)`, 1 when max_load <= 0.
[[nodiscard]] double staff_load_fit(int load, int max_load) noexcept;

/// @brief Fraction of the category's required certifications held.
///
/// Returns 0 when the category requires nothing.
[[nodiscard]] double certification_fit(const ScoringPolicy& policy,
                                       std::string_view category,
                                       const std::set<std::string>& certifications);

/// @brief Score @p option for a request of risk @p category.
///
/// The certification sub-score only applies when the option carries
/// certifications.
[[nodiscard]] OptionScore score_option(const ScoringPolicy& policy,
                                       std::string_view category,
                                       const core::FeasibleOption& option);

/// @brief Waitlist band of a risk score.
///
/// `score >= 0.8` gives 1, `0.5 <= score < 0.8` gives 2, anything else 3.
/// This is a coarse priority bucket, not a rank within the waitlist.
[[nodiscard]] constexpr int waitlist_band(double score) noexcept {
    if (score >= 0.8) {
        return 1;
    }
    if (score >= 0.5) {
        return 2;
    }
    return 3;
}

} // namespace wardsched::algo
