#pragma once

#include <optional>
#include <string_view>

namespace wardsched::algo {

/// @brief Hours used when a duration label is missing or unparseable.
inline constexpr double DEFAULT_DURATION_HOURS = 72.0;

/// @brief Parse a predicted-duration label into hours.
/// @ingroup algo_allocators
///
/// Accepted grammar (case-insensitive, surrounding blanks ignored):
///
///     label  := number [ dash number ] unit
///     dash   := '-' | en dash | em dash
///     unit   := "day" | "days" | "hour" | "hours"
///
/// Ranges resolve to their midpoint, days count 24 hours.
/// `"5-7 days"` gives 144, `"24-48 hours"` gives 36, `"3 days"` gives 72.
///
/// @param label Label such as `"2-3 days"`.
/// @return Hours, or std::nullopt when the label does not match the grammar.
/// @see duration_label_hours
[[nodiscard]] std::optional<double> parse_duration_label(std::string_view label);

/// @brief Parse a label, falling back to @p fallback_hours.
/// @param label Label, or std::nullopt when the request carries none.
/// @param fallback_hours Hours returned for missing or unparseable labels.
[[nodiscard]] double duration_label_hours(std::optional<std::string_view> label,
                                          double fallback_hours = DEFAULT_DURATION_HOURS);

/// @brief Upper bound on the rounds planned for one request.
inline constexpr int MAX_ROTATION_ROUNDS = 1024;

/// @brief Number of rotation rounds for a stay of @p hours.
///
/// `max(1, floor(hours / interval_hours))`, saturated at
/// MAX_ROTATION_ROUNDS. A non-finite or non-positive quotient gives 1.
[[nodiscard]] int rounds_for_duration(double hours, double interval_hours);

} // namespace wardsched::algo
