#pragma once

#include <compare>

namespace wardsched::core {

/// @brief Half-open time window `[start, stop)` expressed in hours.
///
/// All times in wardsched are hours relative to the deployment epoch
/// (time zero, when the first batch ran). Windows are value types and
/// compare lexicographically on (start, stop).
///
/// @see RotationRound, Resource
/// @ingroup core_types
struct TimeWindow {
    double start{0.0};  ///< Inclusive lower bound (hours).
    double stop{0.0};   ///< Exclusive upper bound (hours).

    /// @brief Length of the window in hours.
    [[nodiscard]] constexpr double length() const noexcept { return stop - start; }

    /// @brief Test whether two windows overlap.
    ///
    /// `[a, b)` and `[c, d)` overlap iff `a < d && c < b`. Windows that only
    /// touch (one stops exactly where the other starts) do not overlap.
    ///
    /// @param other Window to test against.
    /// @return True if the windows share at least one instant.
    [[nodiscard]] constexpr bool overlaps(const TimeWindow& other) const noexcept {
        return start < other.stop && other.start < stop;
    }

    constexpr auto operator<=>(const TimeWindow&) const noexcept = default;
    constexpr bool operator==(const TimeWindow&) const noexcept = default;
};

/// @brief Convert minutes to hours.
[[nodiscard]] constexpr double minutes_to_hours(double minutes) noexcept {
    return minutes / 60.0;
}

/// @brief Convert hours to minutes.
[[nodiscard]] constexpr double hours_to_minutes(double hours) noexcept {
    return hours * 60.0;
}

} // namespace wardsched::core
