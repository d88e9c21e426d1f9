#pragma once

#include <wardsched/core/types.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace wardsched::core {

/// @brief Raw feature values of one request row, keyed by column name.
/// @ingroup core_model
using FeatureMap = std::map<std::string, std::string>;

/// @brief One row of the request feed: an identifier and its features.
/// @ingroup core_model
struct FeedRow {
    std::string request_id;  ///< Value of the feed's identifier column.
    FeatureMap features;     ///< Every other column of the row.
};

/// @brief A request (patient) and the resource window it was given.
///
/// A freshly created request is unassigned: resource, start and stop are
/// all unset. Serialised forms encode unset as -1.
///
/// @ingroup core_model
struct Request {
    std::string id;                          ///< Request identifier.
    std::optional<std::string> resource_id;  ///< Booked resource, if any.
    std::optional<double> start;             ///< Start of the booking (hours).
    std::optional<double> stop;              ///< End of the booking (hours).

    /// @brief True once a resource window has been recorded.
    [[nodiscard]] bool assigned() const noexcept { return resource_id.has_value(); }

    /// @brief The booked window; only meaningful when assigned().
    [[nodiscard]] TimeWindow window() const noexcept {
        return TimeWindow{start.value_or(-1.0), stop.value_or(-1.0)};
    }
};

/// @brief Priority signal attached to a request.
/// @ingroup core_model
struct RiskProfile {
    double score{0.0};     ///< Risk score in [0, 1]; higher picks first.
    std::string category;  ///< Open category label (Critical, High, Observation, ...).
};

/// @brief A candidate (staff, resource) pairing offered for one request.
/// @ingroup core_model
struct FeasibleOption {
    std::string staff_name;
    std::string resource_id;
    std::string resource_type;
    int staff_load{0};
    /// Certifications of the staff member; unset when the feed omits them.
    std::optional<std::set<std::string>> staff_certifications;
};

/// @brief One staff check-in window against an occupied resource.
/// @ingroup core_model
struct RotationRound {
    std::string staff_name;
    std::string resource_id;
    std::string request_id;  ///< Empty when the round is scoped to a resource only.
    double start{0.0};
    double stop{0.0};

    [[nodiscard]] TimeWindow window() const noexcept { return TimeWindow{start, stop}; }
};

/// @brief Outcome of the allocator for one request.
/// @ingroup core_model
enum class AllocationStatus {
    Assigned,   ///< A (staff, resource) pair was committed.
    Waitlisted  ///< No pair was left; see waitlist_position.
};

/// @brief Full allocation outcome for one request.
///
/// Assigned records carry resource_id and staff_name; waitlisted records
/// carry waitlist_position. rotation_rounds is filled once the batch's
/// rotation has been built.
///
/// @ingroup core_model
struct AllocationRecord {
    std::string request_id;
    AllocationStatus status{AllocationStatus::Waitlisted};
    double risk_score{0.0};
    std::string risk_category;
    std::optional<std::string> resource_id;
    std::optional<std::string> staff_name;
    std::optional<int> waitlist_position;
    std::optional<std::string> duration_label;
    std::optional<double> match_score;  ///< Score of the winning option.
    std::vector<RotationRound> rotation_rounds;
};

/// @brief Lower-case wire name of an allocation status.
[[nodiscard]] constexpr const char* to_string(AllocationStatus status) noexcept {
    return status == AllocationStatus::Assigned ? "assigned" : "waitlisted";
}

} // namespace wardsched::core
