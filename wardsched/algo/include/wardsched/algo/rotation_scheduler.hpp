#pragma once

#include <wardsched/core/request.hpp>
#include <wardsched/core/resource_pool.hpp>
#include <wardsched/core/trace_writer.hpp>
#include <wardsched/core/types.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wardsched::algo {

/// @brief A staff member offered to the rotation scheduler.
/// @ingroup algo_rotation
struct StaffCandidate {
    std::string name;
    int load{0};  ///< Current load; less-loaded staff are tried first.
};

/// @brief Shape of the rotation rounds built for occupied resources.
/// @ingroup algo_rotation
struct RotationPolicy {
    double window_hours{12.0};     ///< Window the fixed rounds are spread over.
    int rounds_per_resource{4};    ///< Rounds per occupied resource in the window.
    /// Allowed round lengths, cycled in order across successive rounds.
    std::vector<double> round_durations_minutes{15.0, 20.0, 30.0};
    double interval_hours{4.0};    ///< Spacing of duration-derived rounds.

    /// @throws core::InvalidArgumentError on non-positive values or an
    ///         empty duration list.
    void validate() const;
};

/// @brief Rounds requested for one resource (or one request on it).
/// @ingroup algo_rotation
struct RotationDemand {
    std::string resource_id;
    std::string request_id;             ///< May be empty.
    std::vector<StaffCandidate> pool;   ///< Staff allowed on this resource.
    int rounds{0};
    double first_start{0.0};            ///< Start of round 0 (hours).
    double spacing_hours{0.0};          ///< Distance between round starts.
};

/// @brief A round no staff member could take.
/// @ingroup algo_rotation
struct UnfilledSlot {
    std::string resource_id;
    std::string request_id;
    int round_index{0};
    double start{0.0};
    double stop{0.0};
};

/// @brief Output of a scheduling call.
/// @ingroup algo_rotation
struct RotationPlan {
    std::vector<core::RotationRound> rounds;
    std::vector<UnfilledSlot> unfilled;

    /// @brief Append @p other's rounds and unfilled slots.
    void merge(RotationPlan other);
};

/// @brief Per-staff list of committed intervals, keyed by staff identity.
///
/// One ledger covers a whole batch run, so a staff member that appears in
/// several requests' pools is still never booked twice at the same time.
///
/// @ingroup algo_rotation
class StaffLedger {
public:
    /// @brief True if @p staff has no committed interval overlapping @p window.
    [[nodiscard]] bool is_free(std::string_view staff, const core::TimeWindow& window) const;

    /// @brief Record @p window for @p staff.
    void commit(std::string_view staff, const core::TimeWindow& window);

    /// @brief Intervals committed for @p staff, in commit order.
    [[nodiscard]] std::span<const core::TimeWindow> intervals(std::string_view staff) const;

    /// @brief Number of staff with at least one commitment.
    [[nodiscard]] std::size_t staff_count() const noexcept { return intervals_.size(); }

private:
    std::unordered_map<std::string, std::vector<core::TimeWindow>> intervals_;
};

/// @brief Builds conflict-free staff rotation rounds over occupied resources.
///
/// For each demand, in order, and each of its rounds in order, the
/// scheduler computes the slot `[first_start + k * spacing,
/// ... + duration_k)` where duration_k cycles through the policy's round
/// lengths. It then walks the demand's pool (sorted by load, then name)
/// starting from a rotating offset and commits the first staff member
/// whose ledger has no overlapping interval. The offset advances after
/// every successful assignment so load spreads over the whole run.
///
/// Slots nobody can take are left unfilled and reported; they never abort
/// the run.
///
/// A scheduler instance owns the ledger of one run. Successive calls on
/// the same instance see each other's commitments.
///
/// @ingroup algo_rotation
/// @see StaffLedger, validate_rotation
class RotationScheduler {
public:
    /// @param policy Round shape; validated on construction.
    /// @param trace  Optional trace writer for round events.
    /// @throws core::InvalidArgumentError if @p policy is invalid.
    explicit RotationScheduler(RotationPolicy policy, core::TraceWriter* trace = nullptr);

    /// @brief Spread the fixed number of rounds over the window for every
    ///        occupied resource, drawing from one shared roster.
    ///
    /// Rounds start at `window_start + k * window_hours / rounds_per_resource`.
    ///
    /// @param occupied Resources to cover, in order.
    /// @param roster   Staff pool shared by every resource.
    /// @param window_start Start of the window (hours).
    RotationPlan schedule_window(std::span<const core::Resource> occupied,
                                 const std::vector<StaffCandidate>& roster,
                                 double window_start = 0.0);

    /// @brief Schedule explicit demands, each with its own staff pool.
    RotationPlan schedule(const std::vector<RotationDemand>& demands);

    /// @brief Commitments made so far by this scheduler.
    [[nodiscard]] const StaffLedger& ledger() const noexcept { return ledger_; }

    [[nodiscard]] const RotationPolicy& policy() const noexcept { return policy_; }

private:
    void schedule_demand(const RotationDemand& demand, RotationPlan& plan);

    RotationPolicy policy_;
    core::TraceWriter* trace_;
    StaffLedger ledger_;
    std::size_t offset_{0};
};

/// @brief Sort staff ascending by load, then by name.
[[nodiscard]] std::vector<StaffCandidate> order_by_load(std::vector<StaffCandidate> staff);

} // namespace wardsched::algo
