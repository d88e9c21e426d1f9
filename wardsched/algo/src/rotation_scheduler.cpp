#include <wardsched/algo/rotation_scheduler.hpp>

#include <wardsched/core/error.hpp>

#include <tracy/Tracy.hpp>

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace wardsched::algo {

void RotationPolicy::validate() const {
    if (window_hours <= 0.0) {
        throw core::InvalidArgumentError("rotation window must be positive");
    }
    if (rounds_per_resource <= 0) {
        throw core::InvalidArgumentError("rounds per resource must be positive");
    }
    if (interval_hours <= 0.0) {
        throw core::InvalidArgumentError("rotation interval must be positive");
    }
    if (round_durations_minutes.empty()) {
        throw core::InvalidArgumentError("at least one round duration is required");
    }
    for (double minutes : round_durations_minutes) {
        if (minutes <= 0.0) {
            throw core::InvalidArgumentError("round durations must be positive");
        }
    }
}

void RotationPlan::merge(RotationPlan other) {
    rounds.insert(rounds.end(),
                  std::make_move_iterator(other.rounds.begin()),
                  std::make_move_iterator(other.rounds.end()));
    unfilled.insert(unfilled.end(),
                    std::make_move_iterator(other.unfilled.begin()),
                    std::make_move_iterator(other.unfilled.end()));
}

// =============================================================================
// StaffLedger
// =============================================================================

bool StaffLedger::is_free(std::string_view staff, const core::TimeWindow& window) const {
    auto it = intervals_.find(std::string(staff));
    if (it == intervals_.end()) {
        return true;
    }
    return std::none_of(it->second.begin(), it->second.end(),
        [&](const core::TimeWindow& committed) { return committed.overlaps(window); });
}

void StaffLedger::commit(std::string_view staff, const core::TimeWindow& window) {
    intervals_[std::string(staff)].push_back(window);
}

std::span<const core::TimeWindow> StaffLedger::intervals(std::string_view staff) const {
    auto it = intervals_.find(std::string(staff));
    if (it == intervals_.end()) {
        return {};
    }
    return it->second;
}

// =============================================================================
// RotationScheduler
// =============================================================================

std::vector<StaffCandidate> order_by_load(std::vector<StaffCandidate> staff) {
    std::stable_sort(staff.begin(), staff.end(),
        [](const StaffCandidate& lhs, const StaffCandidate& rhs) {
            if (lhs.load != rhs.load) {
                return lhs.load < rhs.load;
            }
            return lhs.name < rhs.name;
        });
    // A name listed twice keeps its least-loaded entry
    std::unordered_set<std::string> seen;
    std::erase_if(staff, [&](const StaffCandidate& candidate) {
        return !seen.insert(candidate.name).second;
    });
    return staff;
}

RotationScheduler::RotationScheduler(RotationPolicy policy, core::TraceWriter* trace)
    : policy_(std::move(policy))
    , trace_(trace) {
    policy_.validate();
}

RotationPlan RotationScheduler::schedule_window(std::span<const core::Resource> occupied,
                                                const std::vector<StaffCandidate>& roster,
                                                double window_start) {
    std::vector<RotationDemand> demands;
    demands.reserve(occupied.size());
    double spacing = policy_.window_hours / policy_.rounds_per_resource;
    for (const auto& resource : occupied) {
        demands.push_back(RotationDemand{
            .resource_id = resource.id,
            .request_id = {},
            .pool = roster,
            .rounds = policy_.rounds_per_resource,
            .first_start = window_start,
            .spacing_hours = spacing,
        });
    }
    return schedule(demands);
}

RotationPlan RotationScheduler::schedule(const std::vector<RotationDemand>& demands) {
    ZoneScoped;
    RotationPlan plan;
    for (const auto& demand : demands) {
        schedule_demand(demand, plan);
    }
    return plan;
}

void RotationScheduler::schedule_demand(const RotationDemand& demand, RotationPlan& plan) {
    auto pool = order_by_load(demand.pool);
    const auto& durations = policy_.round_durations_minutes;

    for (int k = 0; k < demand.rounds; ++k) {
        double start = demand.first_start + k * demand.spacing_hours;
        double length = core::minutes_to_hours(durations[static_cast<std::size_t>(k) % durations.size()]);
        core::TimeWindow slot{start, start + length};

        const StaffCandidate* chosen = nullptr;
        for (std::size_t step = 0; step < pool.size(); ++step) {
            const auto& candidate = pool[(offset_ + step) % pool.size()];
            if (ledger_.is_free(candidate.name, slot)) {
                chosen = &candidate;
                break;
            }
        }

        if (chosen == nullptr) {
            plan.unfilled.push_back(UnfilledSlot{
                demand.resource_id, demand.request_id, k, slot.start, slot.stop});
            core::emit_trace(trace_, slot.start, [&](core::TraceWriter& w) {
                w.type("round_unfilled");
                w.field("room", std::string_view{demand.resource_id});
                w.field("round", static_cast<uint64_t>(k));
                w.field("stop", slot.stop);
            });
            continue;
        }

        ledger_.commit(chosen->name, slot);
        ++offset_;
        plan.rounds.push_back(core::RotationRound{
            chosen->name, demand.resource_id, demand.request_id, slot.start, slot.stop});
        core::emit_trace(trace_, slot.start, [&](core::TraceWriter& w) {
            w.type("round_assigned");
            w.field("staff", std::string_view{chosen->name});
            w.field("room", std::string_view{demand.resource_id});
            w.field("stop", slot.stop);
        });
    }
}

} // namespace wardsched::algo
