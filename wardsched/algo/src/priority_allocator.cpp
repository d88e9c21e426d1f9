#include <wardsched/algo/priority_allocator.hpp>

#include <wardsched/algo/duration_label.hpp>
#include <wardsched/algo/ward_config.hpp>

#include <tracy/Tracy.hpp>

#include <algorithm>
#include <numeric>
#include <set>
#include <utility>

namespace wardsched::algo {

namespace {

using StaffResourcePair = std::pair<std::string, std::string>;

std::vector<StaffCandidate> staff_pool(const std::vector<core::FeasibleOption>& options) {
    std::vector<StaffCandidate> pool;
    pool.reserve(options.size());
    for (const auto& option : options) {
        pool.push_back(StaffCandidate{option.staff_name, option.staff_load});
    }
    return pool;
}

} // anonymous namespace

const core::AllocationRecord* BatchAllocation::find(std::string_view request_id) const {
    auto it = std::find_if(records.begin(), records.end(),
        [&](const core::AllocationRecord& record) { return record.request_id == request_id; });
    return it == records.end() ? nullptr : &*it;
}

PriorityAllocator::PriorityAllocator(ScoringPolicy scoring,
                                     RotationPolicy rotation,
                                     double default_duration_hours,
                                     ConflictPolicy conflict_policy,
                                     core::TraceWriter* trace)
    : scoring_(std::move(scoring))
    , rotation_(std::move(rotation))
    , default_duration_hours_(default_duration_hours)
    , conflict_policy_(conflict_policy)
    , trace_(trace) {
    rotation_.validate();
}

PriorityAllocator::PriorityAllocator(const WardConfig& config, core::TraceWriter* trace)
    : PriorityAllocator(config.scoring, config.rotation, config.default_duration_hours,
                        config.conflict_policy, trace) {}

std::vector<std::size_t> PriorityAllocator::processing_order(
    const std::vector<AllocationRequest>& batch) {
    std::vector<std::size_t> order(batch.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
        return batch[lhs].profile.score > batch[rhs].profile.score;
    });
    return order;
}

BatchAllocation PriorityAllocator::allocate(const std::vector<AllocationRequest>& batch,
                                            std::stop_token stop) const {
    ZoneScoped;
    BatchAllocation result;
    auto order = processing_order(batch);
    std::set<StaffResourcePair> used_pairs;
    std::vector<std::size_t> processed;

    for (std::size_t index : order) {
        if (stop.stop_requested()) {
            result.cancelled = true;
            break;
        }
        const auto& request = batch[index];
        processed.push_back(index);

        core::AllocationRecord record;
        record.request_id = request.request_id;
        record.risk_score = request.profile.score;
        record.risk_category = request.profile.category;
        record.duration_label = request.duration_label;

        const core::FeasibleOption* best = nullptr;
        double best_score = 0.0;
        for (const auto& option : request.options) {
            if (used_pairs.contains({option.staff_name, option.resource_id})) {
                continue;
            }
            double total = score_option(scoring_, request.profile.category, option).total();
            // Strict '>' keeps the first option on ties
            if (best == nullptr || total > best_score) {
                best = &option;
                best_score = total;
            }
        }

        if (best == nullptr) {
            record.status = core::AllocationStatus::Waitlisted;
            record.waitlist_position = waitlist_band(request.profile.score);
            core::emit_trace(trace_, 0.0, [&](core::TraceWriter& w) {
                w.type("request_waitlisted");
                w.field("request", std::string_view{record.request_id});
                w.field("score", record.risk_score);
                w.field("position", static_cast<uint64_t>(*record.waitlist_position));
            });
        } else {
            used_pairs.insert({best->staff_name, best->resource_id});
            record.status = core::AllocationStatus::Assigned;
            record.resource_id = best->resource_id;
            record.staff_name = best->staff_name;
            record.match_score = best_score;
            core::emit_trace(trace_, 0.0, [&](core::TraceWriter& w) {
                w.type("request_assigned");
                w.field("request", std::string_view{record.request_id});
                w.field("room", std::string_view{best->resource_id});
                w.field("staff", std::string_view{best->staff_name});
                w.field("match", best_score);
            });
        }
        result.records.push_back(std::move(record));
    }

    result.rotation = build_rotation(batch, processed, result.records);
    result.conflicts = validate_rotation(result.rotation.rounds);
    for (const auto& conflict : result.conflicts.conflicts) {
        core::emit_trace(trace_, conflict.second.start, [&](core::TraceWriter& w) {
            w.type("rotation_conflict");
            w.field("staff", std::string_view{conflict.staff_name});
            w.field("detail", std::string_view{conflict.describe()});
        });
    }
    enforce_conflict_policy(result.conflicts, conflict_policy_);
    return result;
}

RotationPlan PriorityAllocator::build_rotation(const std::vector<AllocationRequest>& batch,
                                               const std::vector<std::size_t>& order,
                                               std::vector<core::AllocationRecord>& records) const {
    // One scheduler keeps a single staff ledger across every demand
    RotationScheduler scheduler(rotation_, trace_);
    RotationPlan plan;
    for (std::size_t i = 0; i < order.size(); ++i) {
        auto& record = records[i];
        if (record.status != core::AllocationStatus::Assigned) {
            continue;
        }
        const auto& request = batch[order[i]];
        std::optional<std::string_view> label;
        if (request.duration_label) {
            label = *request.duration_label;
        }
        double hours = duration_label_hours(label, default_duration_hours_);
        RotationDemand demand{
            .resource_id = *record.resource_id,
            .request_id = record.request_id,
            .pool = staff_pool(request.options),
            .rounds = rounds_for_duration(hours, rotation_.interval_hours),
            .first_start = 0.0,
            .spacing_hours = rotation_.interval_hours,
        };

        // Rounds go to the record that produced the demand, not to its id
        auto part = scheduler.schedule({demand});
        record.rotation_rounds = part.rounds;
        plan.merge(std::move(part));
    }
    return plan;
}

} // namespace wardsched::algo
