#include <wardsched/algo/conflict_validator.hpp>

#include <algorithm>
#include <map>
#include <sstream>

namespace wardsched::algo {

namespace {

void describe_round(std::ostringstream& oss, const core::RotationRound& round) {
    oss << round.resource_id << " [" << round.start << "h, " << round.stop << "h)";
}

} // anonymous namespace

std::string RotationConflict::describe() const {
    std::ostringstream oss;
    oss << "staff '" << staff_name << "' double-booked: ";
    describe_round(oss, first);
    oss << " overlaps ";
    describe_round(oss, second);
    return oss.str();
}

std::vector<std::string> ConflictReport::descriptions() const {
    std::vector<std::string> result;
    result.reserve(conflicts.size());
    for (const auto& conflict : conflicts) {
        result.push_back(conflict.describe());
    }
    return result;
}

ConflictReport validate_rotation(std::span<const core::RotationRound> rounds) {
    std::map<std::string, std::vector<const core::RotationRound*>> by_staff;
    for (const auto& round : rounds) {
        by_staff[round.staff_name].push_back(&round);
    }

    ConflictReport report;
    for (auto& [staff, staff_rounds] : by_staff) {
        std::stable_sort(staff_rounds.begin(), staff_rounds.end(),
            [](const core::RotationRound* lhs, const core::RotationRound* rhs) {
                return lhs->start < rhs->start;
            });
        for (std::size_t i = 0; i < staff_rounds.size(); ++i) {
            for (std::size_t j = i + 1; j < staff_rounds.size(); ++j) {
                // Sorted by start: nothing later can overlap round i
                if (staff_rounds[j]->start >= staff_rounds[i]->stop) {
                    break;
                }
                if (staff_rounds[i]->window().overlaps(staff_rounds[j]->window())) {
                    report.conflicts.push_back(
                        RotationConflict{staff, *staff_rounds[i], *staff_rounds[j]});
                }
            }
        }
    }
    return report;
}

void enforce_conflict_policy(const ConflictReport& report, ConflictPolicy policy) {
    if (policy == ConflictPolicy::Enforce && !report.valid()) {
        throw RotationConflictError(report.conflicts.size(), report.conflicts.front().describe());
    }
}

} // namespace wardsched::algo
