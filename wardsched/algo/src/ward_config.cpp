#include <wardsched/algo/ward_config.hpp>

#include <wardsched/core/error.hpp>

namespace wardsched::algo {

void WardConfig::validate() const {
    if (admission_threshold < 0.0 || admission_threshold > 1.0) {
        throw core::InvalidArgumentError("admission_threshold must be in [0, 1]");
    }
    rotation.validate();
    if (scoring.max_load < 0) {
        throw core::InvalidArgumentError("max_staff_load must not be negative");
    }
    if (default_batch_size == 0) {
        throw core::InvalidArgumentError("default_batch_size must be positive");
    }
    if (need_fallback_probability < 0.0 || need_fallback_probability > 1.0) {
        throw core::InvalidArgumentError("need_fallback_probability must be in [0, 1]");
    }
    if (default_duration_hours <= 0.0 || duration_fallback_hours <= 0.0) {
        throw core::InvalidArgumentError("fallback durations must be positive");
    }
    if (min_duration_hours < 0.0 || max_duration_hours < min_duration_hours) {
        throw core::InvalidArgumentError("duration clamp must satisfy 0 <= min <= max");
    }
}

std::vector<StaffCandidate> WardConfig::effective_roster() const {
    if (!roster.empty()) {
        return roster;
    }
    std::vector<StaffCandidate> result;
    result.reserve(default_roster_size);
    for (std::size_t i = 0; i < default_roster_size; ++i) {
        result.push_back(StaffCandidate{"Nurse_" + std::to_string(i + 1), 0});
    }
    return result;
}

} // namespace wardsched::algo
