#include <wardsched/algo/option_scoring.hpp>

#include <algorithm>

namespace wardsched::algo {

namespace {

const std::string NEGATIVE_PRESSURE = "Negative Pressure";
const std::string ISOLATION = "Isolation";
const std::string GENERAL = "General";

} // anonymous namespace

ScoringPolicy default_scoring_policy() {
    ScoringPolicy policy;
    policy.resource_preferences = {
        {"Critical", {NEGATIVE_PRESSURE, ISOLATION, GENERAL}},
        {"High", {ISOLATION, NEGATIVE_PRESSURE, GENERAL}},
        {"Observation", {ISOLATION, GENERAL, NEGATIVE_PRESSURE}},
        {"Stable", {GENERAL, ISOLATION, NEGATIVE_PRESSURE}},
        {"Low", {GENERAL}},
    };
    policy.default_preference = {NEGATIVE_PRESSURE, ISOLATION, GENERAL};
    policy.required_certifications = {
        {"Critical", {"ICU-certified"}},
        {"High", {"ICU-certified", "ER-specialist"}},
        {"Observation", {"ICU-certified", "ER-specialist"}},
        {"Stable", {"General"}},
    };
    policy.max_load = 6;
    return policy;
}

double resource_type_fit(const ScoringPolicy& policy,
                         std::string_view category,
                         std::string_view resource_type) {
    const std::vector<std::string>* order = &policy.default_preference;
    auto it = policy.resource_preferences.find(std::string(category));
    if (it != policy.resource_preferences.end()) {
        order = &it->second;
    }
    if (order->empty()) {
        return 0.0;
    }
    auto pos = std::find(order->begin(), order->end(), resource_type);
    if (pos == order->end()) {
        return 0.0;
    }
    auto index = static_cast<double>(pos - order->begin());
    return 1.0 - index / static_cast<double>(order->size());
}

double staff_load_fit(int load, int max_load) noexcept {
    if (max_load <= 0) {
        return 1.0;
    }
    return std::max(0.0, 1.0 - static_cast<double>(load) / static_cast<double>(max_load));
}

double certification_fit(const ScoringPolicy& policy,
                         std::string_view category,
                         const std::set<std::string>& certifications) {
    auto it = policy.required_certifications.find(std::string(category));
    if (it == policy.required_certifications.end() || it->second.empty()) {
        return 0.0;
    }
    const auto& required = it->second;
    auto held = std::count_if(required.begin(), required.end(),
        [&](const std::string& cert) { return certifications.contains(cert); });
    return static_cast<double>(held) / static_cast<double>(required.size());
}

OptionScore score_option(const ScoringPolicy& policy,
                         std::string_view category,
                         const core::FeasibleOption& option) {
    OptionScore score;
    score.resource_fit = resource_type_fit(policy, category, option.resource_type);
    score.load_fit = staff_load_fit(option.staff_load, policy.max_load);
    if (option.staff_certifications) {
        score.certification_fit = certification_fit(policy, category, *option.staff_certifications);
    }
    return score;
}

} // namespace wardsched::algo
