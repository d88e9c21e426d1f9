#include <wardsched/algo/risk_predictor.hpp>

#include <wardsched/algo/error.hpp>
#include <wardsched/algo/ward_config.hpp>

#include <wardsched/core/error.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>

namespace wardsched::algo {

// =============================================================================
// FeatureColumnPredictor
// =============================================================================

FeatureColumnPredictor::FeatureColumnPredictor(std::string column)
    : column_(std::move(column)) {}

double FeatureColumnPredictor::predict(const core::FeatureMap& features) const {
    auto it = features.find(column_);
    if (it == features.end()) {
        throw PredictorError("feature '" + column_ + "' not provided");
    }
    const std::string& raw = it->second;
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (raw.empty() || ec != std::errc{} || ptr != raw.data() + raw.size() || !std::isfinite(value)) {
        throw PredictorError("feature '" + column_ + "' is not a number: '" + raw + "'");
    }
    return value;
}

// =============================================================================
// EnsemblePredictor
// =============================================================================

EnsemblePredictor::EnsemblePredictor(std::vector<std::shared_ptr<const RiskPredictor>> members)
    : members_(std::move(members)) {
    if (members_.empty()) {
        throw core::InvalidArgumentError("ensemble needs at least one member");
    }
}

double EnsemblePredictor::predict(const core::FeatureMap& features) const {
    double sum = 0.0;
    for (const auto& member : members_) {
        sum += member->predict(features);
    }
    return sum / static_cast<double>(members_.size());
}

// =============================================================================
// PredictorSet
// =============================================================================

void PredictorSet::install(ModelTask task, ModelVariant variant,
                           std::shared_ptr<const RiskPredictor> predictor) {
    predictors_[{task, variant}] = std::move(predictor);
}

std::shared_ptr<const RiskPredictor> PredictorSet::find(ModelTask task, ModelVariant variant) const {
    auto it = predictors_.find({task, variant});
    if (it != predictors_.end()) {
        return it->second;
    }
    if (variant != ModelVariant::Ensemble) {
        return nullptr;
    }
    auto a = predictors_.find({task, ModelVariant::VariantA});
    auto b = predictors_.find({task, ModelVariant::VariantB});
    if (a == predictors_.end() || b == predictors_.end()) {
        return nullptr;
    }
    return std::make_shared<EnsemblePredictor>(
        std::vector<std::shared_ptr<const RiskPredictor>>{a->second, b->second});
}

// =============================================================================
// GuardedRiskModel
// =============================================================================

GuardedRiskModel::GuardedRiskModel(const PredictorSet& predictors, ModelVariant variant,
                                   const WardConfig& config)
    : need_(predictors.find(ModelTask::NeedPredictor, variant))
    , duration_(predictors.find(ModelTask::DurationPredictor, variant))
    , need_fallback_(config.need_fallback_probability)
    , duration_fallback_(config.duration_fallback_hours)
    , min_duration_(config.min_duration_hours)
    , max_duration_(config.max_duration_hours) {}

Prediction GuardedRiskModel::predict_need(const core::FeatureMap& features) const {
    if (!need_) {
        return Prediction{need_fallback_, true, "no need predictor installed"};
    }
    try {
        double probability = need_->predict(features);
        if (!std::isfinite(probability)) {
            return Prediction{need_fallback_, true, "need predictor returned a non-finite value"};
        }
        return Prediction{std::clamp(probability, 0.0, 1.0), false, {}};
    } catch (const std::exception& e) {
        return Prediction{need_fallback_, true, e.what()};
    }
}

Prediction GuardedRiskModel::predict_duration(const core::FeatureMap& features) const {
    if (!duration_) {
        return Prediction{duration_fallback_, true, "no duration predictor installed"};
    }
    try {
        double hours = duration_->predict(features);
        if (!std::isfinite(hours)) {
            return Prediction{duration_fallback_, true, "duration predictor returned a non-finite value"};
        }
        // Halves round to even under the default rounding mode
        return Prediction{std::nearbyint(std::clamp(hours, min_duration_, max_duration_)), false, {}};
    } catch (const std::exception& e) {
        return Prediction{duration_fallback_, true, e.what()};
    }
}

const char* to_string(ModelVariant variant) noexcept {
    switch (variant) {
        case ModelVariant::VariantA: return "a";
        case ModelVariant::VariantB: return "b";
        case ModelVariant::Ensemble: return "ensemble";
    }
    return "unknown";
}

} // namespace wardsched::algo
