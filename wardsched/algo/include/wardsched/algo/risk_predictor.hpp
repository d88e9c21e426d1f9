#pragma once

#include <wardsched/core/request.hpp>

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace wardsched::algo {

struct WardConfig;

/// @brief Which downstream model a predictor serves.
/// @ingroup algo_predictors
enum class ModelTask {
    NeedPredictor,     ///< Probability in [0, 1] that a resource is needed.
    DurationPredictor  ///< Predicted occupancy in hours (non-negative).
};

/// @brief Model variant selected for a run.
/// @ingroup algo_predictors
enum class ModelVariant {
    VariantA,
    VariantB,
    Ensemble  ///< Mean of VariantA and VariantB unless installed explicitly.
};

/// @brief Contract for the external risk models.
///
/// Implementations map the request's projected features to a single
/// number. They must be safe to call concurrently for different requests.
///
/// @ingroup algo_predictors
class RiskPredictor {
public:
    virtual ~RiskPredictor() = default;

    /// @brief Predict a value from @p features.
    /// @throws PredictorError when no value can be produced.
    [[nodiscard]] virtual double predict(const core::FeatureMap& features) const = 0;

protected:
    RiskPredictor() = default;
    RiskPredictor(const RiskPredictor&) = default;
    RiskPredictor& operator=(const RiskPredictor&) = default;
    RiskPredictor(RiskPredictor&&) = default;
    RiskPredictor& operator=(RiskPredictor&&) = default;
};

/// @brief Predictor that reads a precomputed value from one feature column.
///
/// This is how replayed model outputs enter a run: the feed carries a
/// column (e.g. `need_probability`) that holds the model's answer.
///
/// @ingroup algo_predictors
class FeatureColumnPredictor : public RiskPredictor {
public:
    explicit FeatureColumnPredictor(std::string column);

    /// @throws PredictorError if the column is missing or not a number.
    [[nodiscard]] double predict(const core::FeatureMap& features) const override;

    [[nodiscard]] const std::string& column() const noexcept { return column_; }

private:
    std::string column_;
};

/// @brief Predictor averaging the outputs of several predictors.
/// @ingroup algo_predictors
class EnsemblePredictor : public RiskPredictor {
public:
    /// @throws core::InvalidArgumentError if @p members is empty.
    explicit EnsemblePredictor(std::vector<std::shared_ptr<const RiskPredictor>> members);

    /// @throws PredictorError if any member fails.
    [[nodiscard]] double predict(const core::FeatureMap& features) const override;

private:
    std::vector<std::shared_ptr<const RiskPredictor>> members_;
};

/// @brief Predictors installed per (task, variant).
/// @ingroup algo_predictors
class PredictorSet {
public:
    /// @brief Install @p predictor for @p task and @p variant (replaces any previous one).
    void install(ModelTask task, ModelVariant variant, std::shared_ptr<const RiskPredictor> predictor);

    /// @brief Look up the predictor for @p task and @p variant.
    ///
    /// An Ensemble lookup with nothing installed for it averages VariantA
    /// and VariantB when both are present.
    ///
    /// @return The predictor, or nullptr when none is available.
    [[nodiscard]] std::shared_ptr<const RiskPredictor> find(ModelTask task, ModelVariant variant) const;

private:
    std::map<std::pair<ModelTask, ModelVariant>, std::shared_ptr<const RiskPredictor>> predictors_;
};

/// @brief One prediction, with whether the fallback value was substituted.
/// @ingroup algo_predictors
struct Prediction {
    double value{0.0};
    bool fallback{false};
    std::string reason;  ///< Failure message when @c fallback is set.
};

/// @brief Pair of need/duration predictors that never throws.
///
/// A missing or failing predictor yields the configured fallback
/// (0.5 probability, 72 hours by default). Durations are clamped into the
/// configured plausible range and rounded to the nearest hour.
///
/// @ingroup algo_predictors
class GuardedRiskModel {
public:
    GuardedRiskModel(const PredictorSet& predictors, ModelVariant variant, const WardConfig& config);

    /// @brief Probability that the request needs a resource, in [0, 1].
    [[nodiscard]] Prediction predict_need(const core::FeatureMap& features) const;

    /// @brief Predicted occupancy in whole hours.
    [[nodiscard]] Prediction predict_duration(const core::FeatureMap& features) const;

private:
    std::shared_ptr<const RiskPredictor> need_;
    std::shared_ptr<const RiskPredictor> duration_;
    double need_fallback_;
    double duration_fallback_;
    double min_duration_;
    double max_duration_;
};

/// @brief Short name of a variant ("a", "b", "ensemble").
[[nodiscard]] const char* to_string(ModelVariant variant) noexcept;

} // namespace wardsched::algo
