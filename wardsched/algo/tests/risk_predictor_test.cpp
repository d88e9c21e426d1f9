#include <wardsched/algo/error.hpp>
#include <wardsched/algo/risk_predictor.hpp>
#include <wardsched/algo/ward_config.hpp>

#include <wardsched/core/error.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <vector>

using namespace wardsched::algo;
using wardsched::core::FeatureMap;

namespace {

class ConstantPredictor : public RiskPredictor {
public:
    explicit ConstantPredictor(double value)
        : value_(value) {}

    [[nodiscard]] double predict(const FeatureMap& /*features*/) const override { return value_; }

private:
    double value_;
};

class FailingPredictor : public RiskPredictor {
public:
    [[nodiscard]] double predict(const FeatureMap& /*features*/) const override {
        throw PredictorError("model unavailable");
    }
};

} // anonymous namespace

// =============================================================================
// FeatureColumnPredictor
// =============================================================================

TEST(FeatureColumnPredictorTest, ReadsColumn) {
    FeatureColumnPredictor predictor("need_probability");
    EXPECT_DOUBLE_EQ(predictor.predict({{"need_probability", "0.75"}, {"age", "64"}}), 0.75);
    EXPECT_EQ(predictor.column(), "need_probability");
}

TEST(FeatureColumnPredictorTest, MissingColumnThrows) {
    FeatureColumnPredictor predictor("need_probability");
    EXPECT_THROW((void)predictor.predict({{"age", "64"}}), PredictorError);
}

TEST(FeatureColumnPredictorTest, NonNumericValueThrows) {
    FeatureColumnPredictor predictor("duration_hours");
    EXPECT_THROW((void)predictor.predict({{"duration_hours", ""}}), PredictorError);
    EXPECT_THROW((void)predictor.predict({{"duration_hours", "n/a"}}), PredictorError);
    EXPECT_THROW((void)predictor.predict({{"duration_hours", "12h"}}), PredictorError);
}

// =============================================================================
// PredictorSet and ensembles
// =============================================================================

TEST(PredictorSetTest, FindsInstalledVariant) {
    PredictorSet set;
    auto predictor = std::make_shared<ConstantPredictor>(0.2);
    set.install(ModelTask::NeedPredictor, ModelVariant::VariantB, predictor);

    EXPECT_EQ(set.find(ModelTask::NeedPredictor, ModelVariant::VariantB), predictor);
    EXPECT_EQ(set.find(ModelTask::NeedPredictor, ModelVariant::VariantA), nullptr);
    EXPECT_EQ(set.find(ModelTask::DurationPredictor, ModelVariant::VariantB), nullptr);
}

TEST(PredictorSetTest, EnsembleAveragesBothVariants) {
    PredictorSet set;
    set.install(ModelTask::NeedPredictor, ModelVariant::VariantA, std::make_shared<ConstantPredictor>(0.2));
    set.install(ModelTask::NeedPredictor, ModelVariant::VariantB, std::make_shared<ConstantPredictor>(0.6));

    auto ensemble = set.find(ModelTask::NeedPredictor, ModelVariant::Ensemble);
    ASSERT_NE(ensemble, nullptr);
    EXPECT_DOUBLE_EQ(ensemble->predict({}), 0.4);
}

TEST(PredictorSetTest, EnsembleNeedsBothVariants) {
    PredictorSet set;
    set.install(ModelTask::NeedPredictor, ModelVariant::VariantA, std::make_shared<ConstantPredictor>(0.2));
    EXPECT_EQ(set.find(ModelTask::NeedPredictor, ModelVariant::Ensemble), nullptr);
}

TEST(PredictorSetTest, ExplicitEnsembleWins) {
    PredictorSet set;
    set.install(ModelTask::NeedPredictor, ModelVariant::VariantA, std::make_shared<ConstantPredictor>(0.2));
    set.install(ModelTask::NeedPredictor, ModelVariant::VariantB, std::make_shared<ConstantPredictor>(0.6));
    set.install(ModelTask::NeedPredictor, ModelVariant::Ensemble, std::make_shared<ConstantPredictor>(0.9));

    EXPECT_DOUBLE_EQ(set.find(ModelTask::NeedPredictor, ModelVariant::Ensemble)->predict({}), 0.9);
}

TEST(EnsemblePredictorTest, EmptyMembersRejected) {
    EXPECT_THROW(EnsemblePredictor{std::vector<std::shared_ptr<const RiskPredictor>>{}},
                 wardsched::core::InvalidArgumentError);
}

// =============================================================================
// GuardedRiskModel
// =============================================================================

class GuardedRiskModelTest : public ::testing::Test {
protected:
    GuardedRiskModel model_with(std::shared_ptr<const RiskPredictor> need,
                                std::shared_ptr<const RiskPredictor> duration) {
        PredictorSet set;
        if (need) {
            set.install(ModelTask::NeedPredictor, ModelVariant::VariantA, std::move(need));
        }
        if (duration) {
            set.install(ModelTask::DurationPredictor, ModelVariant::VariantA, std::move(duration));
        }
        return GuardedRiskModel(set, ModelVariant::VariantA, config_);
    }

    WardConfig config_;
};

TEST_F(GuardedRiskModelTest, PassesThroughValidPredictions) {
    auto model = model_with(std::make_shared<ConstantPredictor>(0.42),
                            std::make_shared<ConstantPredictor>(30.4));
    auto need = model.predict_need({});
    EXPECT_DOUBLE_EQ(need.value, 0.42);
    EXPECT_FALSE(need.fallback);

    auto duration = model.predict_duration({});
    EXPECT_DOUBLE_EQ(duration.value, 30.0);
    EXPECT_FALSE(duration.fallback);
}

TEST_F(GuardedRiskModelTest, MissingPredictorsFallBack) {
    auto model = model_with(nullptr, nullptr);
    auto need = model.predict_need({});
    EXPECT_TRUE(need.fallback);
    EXPECT_DOUBLE_EQ(need.value, 0.5);
    EXPECT_FALSE(need.reason.empty());

    auto duration = model.predict_duration({});
    EXPECT_TRUE(duration.fallback);
    EXPECT_DOUBLE_EQ(duration.value, 72.0);
}

TEST_F(GuardedRiskModelTest, ThrowingPredictorFallsBack) {
    auto model = model_with(std::make_shared<FailingPredictor>(), std::make_shared<FailingPredictor>());
    auto need = model.predict_need({});
    EXPECT_TRUE(need.fallback);
    EXPECT_EQ(need.reason, "model unavailable");
    EXPECT_DOUBLE_EQ(model.predict_duration({}).value, 72.0);
}

TEST_F(GuardedRiskModelTest, NonFiniteValuesFallBack) {
    double nan = std::numeric_limits<double>::quiet_NaN();
    auto model = model_with(std::make_shared<ConstantPredictor>(nan),
                            std::make_shared<ConstantPredictor>(nan));
    EXPECT_TRUE(model.predict_need({}).fallback);
    EXPECT_TRUE(model.predict_duration({}).fallback);
}

TEST_F(GuardedRiskModelTest, ClampsOutOfRangeValues) {
    auto high = model_with(std::make_shared<ConstantPredictor>(1.7),
                           std::make_shared<ConstantPredictor>(1000.0));
    EXPECT_DOUBLE_EQ(high.predict_need({}).value, 1.0);
    EXPECT_DOUBLE_EQ(high.predict_duration({}).value, 336.0);

    auto low = model_with(std::make_shared<ConstantPredictor>(-0.3),
                          std::make_shared<ConstantPredictor>(1.0));
    EXPECT_DOUBLE_EQ(low.predict_need({}).value, 0.0);
    EXPECT_DOUBLE_EQ(low.predict_duration({}).value, 6.0);
}

TEST_F(GuardedRiskModelTest, DurationHalvesRoundToEven) {
    auto down = model_with(std::make_shared<ConstantPredictor>(0.9),
                           std::make_shared<ConstantPredictor>(6.5));
    EXPECT_DOUBLE_EQ(down.predict_duration({}).value, 6.0);

    auto up = model_with(std::make_shared<ConstantPredictor>(0.9),
                         std::make_shared<ConstantPredictor>(7.5));
    EXPECT_DOUBLE_EQ(up.predict_duration({}).value, 8.0);

    auto plain = model_with(std::make_shared<ConstantPredictor>(0.9),
                            std::make_shared<ConstantPredictor>(12.6));
    EXPECT_DOUBLE_EQ(plain.predict_duration({}).value, 13.0);
}

TEST_F(GuardedRiskModelTest, CustomFallbacksFromConfig) {
    config_.need_fallback_probability = 0.9;
    config_.duration_fallback_hours = 48.0;
    auto model = model_with(nullptr, nullptr);
    EXPECT_DOUBLE_EQ(model.predict_need({}).value, 0.9);
    EXPECT_DOUBLE_EQ(model.predict_duration({}).value, 48.0);
}

TEST(ModelVariantTest, ShortNames) {
    EXPECT_STREQ(to_string(ModelVariant::VariantA), "a");
    EXPECT_STREQ(to_string(ModelVariant::VariantB), "b");
    EXPECT_STREQ(to_string(ModelVariant::Ensemble), "ensemble");
}
