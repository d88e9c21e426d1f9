#include <wardsched/io/config_loader.hpp>
#include <wardsched/io/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace wardsched::io;
using namespace wardsched::algo;

class ConfigLoaderTest : public ::testing::Test {};

// =============================================================================
// Defaults and overrides
// =============================================================================

TEST_F(ConfigLoaderTest, EmptyObjectKeepsDefaults) {
    auto config = load_config_from_string("{}");
    EXPECT_DOUBLE_EQ(config.admission_threshold, 0.35);
    EXPECT_DOUBLE_EQ(config.rotation.window_hours, 12.0);
    EXPECT_EQ(config.rotation.rounds_per_resource, 4);
    EXPECT_EQ(config.default_resource_count, 50u);
    EXPECT_EQ(config.default_batch_size, 25u);
    EXPECT_EQ(config.effective_roster().size(), 30u);
    EXPECT_EQ(config.id_column, "encounter_id");
    EXPECT_EQ(config.conflict_policy, ConflictPolicy::Advisory);
    EXPECT_EQ(config.scoring.max_load, 6);
}

TEST_F(ConfigLoaderTest, OverridesEveryField) {
    const char* json = R"({
        "admission_threshold": 0.5,
        "rotation": {
            "window_hours": 8,
            "rounds_per_resource": 2,
            "round_durations_minutes": [10, 25],
            "interval_hours": 6
        },
        "scoring": {
            "max_staff_load": 4,
            "default_preference": ["General"],
            "resource_preferences": {"Critical": ["ICU", "Isolation"]},
            "required_certifications": {"Critical": ["ICU-certified"]}
        },
        "resource_ids": ["A", "B"],
        "default_batch_size": 10,
        "roster": [{"name": "Ana", "load": 1}, {"name": "Bo"}],
        "default_duration_hours": 48,
        "need_fallback_probability": 0.4,
        "duration_fallback_hours": 24,
        "min_duration_hours": 4,
        "max_duration_hours": 240,
        "need_features": ["age", "acuity"],
        "duration_features": ["los_hint"],
        "id_column": "patient_id",
        "conflict_policy": "enforce"
    })";

    auto config = load_config_from_string(json);

    EXPECT_DOUBLE_EQ(config.admission_threshold, 0.5);
    EXPECT_DOUBLE_EQ(config.rotation.window_hours, 8.0);
    EXPECT_EQ(config.rotation.rounds_per_resource, 2);
    EXPECT_EQ(config.rotation.round_durations_minutes, (std::vector<double>{10.0, 25.0}));
    EXPECT_DOUBLE_EQ(config.rotation.interval_hours, 6.0);

    EXPECT_EQ(config.scoring.max_load, 4);
    EXPECT_EQ(config.scoring.default_preference, std::vector<std::string>{"General"});
    EXPECT_EQ(config.scoring.resource_preferences.at("Critical"),
              (std::vector<std::string>{"ICU", "Isolation"}));
    // Tables are merged into the defaults
    EXPECT_EQ(config.scoring.resource_preferences.count("Stable"), 1u);
    EXPECT_EQ(config.scoring.required_certifications.at("Critical").count("ICU-certified"), 1u);

    EXPECT_EQ(config.resource_ids, (std::vector<std::string>{"A", "B"}));
    EXPECT_EQ(config.default_batch_size, 10u);
    ASSERT_EQ(config.roster.size(), 2u);
    EXPECT_EQ(config.roster[0].name, "Ana");
    EXPECT_EQ(config.roster[0].load, 1);
    EXPECT_EQ(config.roster[1].load, 0);

    EXPECT_DOUBLE_EQ(config.default_duration_hours, 48.0);
    EXPECT_DOUBLE_EQ(config.need_fallback_probability, 0.4);
    EXPECT_DOUBLE_EQ(config.duration_fallback_hours, 24.0);
    EXPECT_DOUBLE_EQ(config.min_duration_hours, 4.0);
    EXPECT_DOUBLE_EQ(config.max_duration_hours, 240.0);
    EXPECT_EQ(config.need_features, (std::vector<std::string>{"age", "acuity"}));
    EXPECT_EQ(config.duration_features, std::vector<std::string>{"los_hint"});
    EXPECT_EQ(config.id_column, "patient_id");
    EXPECT_EQ(config.conflict_policy, ConflictPolicy::Enforce);
}

TEST_F(ConfigLoaderTest, DefaultRosterSize) {
    auto config = load_config_from_string(R"({"default_roster_size": 3})");
    auto roster = config.effective_roster();
    ASSERT_EQ(roster.size(), 3u);
    EXPECT_EQ(roster[2].name, "Nurse_3");
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(ConfigLoaderTest, WrongTypesThrow) {
    EXPECT_THROW((void)load_config_from_string(R"({"admission_threshold": "high"})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"rotation": []})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"rotation": {"rounds_per_resource": 2.5}})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"default_batch_size": -3})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"resource_ids": ["A", 2]})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"roster": [{"load": 1}]})"), LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"conflict_policy": "strict"})"), LoaderError);
}

TEST_F(ConfigLoaderTest, InvalidValuesThrowWithContext) {
    try {
        (void)load_config_from_string(R"({"admission_threshold": 1.5})");
        FAIL() << "expected LoaderError";
    } catch (const LoaderError& e) {
        EXPECT_EQ(std::string(e.what()), "config: admission_threshold must be in [0, 1]");
    }
    EXPECT_THROW((void)load_config_from_string(R"({"rotation": {"round_durations_minutes": []}})"),
                 LoaderError);
    EXPECT_THROW((void)load_config_from_string(R"({"min_duration_hours": 10, "max_duration_hours": 5})"),
                 LoaderError);
}

TEST_F(ConfigLoaderTest, MalformedJsonThrows) {
    EXPECT_THROW((void)load_config_from_string("{"), LoaderError);
    EXPECT_THROW((void)load_config_from_string("[]"), LoaderError);
}

TEST_F(ConfigLoaderTest, MissingFileThrows) {
    EXPECT_THROW((void)load_config("/nonexistent/wardsched/config.json"), LoaderError);
}
