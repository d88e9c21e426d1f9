#include <wardsched/algo/conflict_validator.hpp>
#include <wardsched/algo/rotation_scheduler.hpp>

#include <wardsched/core/error.hpp>

#include <wardsched/io/trace_writers.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace wardsched::algo;
using namespace wardsched::core;

class RotationSchedulerTest : public ::testing::Test {
protected:
    static std::vector<Resource> occupied(std::initializer_list<const char*> ids) {
        std::vector<Resource> result;
        for (const char* id : ids) {
            result.push_back(Resource{id, 0.0, 72.0});
        }
        return result;
    }

    static RotationDemand demand(const char* resource, const char* request,
                                 std::vector<StaffCandidate> pool, int rounds) {
        return RotationDemand{
            .resource_id = resource,
            .request_id = request,
            .pool = std::move(pool),
            .rounds = rounds,
            .first_start = 0.0,
            .spacing_hours = 4.0,
        };
    }
};

// =============================================================================
// Window rotations
// =============================================================================

TEST_F(RotationSchedulerTest, FourRoundsSpreadOverTwelveHours) {
    RotationScheduler scheduler(RotationPolicy{});
    auto resources = occupied({"R1"});
    auto plan = scheduler.schedule_window(resources, {{"S1", 0}, {"S2", 0}});

    ASSERT_EQ(plan.rounds.size(), 4U);
    EXPECT_TRUE(plan.unfilled.empty());

    const double starts[] = {0.0, 3.0, 6.0, 9.0};
    const double minutes[] = {15.0, 20.0, 30.0, 15.0};
    const char* staff[] = {"S1", "S2", "S1", "S2"};
    for (std::size_t k = 0; k < 4; ++k) {
        EXPECT_DOUBLE_EQ(plan.rounds[k].start, starts[k]);
        EXPECT_DOUBLE_EQ(plan.rounds[k].stop, starts[k] + minutes[k] / 60.0);
        EXPECT_EQ(plan.rounds[k].staff_name, staff[k]);
        EXPECT_EQ(plan.rounds[k].resource_id, "R1");
    }
}

TEST_F(RotationSchedulerTest, RefusesDoubleAssignmentUnderStress) {
    RotationPolicy policy;
    policy.window_hours = 2.0;
    policy.rounds_per_resource = 8;
    RotationScheduler scheduler(policy);

    auto resources = occupied({"R1"});
    auto plan = scheduler.schedule_window(resources, {{"S1", 0}});

    // Rounds 2 ([0.5, 1.0)) and 5 ([1.25, 1.75)) collide with the previous round
    ASSERT_EQ(plan.unfilled.size(), 2U);
    EXPECT_EQ(plan.unfilled[0].round_index, 2);
    EXPECT_DOUBLE_EQ(plan.unfilled[0].start, 0.5);
    EXPECT_EQ(plan.unfilled[1].round_index, 5);
    EXPECT_EQ(plan.rounds.size(), 6U);
    EXPECT_TRUE(validate_rotation(plan.rounds).valid());
}

TEST_F(RotationSchedulerTest, NoStaffOverlapAcrossResources) {
    RotationScheduler scheduler(RotationPolicy{});
    auto resources = occupied({"R1", "R2", "R3"});
    auto plan = scheduler.schedule_window(resources, {{"S1", 0}, {"S2", 0}});

    // Three resources share the same slot times; two staff cover two of them
    EXPECT_EQ(plan.rounds.size(), 8U);
    EXPECT_EQ(plan.unfilled.size(), 4U);
    EXPECT_TRUE(validate_rotation(plan.rounds).valid());
}

TEST_F(RotationSchedulerTest, EmptyRosterLeavesEverySlotUnfilled) {
    RotationScheduler scheduler(RotationPolicy{});
    auto resources = occupied({"R1"});
    auto plan = scheduler.schedule_window(resources, {});
    EXPECT_TRUE(plan.rounds.empty());
    EXPECT_EQ(plan.unfilled.size(), 4U);
}

TEST_F(RotationSchedulerTest, WindowStartShiftsRounds) {
    RotationScheduler scheduler(RotationPolicy{});
    auto resources = occupied({"R1"});
    auto plan = scheduler.schedule_window(resources, {{"S1", 0}}, 24.0);
    ASSERT_EQ(plan.rounds.size(), 4U);
    EXPECT_DOUBLE_EQ(plan.rounds[0].start, 24.0);
    EXPECT_DOUBLE_EQ(plan.rounds[3].start, 33.0);
}

// =============================================================================
// Per-request pools
// =============================================================================

TEST_F(RotationSchedulerTest, LedgerIsKeyedByStaffAcrossDemands) {
    RotationScheduler scheduler(RotationPolicy{});
    auto plan = scheduler.schedule({
        demand("R1", "P1", {{"X", 0}}, 2),
        demand("R2", "P2", {{"X", 0}}, 2),
    });

    ASSERT_EQ(plan.rounds.size(), 2U);
    EXPECT_EQ(plan.rounds[0].request_id, "P1");
    EXPECT_EQ(plan.rounds[1].request_id, "P1");
    ASSERT_EQ(plan.unfilled.size(), 2U);
    EXPECT_EQ(plan.unfilled[0].request_id, "P2");
    EXPECT_EQ(scheduler.ledger().intervals("X").size(), 2U);
}

TEST_F(RotationSchedulerTest, SharedStaffFallsBackToOtherCandidate) {
    RotationScheduler scheduler(RotationPolicy{});
    auto plan = scheduler.schedule({
        demand("R1", "P1", {{"X", 0}}, 1),
        demand("R2", "P2", {{"X", 0}, {"Y", 1}}, 1),
    });

    ASSERT_EQ(plan.rounds.size(), 2U);
    EXPECT_EQ(plan.rounds[0].staff_name, "X");
    EXPECT_EQ(plan.rounds[1].staff_name, "Y");
    EXPECT_TRUE(plan.unfilled.empty());
}

TEST_F(RotationSchedulerTest, DurationDerivedRoundsUseInterval) {
    RotationScheduler scheduler(RotationPolicy{});
    auto plan = scheduler.schedule({demand("R1", "P1", {{"X", 0}}, 3)});
    ASSERT_EQ(plan.rounds.size(), 3U);
    EXPECT_DOUBLE_EQ(plan.rounds[1].start, 4.0);
    EXPECT_DOUBLE_EQ(plan.rounds[2].start, 8.0);
    EXPECT_DOUBLE_EQ(plan.rounds[2].stop, 8.5);
}

// =============================================================================
// Staff ordering and ledger
// =============================================================================

TEST(OrderByLoadTest, LoadThenName) {
    auto ordered = order_by_load({{"C", 0}, {"B", 2}, {"A", 0}});
    ASSERT_EQ(ordered.size(), 3U);
    EXPECT_EQ(ordered[0].name, "A");
    EXPECT_EQ(ordered[1].name, "C");
    EXPECT_EQ(ordered[2].name, "B");
}

TEST(OrderByLoadTest, DuplicateNamesKeepLeastLoaded) {
    auto ordered = order_by_load({{"A", 3}, {"B", 1}, {"A", 0}});
    ASSERT_EQ(ordered.size(), 2U);
    EXPECT_EQ(ordered[0].name, "A");
    EXPECT_EQ(ordered[0].load, 0);
}

TEST(StaffLedgerTest, HalfOpenIntervals) {
    StaffLedger ledger;
    ledger.commit("X", TimeWindow{0.0, 0.25});
    EXPECT_FALSE(ledger.is_free("X", TimeWindow{0.1, 0.2}));
    EXPECT_TRUE(ledger.is_free("X", TimeWindow{0.25, 0.5}));
    EXPECT_TRUE(ledger.is_free("Y", TimeWindow{0.0, 0.25}));
    EXPECT_EQ(ledger.staff_count(), 1U);
    EXPECT_TRUE(ledger.intervals("Y").empty());
}

// =============================================================================
// Policy and tracing
// =============================================================================

TEST(RotationPolicyTest, RejectsInvalidPolicies) {
    RotationPolicy no_rounds;
    no_rounds.rounds_per_resource = 0;
    EXPECT_THROW(RotationScheduler{no_rounds}, InvalidArgumentError);

    RotationPolicy no_durations;
    no_durations.round_durations_minutes.clear();
    EXPECT_THROW(RotationScheduler{no_durations}, InvalidArgumentError);

    RotationPolicy bad_window;
    bad_window.window_hours = 0.0;
    EXPECT_THROW(RotationScheduler{bad_window}, InvalidArgumentError);
}

TEST_F(RotationSchedulerTest, EmitsAssignedAndUnfilledEvents) {
    wardsched::io::MemoryTraceWriter trace;
    RotationScheduler scheduler(RotationPolicy{}, &trace);
    auto resources = occupied({"R1", "R2"});
    auto plan = scheduler.schedule_window(resources, {{"S1", 0}});

    EXPECT_EQ(trace.count("round_assigned"), plan.rounds.size());
    EXPECT_EQ(trace.count("round_unfilled"), plan.unfilled.size());
    EXPECT_EQ(plan.unfilled.size(), 4U);
    auto unfilled = trace.of_type("round_unfilled");
    ASSERT_FALSE(unfilled.empty());
    EXPECT_EQ(unfilled[0].text("room"), "R2");
}
