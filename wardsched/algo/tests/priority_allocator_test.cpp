#include <wardsched/algo/priority_allocator.hpp>
#include <wardsched/algo/ward_config.hpp>

#include <wardsched/io/trace_writers.hpp>

#include <gtest/gtest.h>

#include <stop_token>
#include <vector>

using namespace wardsched::algo;
using namespace wardsched::core;

class PriorityAllocatorTest : public ::testing::Test {
protected:
    static AllocationRequest request(const char* id, double score, const char* category,
                                     std::vector<FeasibleOption> options,
                                     std::optional<std::string> label = std::nullopt) {
        return AllocationRequest{id, RiskProfile{score, category}, std::move(label), std::move(options)};
    }

    static FeasibleOption option(const char* staff, const char* resource,
                                 const char* type = "General", int load = 0) {
        return FeasibleOption{staff, resource, type, load, std::nullopt};
    }

    WardConfig config_;
    wardsched::io::MemoryTraceWriter trace_;
    PriorityAllocator allocator_{config_, &trace_};
};

// =============================================================================
// Processing order
// =============================================================================

TEST_F(PriorityAllocatorTest, DescendingScoreStableOnTies) {
    std::vector<AllocationRequest> batch{
        request("P0", 0.4, "Low", {}),
        request("P1", 0.9, "Low", {}),
        request("P2", 0.9, "Low", {}),
        request("P3", 0.6, "Low", {}),
    };
    auto order = PriorityAllocator::processing_order(batch);
    EXPECT_EQ(order, (std::vector<std::size_t>{1, 2, 3, 0}));

    auto result = allocator_.allocate(batch);
    ASSERT_EQ(result.records.size(), 4U);
    EXPECT_EQ(result.records[0].request_id, "P1");
    EXPECT_EQ(result.records[1].request_id, "P2");
    EXPECT_EQ(result.records[2].request_id, "P3");
    EXPECT_EQ(result.records[3].request_id, "P0");
}

// =============================================================================
// Serial dictatorship
// =============================================================================

TEST_F(PriorityAllocatorTest, HigherRiskTakesContestedPair) {
    std::vector<AllocationRequest> batch{
        request("P2", 0.4, "Stable", {option("X", "R1")}),
        request("P1", 0.9, "Critical", {option("X", "R1")}),
    };
    auto result = allocator_.allocate(batch);

    const auto* p1 = result.find("P1");
    const auto* p2 = result.find("P2");
    ASSERT_NE(p1, nullptr);
    ASSERT_NE(p2, nullptr);
    EXPECT_EQ(p1->status, AllocationStatus::Assigned);
    EXPECT_EQ(p1->staff_name, std::optional<std::string>{"X"});
    EXPECT_EQ(p1->resource_id, std::optional<std::string>{"R1"});
    EXPECT_EQ(p2->status, AllocationStatus::Waitlisted);
    EXPECT_EQ(p2->waitlist_position, std::optional<int>{3});
    EXPECT_FALSE(p2->resource_id.has_value());
}

TEST_F(PriorityAllocatorTest, ConsumedPairIsNeverReused) {
    std::vector<AllocationRequest> batch{
        request("P1", 0.9, "Low", {option("X", "R1"), option("Y", "R2")}),
        request("P2", 0.8, "Low", {option("X", "R1"), option("Y", "R2")}),
        request("P3", 0.7, "Low", {option("X", "R1"), option("Y", "R2")}),
    };
    auto result = allocator_.allocate(batch);

    EXPECT_EQ(result.find("P1")->staff_name.value_or(""), "X");
    EXPECT_EQ(result.find("P2")->staff_name.value_or(""), "Y");
    EXPECT_EQ(result.find("P3")->status, AllocationStatus::Waitlisted);
    EXPECT_EQ(result.find("P3")->waitlist_position.value_or(0), 2);
}

TEST_F(PriorityAllocatorTest, SameStaffDifferentResourceIsANewPair) {
    std::vector<AllocationRequest> batch{
        request("P1", 0.9, "Low", {option("X", "R1")}),
        request("P2", 0.8, "Low", {option("X", "R2")}),
    };
    auto result = allocator_.allocate(batch);
    EXPECT_EQ(result.find("P1")->status, AllocationStatus::Assigned);
    EXPECT_EQ(result.find("P2")->status, AllocationStatus::Assigned);
}

TEST_F(PriorityAllocatorTest, PicksBestScoringOption) {
    std::vector<AllocationRequest> batch{
        request("P1", 0.9, "Critical", {
            option("N1", "R1", "General", 0),
            option("N2", "R2", "Negative Pressure", 0),
            option("N3", "R3", "Negative Pressure", 5),
        }),
    };
    auto result = allocator_.allocate(batch);
    const auto& record = result.records.at(0);
    EXPECT_EQ(record.resource_id.value_or(""), "R2");
    EXPECT_DOUBLE_EQ(record.match_score.value_or(0.0), 2.0);
}

TEST_F(PriorityAllocatorTest, FirstOptionWinsTies) {
    std::vector<AllocationRequest> batch{
        request("P1", 0.9, "Low", {option("B", "R9"), option("A", "R1")}),
    };
    auto result = allocator_.allocate(batch);
    EXPECT_EQ(result.records.at(0).staff_name.value_or(""), "B");
}

TEST_F(PriorityAllocatorTest, WaitlistBandsIgnoreQueueLength) {
    std::vector<AllocationRequest> batch{
        request("P1", 0.95, "Low", {}),
        request("P2", 0.85, "Low", {}),
        request("P3", 0.55, "Low", {}),
        request("P4", 0.10, "Low", {}),
    };
    auto result = allocator_.allocate(batch);
    EXPECT_EQ(result.find("P1")->waitlist_position.value_or(0), 1);
    EXPECT_EQ(result.find("P2")->waitlist_position.value_or(0), 1);
    EXPECT_EQ(result.find("P3")->waitlist_position.value_or(0), 2);
    EXPECT_EQ(result.find("P4")->waitlist_position.value_or(0), 3);
}

// =============================================================================
// Rotation after allocation
// =============================================================================

TEST_F(PriorityAllocatorTest, RoundCountFollowsDurationLabel) {
    std::vector<AllocationRequest> batch{
        request("P1", 0.9, "Low", {option("X", "R1")}, "24-48 hours"),
        request("P2", 0.8, "Low", {option("Y", "R2")}),
    };
    auto result = allocator_.allocate(batch);

    EXPECT_EQ(result.find("P1")->rotation_rounds.size(), 9U);   // 36 h / 4 h
    EXPECT_EQ(result.find("P2")->rotation_rounds.size(), 18U);  // 72 h default
    EXPECT_EQ(result.rotation.rounds.size(), 27U);
    EXPECT_DOUBLE_EQ(result.find("P1")->rotation_rounds[1].start, 4.0);
}

TEST_F(PriorityAllocatorTest, RotationHasNoStaffConflictsAcrossRequests) {
    std::vector<AllocationRequest> batch{
        request("P1", 0.9, "Low", {option("X", "R1")}, "1 day"),
        request("P2", 0.8, "Low", {option("X", "R2")}, "1 day"),
    };
    auto result = allocator_.allocate(batch);

    EXPECT_EQ(result.find("P1")->rotation_rounds.size(), 6U);
    EXPECT_TRUE(result.find("P2")->rotation_rounds.empty());
    EXPECT_EQ(result.rotation.unfilled.size(), 6U);
    EXPECT_TRUE(result.conflicts.valid());
}

TEST_F(PriorityAllocatorTest, WaitlistedRequestsGetNoRounds) {
    std::vector<AllocationRequest> batch{
        request("P1", 0.9, "Low", {option("X", "R1")}),
        request("P2", 0.4, "Low", {option("X", "R1")}),
    };
    auto result = allocator_.allocate(batch);
    EXPECT_TRUE(result.find("P2")->rotation_rounds.empty());
    for (const auto& round : result.rotation.rounds) {
        EXPECT_EQ(round.request_id, "P1");
    }
}

TEST_F(PriorityAllocatorTest, RoundsFollowTheirRecordWhenIdsRepeat) {
    std::vector<AllocationRequest> batch{
        request("P", 0.9, "Low", {option("X", "R1")}, "8 hours"),
        request("P", 0.8, "Low", {option("Y", "R2")}, "8 hours"),
    };
    auto result = allocator_.allocate(batch);

    ASSERT_EQ(result.records.size(), 2U);
    const auto& first = result.records[0];
    const auto& second = result.records[1];
    EXPECT_EQ(first.resource_id, std::optional<std::string>{"R1"});
    EXPECT_EQ(second.resource_id, std::optional<std::string>{"R2"});
    ASSERT_EQ(first.rotation_rounds.size(), 2U);
    ASSERT_EQ(second.rotation_rounds.size(), 2U);
    for (const auto& round : first.rotation_rounds) {
        EXPECT_EQ(round.resource_id, "R1");
        EXPECT_EQ(round.staff_name, "X");
    }
    for (const auto& round : second.rotation_rounds) {
        EXPECT_EQ(round.resource_id, "R2");
        EXPECT_EQ(round.staff_name, "Y");
    }
    EXPECT_EQ(result.rotation.rounds.size(), 4U);
}

// =============================================================================
// Cancellation and tracing
// =============================================================================

TEST_F(PriorityAllocatorTest, StoppedBeforeStartReturnsEmptyCancelledResult) {
    std::stop_source source;
    source.request_stop();
    std::vector<AllocationRequest> batch{request("P1", 0.9, "Low", {option("X", "R1")})};

    auto result = allocator_.allocate(batch, source.get_token());
    EXPECT_TRUE(result.cancelled);
    EXPECT_TRUE(result.records.empty());
    EXPECT_TRUE(result.rotation.rounds.empty());
}

TEST_F(PriorityAllocatorTest, EmitsAssignmentEvents) {
    std::vector<AllocationRequest> batch{
        request("P1", 0.9, "Low", {option("X", "R1")}),
        request("P2", 0.4, "Low", {option("X", "R1")}),
    };
    (void)allocator_.allocate(batch);

    ASSERT_EQ(trace_.count("request_assigned"), 1U);
    ASSERT_EQ(trace_.count("request_waitlisted"), 1U);
    auto waitlisted = trace_.of_type("request_waitlisted");
    EXPECT_EQ(waitlisted[0].text("request"), "P2");
    EXPECT_DOUBLE_EQ(waitlisted[0].number("position"), 3.0);
}

TEST_F(PriorityAllocatorTest, EmptyBatch) {
    auto result = allocator_.allocate({});
    EXPECT_TRUE(result.records.empty());
    EXPECT_FALSE(result.cancelled);
    EXPECT_TRUE(result.conflicts.valid());
}
