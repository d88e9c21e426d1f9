#include <wardsched/core/error.hpp>
#include <wardsched/core/resource_pool.hpp>
#include <wardsched/core/trace_writer.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace wardsched::core;

namespace {

// Records event types and string fields only
class MockTraceWriter : public TraceWriter {
public:
    struct Record {
        double time{0.0};
        std::string type_name;
        std::vector<std::pair<std::string, std::string>> fields;
    };

    void begin(double time) override {
        current_ = Record{};
        current_.time = time;
    }
    void type(std::string_view name) override { current_.type_name = std::string(name); }
    void field(std::string_view key, double value) override {
        current_.fields.emplace_back(std::string(key), std::to_string(value));
    }
    void field(std::string_view key, uint64_t value) override {
        current_.fields.emplace_back(std::string(key), std::to_string(value));
    }
    void field(std::string_view key, std::string_view value) override {
        current_.fields.emplace_back(std::string(key), std::string(value));
    }
    void end() override { records.push_back(current_); }

    std::vector<Record> records;

private:
    Record current_;
};

} // anonymous namespace

class ResourcePoolTest : public ::testing::Test {
protected:
    ResourcePool pool_{std::vector<std::string>{"A", "B", "C"}};
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(ResourcePoolTest, FreshResourcesAreAvailableAtZero) {
    ASSERT_EQ(pool_.size(), 3U);
    for (std::size_t i = 0; i < pool_.size(); ++i) {
        EXPECT_DOUBLE_EQ(pool_.next_available(i), 0.0);
        EXPECT_FALSE(pool_.resources()[i].booked());
    }
}

TEST(ResourcePoolConstructionTest, DefaultIds) {
    auto pool = ResourcePool::with_default_ids(50);
    ASSERT_EQ(pool.size(), 50U);
    EXPECT_EQ(pool.resources().front().id, "R1");
    EXPECT_EQ(pool.resources().back().id, "R50");
}

TEST(ResourcePoolConstructionTest, DuplicateIdsThrow) {
    EXPECT_THROW(ResourcePool(std::vector<std::string>{"R1", "R2", "R1"}), DuplicateIdError);
}

TEST(ResourcePoolConstructionTest, InvertedOccupancyThrows) {
    std::vector<Resource> resources{{"R1", 10.0, 5.0}};
    EXPECT_THROW(ResourcePool{resources}, InvalidArgumentError);
}

TEST(ResourcePoolConstructionTest, KeepsExistingOccupancy) {
    std::vector<Resource> resources{{"R1", 0.0, 12.0}, {"R2", std::nullopt, std::nullopt}};
    ResourcePool pool(resources);
    EXPECT_DOUBLE_EQ(pool.next_available("R1"), 12.0);
    EXPECT_DOUBLE_EQ(pool.next_available("R2"), 0.0);
}

// =============================================================================
// allocate
// =============================================================================

TEST_F(ResourcePoolTest, FirstBookingTakesFirstResource) {
    auto booking = pool_.allocate(5.0);
    ASSERT_TRUE(booking.has_value());
    EXPECT_EQ(booking->resource_id, "A");
    EXPECT_EQ(booking->index, 0U);
    EXPECT_DOUBLE_EQ(booking->start, 0.0);
    EXPECT_DOUBLE_EQ(booking->stop, 5.0);
}

TEST_F(ResourcePoolTest, TieBreaksByPoolOrder) {
    ASSERT_TRUE(pool_.allocate(5.0).has_value());
    auto booking = pool_.allocate(3.0);
    ASSERT_TRUE(booking.has_value());
    EXPECT_EQ(booking->resource_id, "B");
    EXPECT_DOUBLE_EQ(booking->start, 0.0);
    EXPECT_DOUBLE_EQ(booking->stop, 3.0);
}

TEST_F(ResourcePoolTest, PicksEarliestAvailable) {
    ASSERT_TRUE(pool_.allocate(5.0).has_value());  // A until 5
    ASSERT_TRUE(pool_.allocate(3.0).has_value());  // B until 3
    ASSERT_TRUE(pool_.allocate(4.0).has_value());  // C until 4

    auto booking = pool_.allocate(2.0);
    ASSERT_TRUE(booking.has_value());
    EXPECT_EQ(booking->resource_id, "B");
    EXPECT_DOUBLE_EQ(booking->start, 3.0);
    EXPECT_DOUBLE_EQ(booking->stop, 5.0);
}

TEST_F(ResourcePoolTest, NextAvailableIsStartPlusDuration) {
    auto booking = pool_.allocate(7.5);
    ASSERT_TRUE(booking.has_value());
    EXPECT_DOUBLE_EQ(pool_.next_available(booking->index), booking->start + 7.5);
    EXPECT_DOUBLE_EQ(pool_.next_available("A"), 7.5);
}

TEST_F(ResourcePoolTest, AppendsAfterLastBookingWithoutBackfilling) {
    // A single occupancy chain per resource: no gap before the last booking is reused
    ResourcePool pool(std::vector<std::string>{"R1"});
    ASSERT_TRUE(pool.allocate(2.0).has_value());
    auto second = pool.allocate(1.0);
    ASSERT_TRUE(second.has_value());
    EXPECT_DOUBLE_EQ(second->start, 2.0);
    EXPECT_DOUBLE_EQ(second->stop, 3.0);
    EXPECT_DOUBLE_EQ(pool.resources()[0].occupied_from.value(), 2.0);
}

TEST_F(ResourcePoolTest, NonPositiveDurationReturnsNone) {
    EXPECT_FALSE(pool_.allocate(0.0).has_value());
    EXPECT_FALSE(pool_.allocate(-4.0).has_value());
    EXPECT_DOUBLE_EQ(pool_.next_available("A"), 0.0);
}

TEST_F(ResourcePoolTest, BookingRecordsOccupant) {
    ASSERT_TRUE(pool_.allocate(4.0, "P1").has_value());
    ASSERT_TRUE(pool_.allocate(4.0).has_value());
    EXPECT_EQ(pool_.resources()[0].occupant, std::optional<std::string>{"P1"});
    EXPECT_FALSE(pool_.resources()[1].occupant.has_value());

    // A later booking replaces the occupant
    ASSERT_TRUE(pool_.allocate(4.0).has_value());
    ASSERT_TRUE(pool_.allocate(2.0, "P4").has_value());
    EXPECT_EQ(pool_.resources()[0].occupant, std::optional<std::string>{"P4"});
}

TEST_F(ResourcePoolTest, NonFiniteDurationReturnsNone) {
    EXPECT_FALSE(pool_.allocate(std::numeric_limits<double>::quiet_NaN()).has_value());
    EXPECT_FALSE(pool_.allocate(std::numeric_limits<double>::infinity()).has_value());
    EXPECT_DOUBLE_EQ(pool_.next_available("A"), 0.0);
    EXPECT_TRUE(pool_.occupied().empty());
}

TEST(ResourcePoolEmptyTest, EmptyPoolReturnsNone) {
    ResourcePool pool;
    EXPECT_TRUE(pool.empty());
    EXPECT_FALSE(pool.allocate(5.0).has_value());
}

// =============================================================================
// Lookup
// =============================================================================

TEST_F(ResourcePoolTest, FindById) {
    EXPECT_EQ(pool_.find("C").value_or(99), 2U);
    EXPECT_FALSE(pool_.find("Z").has_value());
}

TEST_F(ResourcePoolTest, UnknownIdThrows) {
    EXPECT_THROW((void)pool_.next_available("Z"), UnknownResourceError);
    try {
        (void)pool_.next_available("Z");
    } catch (const UnknownResourceError& e) {
        EXPECT_EQ(e.resource_id(), "Z");
    }
}

TEST_F(ResourcePoolTest, IndexOutOfRangeThrows) {
    EXPECT_THROW((void)pool_.next_available(std::size_t{3}), std::out_of_range);
}

TEST_F(ResourcePoolTest, OccupiedListsBookedResourcesInPoolOrder) {
    EXPECT_TRUE(pool_.occupied().empty());
    ASSERT_TRUE(pool_.allocate(5.0).has_value());
    ASSERT_TRUE(pool_.allocate(3.0).has_value());
    auto occupied = pool_.occupied();
    ASSERT_EQ(occupied.size(), 2U);
    EXPECT_EQ(occupied[0].id, "A");
    EXPECT_EQ(occupied[1].id, "B");
}

// =============================================================================
// Tracing
// =============================================================================

TEST_F(ResourcePoolTest, BookingEmitsTraceEvent) {
    MockTraceWriter writer;
    pool_.set_trace_writer(&writer);

    ASSERT_TRUE(pool_.allocate(5.0).has_value());
    EXPECT_FALSE(pool_.allocate(0.0).has_value());

    ASSERT_EQ(writer.records.size(), 1U);
    EXPECT_EQ(writer.records[0].type_name, "room_booked");
    EXPECT_DOUBLE_EQ(writer.records[0].time, 0.0);
    ASSERT_FALSE(writer.records[0].fields.empty());
    EXPECT_EQ(writer.records[0].fields[0].first, "room");
    EXPECT_EQ(writer.records[0].fields[0].second, "A");
}

TEST_F(ResourcePoolTest, NoWriterIsSafe) {
    pool_.set_trace_writer(nullptr);
    EXPECT_TRUE(pool_.allocate(1.0).has_value());
}
