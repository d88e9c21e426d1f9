#pragma once

#include <wardsched/core/trace_writer.hpp>
#include <wardsched/core/types.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace wardsched::core {

/// @brief A bookable resource (room) and its latest occupancy.
///
/// A resource that was never booked has both bounds unset and is
/// available from time zero. Once set, `occupied_until >= occupied_from`.
///
/// @ingroup core_model
struct Resource {
    std::string id;
    std::optional<double> occupied_from;
    std::optional<double> occupied_until;
    std::optional<std::string> occupant{};  ///< Request holding the latest occupancy, when known.

    /// @brief True once the resource has been booked at least once.
    [[nodiscard]] bool booked() const noexcept { return occupied_until.has_value(); }

    /// @brief Earliest instant a new occupancy can begin.
    /// @return 0 if never booked, else `occupied_until`.
    [[nodiscard]] double next_available() const noexcept {
        return occupied_until.value_or(0.0);
    }

    /// @brief True if the resource holds an occupancy ending after time zero.
    [[nodiscard]] bool occupied() const noexcept {
        return occupied_until.has_value() && *occupied_until > 0.0;
    }
};

/// @brief Result of a successful ResourcePool::allocate call.
/// @ingroup core_model
struct Booking {
    std::size_t index;        ///< Stable index of the resource in its pool.
    std::string resource_id;  ///< Id of the booked resource.
    double start;             ///< Start of the occupancy (hours).
    double stop;              ///< End of the occupancy (hours).

    [[nodiscard]] TimeWindow window() const noexcept { return TimeWindow{start, stop}; }
};

/// @brief Owns the bookable resources and their occupancy chains.
///
/// Resources live in an arena addressed by stable index, with an id index
/// on the side. Each resource is a single growing occupancy chain: a new
/// booking always starts where the previous one stopped. There is no
/// backfilling into gaps before the latest booking.
///
/// A pool is a value type. Copying it copies every resource, so a copy
/// can be mutated without affecting the original.
///
/// @see AllocationState, Booking
/// @ingroup core_pool
class ResourcePool {
public:
    /// @brief Construct an empty pool.
    ResourcePool() = default;

    /// @brief Construct a pool of never-booked resources.
    /// @param ids Resource ids, in pool order.
    /// @throws DuplicateIdError if an id appears twice.
    explicit ResourcePool(const std::vector<std::string>& ids);

    /// @brief Construct a pool from existing resources (e.g. a snapshot).
    /// @param resources Resources, in pool order.
    /// @throws DuplicateIdError if an id appears twice.
    /// @throws InvalidArgumentError if a resource has `occupied_until < occupied_from`.
    explicit ResourcePool(std::vector<Resource> resources);

    /// @brief Build a pool of @p count never-booked resources named R1..Rn.
    [[nodiscard]] static ResourcePool with_default_ids(std::size_t count);

    /// @brief Book the earliest-available resource for @p duration_hours.
    ///
    /// Selects the resource with the minimum next-available time; ties go
    /// to the first such resource in pool order. The chosen resource is
    /// booked for `[next_available, next_available + duration_hours)`.
    ///
    /// @param duration_hours Length of the occupancy in hours.
    /// @param occupant Request taking the resource; empty when unknown.
    /// @return The booking, or std::nullopt if @p duration_hours is not a
    ///         finite positive number or the pool is empty.
    std::optional<Booking> allocate(double duration_hours, std::string_view occupant = {});

    /// @brief Next-available time of the resource at @p index.
    /// @throws std::out_of_range if @p index is past the end.
    [[nodiscard]] double next_available(std::size_t index) const;

    /// @brief Next-available time of the resource called @p id.
    /// @throws UnknownResourceError if no resource has that id.
    [[nodiscard]] double next_available(std::string_view id) const;

    /// @brief Index of the resource called @p id, if present.
    [[nodiscard]] std::optional<std::size_t> find(std::string_view id) const;

    /// @brief All resources, in pool order.
    [[nodiscard]] std::span<const Resource> resources() const noexcept { return resources_; }

    /// @brief Resources holding an occupancy that ends after time zero.
    [[nodiscard]] std::vector<Resource> occupied() const;

    [[nodiscard]] std::size_t size() const noexcept { return resources_.size(); }
    [[nodiscard]] bool empty() const noexcept { return resources_.empty(); }

    /// @brief Install a trace writer for `room_booked` events (may be nullptr).
    void set_trace_writer(TraceWriter* writer) noexcept { trace_writer_ = writer; }

private:
    void index_resources();

    std::vector<Resource> resources_;
    std::unordered_map<std::string, std::size_t> index_by_id_;
    TraceWriter* trace_writer_{nullptr};
};

} // namespace wardsched::core
