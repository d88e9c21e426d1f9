#pragma once

#include <wardsched/core/request.hpp>
#include <wardsched/core/resource_pool.hpp>

#include <vector>

namespace wardsched::core {

/// @brief Snapshot of a run: every resource plus the run's request ledger.
///
/// An AllocationState is produced at the end (or at the cancellation point)
/// of a batch run and is owned by whoever holds it. It is a value type:
/// continuing from it with restore_pool() hands out a deep copy of the
/// resources, so the snapshot stays valid and re-usable for retries or
/// what-if runs.
///
/// Batch N+1 must continue from exactly the snapshot produced by batch N
/// to keep a single consistent timeline per resource.
///
/// @see ResourcePool
/// @ingroup core_pool
class AllocationState {
public:
    /// @brief Empty state (no resources, no requests).
    AllocationState() = default;

    /// @brief Build a state from resources and requests.
    /// @throws DuplicateIdError if two resources share an id.
    AllocationState(std::vector<Resource> resources, std::vector<Request> requests);

    /// @brief Capture the current contents of @p pool with @p requests.
    [[nodiscard]] static AllocationState capture(const ResourcePool& pool,
                                                 std::vector<Request> requests);

    /// @brief Take an exclusive, mutable copy of the snapshot's resources.
    [[nodiscard]] ResourcePool restore_pool() const;

    [[nodiscard]] const std::vector<Resource>& resources() const noexcept { return resources_; }
    [[nodiscard]] const std::vector<Request>& requests() const noexcept { return requests_; }

    /// @brief Latest occupancy end across all resources (0 if none booked).
    [[nodiscard]] double horizon() const noexcept;

private:
    std::vector<Resource> resources_;
    std::vector<Request> requests_;
};

} // namespace wardsched::core
