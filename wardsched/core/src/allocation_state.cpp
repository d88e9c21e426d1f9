#include <wardsched/core/allocation_state.hpp>

#include <algorithm>

namespace wardsched::core {

AllocationState::AllocationState(std::vector<Resource> resources, std::vector<Request> requests)
    : resources_(std::move(resources))
    , requests_(std::move(requests)) {
    // Validates ids and occupancy bounds
    [[maybe_unused]] ResourcePool check(resources_);
}

AllocationState AllocationState::capture(const ResourcePool& pool, std::vector<Request> requests) {
    auto resources = pool.resources();
    return AllocationState(std::vector<Resource>(resources.begin(), resources.end()),
                           std::move(requests));
}

ResourcePool AllocationState::restore_pool() const {
    return ResourcePool(resources_);
}

double AllocationState::horizon() const noexcept {
    double latest = 0.0;
    for (const auto& resource : resources_) {
        latest = std::max(latest, resource.next_available());
    }
    return latest;
}

} // namespace wardsched::core
