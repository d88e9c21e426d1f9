#include <wardsched/core/resource_pool.hpp>
#include <wardsched/core/error.hpp>

#include <tracy/Tracy.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace wardsched::core {

ResourcePool::ResourcePool(const std::vector<std::string>& ids) {
    resources_.reserve(ids.size());
    for (const auto& id : ids) {
        resources_.push_back(Resource{id, std::nullopt, std::nullopt});
    }
    index_resources();
}

ResourcePool::ResourcePool(std::vector<Resource> resources)
    : resources_(std::move(resources)) {
    for (const auto& resource : resources_) {
        if (resource.occupied_from && resource.occupied_until &&
            *resource.occupied_until < *resource.occupied_from) {
            throw InvalidArgumentError("resource '" + resource.id +
                                       "' has occupied_until before occupied_from");
        }
    }
    index_resources();
}

ResourcePool ResourcePool::with_default_ids(std::size_t count) {
    std::vector<std::string> ids;
    ids.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        ids.push_back("R" + std::to_string(i + 1));
    }
    return ResourcePool(ids);
}

void ResourcePool::index_resources() {
    index_by_id_.clear();
    index_by_id_.reserve(resources_.size());
    for (std::size_t i = 0; i < resources_.size(); ++i) {
        auto [it, inserted] = index_by_id_.emplace(resources_[i].id, i);
        if (!inserted) {
            throw DuplicateIdError("duplicate resource id '" + resources_[i].id + "'");
        }
    }
}

std::optional<Booking> ResourcePool::allocate(double duration_hours, std::string_view occupant) {
    ZoneScoped;
    if (!std::isfinite(duration_hours) || duration_hours <= 0.0 || resources_.empty()) {
        return std::nullopt;
    }

    // Strict '<' keeps the first resource in pool order on ties
    std::size_t best = 0;
    double best_next = std::numeric_limits<double>::infinity();
    for (std::size_t i = 0; i < resources_.size(); ++i) {
        double next = resources_[i].next_available();
        if (next < best_next) {
            best_next = next;
            best = i;
        }
    }

    auto& chosen = resources_[best];
    chosen.occupied_from = best_next;
    chosen.occupied_until = best_next + duration_hours;
    chosen.occupant = occupant.empty() ? std::nullopt : std::optional<std::string>(occupant);

    Booking booking{best, chosen.id, best_next, best_next + duration_hours};
    emit_trace(trace_writer_, booking.start, [&](TraceWriter& w) {
        w.type("room_booked");
        w.field("room", std::string_view{booking.resource_id});
        w.field("start", booking.start);
        w.field("stop", booking.stop);
    });
    return booking;
}

double ResourcePool::next_available(std::size_t index) const {
    if (index >= resources_.size()) {
        throw std::out_of_range("resource index " + std::to_string(index) + " out of range");
    }
    return resources_[index].next_available();
}

double ResourcePool::next_available(std::string_view id) const {
    auto index = find(id);
    if (!index) {
        throw UnknownResourceError(std::string(id));
    }
    return resources_[*index].next_available();
}

std::optional<std::size_t> ResourcePool::find(std::string_view id) const {
    auto it = index_by_id_.find(std::string(id));
    if (it == index_by_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Resource> ResourcePool::occupied() const {
    std::vector<Resource> result;
    for (const auto& resource : resources_) {
        if (resource.occupied()) {
            result.push_back(resource);
        }
    }
    return result;
}

} // namespace wardsched::core
