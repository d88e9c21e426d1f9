#pragma once

#include <stdexcept>
#include <string>

namespace wardsched::core {

/// @brief Base exception for all allocation errors.
///
/// All exceptions thrown by the core library derive from this class,
/// allowing callers to catch allocation-specific errors separately
/// from other `std::runtime_error` exceptions.
///
/// @see InvalidArgumentError, UnknownResourceError, DuplicateIdError
/// @ingroup core
class AllocationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when a value passed to the model is outside its valid range.
///
/// For example, a risk score outside [0, 1] or a negative rotation window.
///
/// @see AllocationError
/// @ingroup core
class InvalidArgumentError : public AllocationError {
public:
    using AllocationError::AllocationError;
};

/// @brief Thrown when a resource is looked up by an id the pool does not hold.
///
/// @see ResourcePool::next_available, AllocationError
/// @ingroup core
class UnknownResourceError : public AllocationError {
public:
    explicit UnknownResourceError(const std::string& resource_id)
        : AllocationError("unknown resource '" + resource_id + "'")
        , resource_id_(resource_id) {}

    /// @brief Id that failed to resolve.
    [[nodiscard]] const std::string& resource_id() const noexcept { return resource_id_; }

private:
    std::string resource_id_;
};

/// @brief Thrown when a pool or snapshot is built with the same id twice.
///
/// Resource ids key the occupancy timeline, so two entries sharing one id
/// would make bookings ambiguous.
///
/// @see ResourcePool, AllocationState
/// @ingroup core
class DuplicateIdError : public AllocationError {
public:
    using AllocationError::AllocationError;
};

} // namespace wardsched::core
