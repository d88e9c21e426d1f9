#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace wardsched::algo {

/// @brief Exception thrown by a risk predictor that cannot produce a value.
/// @ingroup algo
///
/// Predictor implementations throw this when a feature is missing or a
/// model is unavailable. The allocation pipeline never lets it escape: the
/// guarded model substitutes the documented fallback and traces
/// `predictor_fallback`.
///
/// @see RiskPredictor, GuardedRiskModel
class PredictorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Exception thrown when a rotation fails validation under
///        ConflictPolicy::Enforce.
/// @ingroup algo
///
/// @see validate_rotation, ConflictPolicy
class RotationConflictError : public std::runtime_error {
public:
    /// @brief Construct with the number of violations found.
    /// @param conflict_count Number of overlapping round pairs.
    /// @param first_description Description of the first violation.
    RotationConflictError(std::size_t conflict_count, const std::string& first_description)
        : std::runtime_error(
              "rotation has " + std::to_string(conflict_count) +
              " staff conflict(s), first: " + first_description)
        , conflict_count_(conflict_count) {}

    /// @brief Number of overlapping round pairs.
    [[nodiscard]] std::size_t conflict_count() const noexcept { return conflict_count_; }

private:
    std::size_t conflict_count_;
};

/// @brief Policy for handling staff conflicts detected after scheduling.
///
/// @see validate_rotation, RotationConflictError
enum class ConflictPolicy {
    Advisory,  ///< Report conflicts and return the result (default).
    Enforce    ///< Throw RotationConflictError when any conflict is found.
};

} // namespace wardsched::algo
