#pragma once

#include <wardsched/algo/conflict_validator.hpp>
#include <wardsched/algo/risk_predictor.hpp>
#include <wardsched/algo/rotation_scheduler.hpp>
#include <wardsched/algo/ward_config.hpp>

#include <wardsched/core/allocation_state.hpp>
#include <wardsched/core/request.hpp>
#include <wardsched/core/trace_writer.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace wardsched::algo {

/// @brief Slice of the request feed handled by one batch.
/// @ingroup algo_pipeline
struct BatchWindow {
    std::size_t start_index{0};
    std::size_t max_count{25};
};

/// @brief Risk assessment of one request of a batch.
/// @ingroup algo_pipeline
struct RiskSummary {
    std::size_t row_index{0};
    std::string request_id;
    double probability{0.0};
    bool admitted{false};          ///< probability >= admission threshold.
    double duration_hours{-1.0};   ///< -1 when not admitted.
    bool need_fallback{false};
    bool duration_fallback{false};
    std::string briefing;          ///< One-line summary for staff.
};

/// @brief Everything a batch run produces.
/// @ingroup algo_pipeline
struct BatchResult {
    /// Requests of the window, in submission order, with their bookings.
    std::vector<core::Request> requests;
    /// Resources and requests as of the end of the run; input of the next batch.
    core::AllocationState snapshot;
    /// Rounds over the next rotation window for every occupied resource.
    std::vector<core::RotationRound> rotation;
    std::vector<UnfilledSlot> unfilled;
    std::vector<RiskSummary> risk;
    ConflictReport conflicts;
    /// True if the run stopped before the end of its window.
    bool cancelled{false};
};

/// @brief Runs predict-admit-book-rotate over a window of the request feed.
///
/// For each request of the window, in submission order: predict need;
/// when the probability reaches the admission threshold, predict the
/// duration and book a resource for it. Requests below the threshold never
/// reach the pool. Afterwards every occupied resource gets its rotation
/// rounds over the next window from the configured roster, and the rounds
/// are validated.
///
/// Predictions of different requests may run in parallel; bookings are
/// always made in submission order. A run continuing from a prior snapshot
/// works on its own copy of the snapshot's resources.
///
/// @ingroup algo_pipeline
/// @see Ward, ResourcePool::allocate, RotationScheduler::schedule_window
class AdmissionPipeline {
public:
    /// @throws core::InvalidArgumentError if @p config is invalid.
    AdmissionPipeline(WardConfig config,
                      const PredictorSet& predictors,
                      ModelVariant variant = ModelVariant::VariantA,
                      core::TraceWriter* trace = nullptr);

    /// @brief Predict need/duration concurrently across requests.
    ///
    /// Rows are predicted in chunks of prediction_chunk_size() threads; the
    /// stop token is checked between chunks.
    void set_parallel_predictions(bool enabled) noexcept { parallel_ = enabled; }

    /// @brief Rows predicted concurrently per chunk (hardware threads, at least 1).
    [[nodiscard]] static std::size_t prediction_chunk_size() noexcept;

    /// @brief Run one batch.
    ///
    /// @param feed   Full backing request list.
    /// @param window Slice of @p feed to process.
    /// @param prior  Snapshot to continue from, or nullptr for a fresh pool.
    /// @param stop   Checked between requests; a cancelled run returns its
    ///               partial result with a valid snapshot.
    /// @throws RotationConflictError under ConflictPolicy::Enforce.
    [[nodiscard]] BatchResult run(std::span<const core::FeedRow> feed,
                                  BatchWindow window,
                                  const core::AllocationState* prior = nullptr,
                                  std::stop_token stop = {}) const;

    [[nodiscard]] const WardConfig& config() const noexcept { return config_; }

private:
    struct RowPrediction {
        Prediction need;
        std::optional<Prediction> duration;
    };

    [[nodiscard]] RowPrediction predict_row(const core::FeedRow& row) const;
    [[nodiscard]] std::vector<RowPrediction> predict_all(std::span<const core::FeedRow> rows,
                                                         std::stop_token stop) const;
    [[nodiscard]] core::ResourcePool initial_pool(const core::AllocationState* prior) const;

    WardConfig config_;
    GuardedRiskModel model_;
    core::TraceWriter* trace_;
    bool parallel_{false};
};

/// @brief Keep only @p columns of @p features (all of them when empty).
[[nodiscard]] core::FeatureMap project_features(const core::FeatureMap& features,
                                                const std::vector<std::string>& columns);

/// @brief One-line staff briefing for a risk summary.
[[nodiscard]] std::string format_briefing(const RiskSummary& summary);

} // namespace wardsched::algo
