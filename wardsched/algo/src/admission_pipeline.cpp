#include <wardsched/algo/admission_pipeline.hpp>

#include <tracy/Tracy.hpp>

#include <algorithm>
#include <cstdio>
#include <future>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_map>

namespace wardsched::algo {

namespace {

void trace_fallback(core::TraceWriter* trace, const std::string& request_id,
                    std::string_view model, const Prediction& prediction) {
    core::emit_trace(trace, 0.0, [&](core::TraceWriter& w) {
        w.type("predictor_fallback");
        w.field("request", std::string_view{request_id});
        w.field("model", model);
        w.field("value", prediction.value);
        w.field("reason", std::string_view{prediction.reason});
    });
}

// Tag each round with the request currently occupying its resource. The
// resource's own occupant wins over the prior snapshot's request list.
void label_rounds(std::vector<core::RotationRound>& rounds,
                  const std::vector<core::Resource>& occupied,
                  const core::AllocationState* prior) {
    std::unordered_map<std::string, std::string> occupant;
    if (prior != nullptr) {
        for (const auto& request : prior->requests()) {
            if (request.assigned()) {
                occupant[*request.resource_id] = request.id;
            }
        }
    }
    for (const auto& resource : occupied) {
        if (resource.occupant) {
            occupant[resource.id] = *resource.occupant;
        }
    }

    for (auto& round : rounds) {
        auto it = occupant.find(round.resource_id);
        if (it != occupant.end()) {
            round.request_id = it->second;
        }
    }
}

} // anonymous namespace

core::FeatureMap project_features(const core::FeatureMap& features,
                                  const std::vector<std::string>& columns) {
    if (columns.empty()) {
        return features;
    }
    core::FeatureMap projected;
    for (const auto& column : columns) {
        auto it = features.find(column);
        if (it != features.end()) {
            projected.emplace(it->first, it->second);
        }
    }
    return projected;
}

std::string format_briefing(const RiskSummary& summary) {
    char probability[32];
    std::snprintf(probability, sizeof(probability), "%.2f%%", summary.probability * 100.0);
    std::string text = "Request " + summary.request_id + ": need probability=" + probability +
                       "; admitted=" + (summary.admitted ? "true" : "false") + "; ";
    if (summary.admitted) {
        char hours[32];
        std::snprintf(hours, sizeof(hours), "%.0f", summary.duration_hours);
        text += std::string("duration=") + hours + "h.";
    } else {
        text += "no resource requested.";
    }
    return text;
}

AdmissionPipeline::AdmissionPipeline(WardConfig config,
                                     const PredictorSet& predictors,
                                     ModelVariant variant,
                                     core::TraceWriter* trace)
    : config_(std::move(config))
    , model_(predictors, variant, config_)
    , trace_(trace) {
    config_.validate();
}

AdmissionPipeline::RowPrediction AdmissionPipeline::predict_row(const core::FeedRow& row) const {
    RowPrediction result;
    result.need = model_.predict_need(project_features(row.features, config_.need_features));
    if (result.need.value >= config_.admission_threshold) {
        result.duration = model_.predict_duration(
            project_features(row.features, config_.duration_features));
    }
    return result;
}

std::size_t AdmissionPipeline::prediction_chunk_size() noexcept {
    return std::max(1U, std::thread::hardware_concurrency());
}

std::vector<AdmissionPipeline::RowPrediction> AdmissionPipeline::predict_all(
    std::span<const core::FeedRow> rows, std::stop_token stop) const {
    const std::size_t chunk = prediction_chunk_size();
    std::vector<RowPrediction> results;
    results.reserve(rows.size());

    for (std::size_t first = 0; first < rows.size(); first += chunk) {
        if (stop.stop_requested()) {
            break;
        }
        auto slice = rows.subspan(first, std::min(chunk, rows.size() - first));
        std::vector<std::future<RowPrediction>> pending;
        pending.reserve(slice.size());
        for (const auto& row : slice) {
            auto task = [this, &row] { return predict_row(row); };
            try {
                pending.push_back(std::async(std::launch::async, task));
            } catch (const std::system_error&) {
                // No thread available: evaluate on the calling thread
                pending.push_back(std::async(std::launch::deferred, task));
            }
        }
        for (auto& future : pending) {
            results.push_back(future.get());
        }
    }
    return results;
}

core::ResourcePool AdmissionPipeline::initial_pool(const core::AllocationState* prior) const {
    if (prior != nullptr) {
        return prior->restore_pool();
    }
    if (!config_.resource_ids.empty()) {
        return core::ResourcePool(config_.resource_ids);
    }
    return core::ResourcePool::with_default_ids(config_.default_resource_count);
}

BatchResult AdmissionPipeline::run(std::span<const core::FeedRow> feed,
                                   BatchWindow window,
                                   const core::AllocationState* prior,
                                   std::stop_token stop) const {
    ZoneScoped;
    std::size_t begin = std::min(window.start_index, feed.size());
    std::size_t count = std::min(window.max_count, feed.size() - begin);
    auto rows = feed.subspan(begin, count);

    core::ResourcePool pool = initial_pool(prior);
    pool.set_trace_writer(trace_);

    BatchResult result;
    result.requests.reserve(rows.size());
    for (const auto& row : rows) {
        result.requests.push_back(core::Request{row.request_id, std::nullopt, std::nullopt, std::nullopt});
    }

    core::emit_trace(trace_, 0.0, [&](core::TraceWriter& w) {
        w.type("batch_started");
        w.field("start_index", static_cast<uint64_t>(begin));
        w.field("count", static_cast<uint64_t>(count));
        w.field("resources", static_cast<uint64_t>(pool.size()));
    });

    std::vector<RowPrediction> predictions;
    if (parallel_) {
        predictions = predict_all(rows, stop);
    }

    for (std::size_t i = 0; i < rows.size(); ++i) {
        if (stop.stop_requested()) {
            result.cancelled = true;
            core::emit_trace(trace_, 0.0, [&](core::TraceWriter& w) {
                w.type("batch_cancelled");
                w.field("processed", static_cast<uint64_t>(i));
            });
            break;
        }
        const auto& row = rows[i];
        RowPrediction prediction = i < predictions.size() ? predictions[i] : predict_row(row);

        if (prediction.need.fallback) {
            trace_fallback(trace_, row.request_id, "need", prediction.need);
        }

        RiskSummary summary;
        summary.row_index = begin + i;
        summary.request_id = row.request_id;
        summary.probability = prediction.need.value;
        summary.need_fallback = prediction.need.fallback;
        summary.admitted = prediction.duration.has_value();

        if (!summary.admitted) {
            core::emit_trace(trace_, 0.0, [&](core::TraceWriter& w) {
                w.type("admission_skipped");
                w.field("request", std::string_view{row.request_id});
                w.field("probability", summary.probability);
            });
        } else {
            if (prediction.duration->fallback) {
                trace_fallback(trace_, row.request_id, "duration", *prediction.duration);
            }
            summary.duration_hours = prediction.duration->value;
            summary.duration_fallback = prediction.duration->fallback;

            auto booking = pool.allocate(summary.duration_hours, row.request_id);
            if (booking) {
                auto& request = result.requests[i];
                request.resource_id = booking->resource_id;
                request.start = booking->start;
                request.stop = booking->stop;
            } else {
                core::emit_trace(trace_, 0.0, [&](core::TraceWriter& w) {
                    w.type("booking_failed");
                    w.field("request", std::string_view{row.request_id});
                    w.field("duration", summary.duration_hours);
                });
            }
        }
        summary.briefing = format_briefing(summary);
        result.risk.push_back(std::move(summary));
    }

    RotationScheduler scheduler(config_.rotation, trace_);
    auto occupied = pool.occupied();
    auto plan = scheduler.schedule_window(occupied, config_.effective_roster());
    result.rotation = std::move(plan.rounds);
    result.unfilled = std::move(plan.unfilled);
    label_rounds(result.rotation, occupied, prior);

    result.conflicts = validate_rotation(result.rotation);
    for (const auto& conflict : result.conflicts.conflicts) {
        core::emit_trace(trace_, conflict.second.start, [&](core::TraceWriter& w) {
            w.type("rotation_conflict");
            w.field("staff", std::string_view{conflict.staff_name});
            w.field("detail", std::string_view{conflict.describe()});
        });
    }

    result.snapshot = core::AllocationState::capture(pool, result.requests);

    core::emit_trace(trace_, result.snapshot.horizon(), [&](core::TraceWriter& w) {
        w.type("batch_completed");
        w.field("processed", static_cast<uint64_t>(result.risk.size()));
        w.field("rounds", static_cast<uint64_t>(result.rotation.size()));
        w.field("unfilled", static_cast<uint64_t>(result.unfilled.size()));
        w.field("conflicts", static_cast<uint64_t>(result.conflicts.conflicts.size()));
    });

    enforce_conflict_policy(result.conflicts, config_.conflict_policy);
    return result;
}

} // namespace wardsched::algo
