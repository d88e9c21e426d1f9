#include <wardsched/algo/admission_pipeline.hpp>
#include <wardsched/algo/error.hpp>
#include <wardsched/algo/risk_predictor.hpp>
#include <wardsched/algo/ward_config.hpp>

#include <wardsched/core/allocation_state.hpp>
#include <wardsched/core/error.hpp>

#include <wardsched/io/config_loader.hpp>
#include <wardsched/io/error.hpp>
#include <wardsched/io/output_writers.hpp>
#include <wardsched/io/request_feed.hpp>
#include <wardsched/io/snapshot_io.hpp>
#include <wardsched/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

namespace core = wardsched::core;
namespace algo = wardsched::algo;
namespace io = wardsched::io;

struct Config {
    std::string feed_file;
    std::string config_file;
    std::string state_dir;
    std::size_t start{0};
    std::optional<std::size_t> count;
    std::string output_dir{"output"};
    std::string trace_file;
    bool verbose{false};
    bool parallel{false};
    std::string variant{"a"};
    std::string need_column{"need_probability"};
    std::string duration_column{"duration_hours"};
    bool strict_conflicts{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("wardsched-pipeline",
                             "Predict, admit and book a batch of requests, then plan staff rounds");

    options.add_options()
        ("f,feed", "Request feed (CSV)", cxxopts::value<std::string>())
        ("c,config", "Ward configuration (JSON)", cxxopts::value<std::string>())
        ("s,state", "Snapshot of the previous batch (file or output directory)", cxxopts::value<std::string>())
        ("start", "Feed index of the first request (default: 0)", cxxopts::value<std::size_t>()->default_value("0"))
        ("n,count", "Requests in this batch (default: config batch size)", cxxopts::value<std::size_t>())
        ("o,output", "Output directory (default: output)", cxxopts::value<std::string>()->default_value("output"))
        ("t,trace", "JSON trace file", cxxopts::value<std::string>())
        ("parallel", "Run predictions concurrently")
        ("variant", "Model variant: a|b|ensemble (default: a)", cxxopts::value<std::string>()->default_value("a"))
        ("need-column", "Feed column holding the need probability",
            cxxopts::value<std::string>()->default_value("need_probability"))
        ("duration-column", "Feed column holding the predicted duration (hours)",
            cxxopts::value<std::string>()->default_value("duration_hours"))
        ("strict-conflicts", "Fail when the rotation has staff conflicts")
        ("v,verbose", "Textual trace on stderr")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("feed") == 0U) {
        std::cerr << "Error: --feed is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.feed_file = result["feed"].as<std::string>();
    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
    }
    if (result.count("state") != 0U) {
        config.state_dir = result["state"].as<std::string>();
    }
    config.start = result["start"].as<std::size_t>();
    if (result.count("count") != 0U) {
        config.count = result["count"].as<std::size_t>();
    }
    config.output_dir = result["output"].as<std::string>();
    if (result.count("trace") != 0U) {
        config.trace_file = result["trace"].as<std::string>();
    }
    config.parallel = result.count("parallel") != 0U;
    config.variant = result["variant"].as<std::string>();
    config.need_column = result["need-column"].as<std::string>();
    config.duration_column = result["duration-column"].as<std::string>();
    config.strict_conflicts = result.count("strict-conflicts") != 0U;
    config.verbose = result.count("verbose") != 0U;

    return config;
}

algo::ModelVariant parse_variant(const std::string& name) {
    if (name == "a") {
        return algo::ModelVariant::VariantA;
    }
    if (name == "b") {
        return algo::ModelVariant::VariantB;
    }
    if (name == "ensemble") {
        return algo::ModelVariant::Ensemble;
    }
    throw core::InvalidArgumentError("unknown model variant '" + name + "'");
}

// Replayed model outputs: every variant reads the same columns.
algo::PredictorSet column_predictors(const Config& config) {
    algo::PredictorSet predictors;
    auto need = std::make_shared<algo::FeatureColumnPredictor>(config.need_column);
    auto duration = std::make_shared<algo::FeatureColumnPredictor>(config.duration_column);
    for (auto variant : {algo::ModelVariant::VariantA, algo::ModelVariant::VariantB}) {
        predictors.install(algo::ModelTask::NeedPredictor, variant, need);
        predictors.install(algo::ModelTask::DurationPredictor, variant, duration);
    }
    return predictors;
}

// Tees events to two writers.
class TeeTraceWriter : public core::TraceWriter {
public:
    TeeTraceWriter(core::TraceWriter& first, core::TraceWriter& second)
        : first_(first)
        , second_(second) {}

    void begin(double time_hours) override { first_.begin(time_hours); second_.begin(time_hours); }
    void type(std::string_view name) override { first_.type(name); second_.type(name); }
    void field(std::string_view key, double value) override { first_.field(key, value); second_.field(key, value); }
    void field(std::string_view key, uint64_t value) override { first_.field(key, value); second_.field(key, value); }
    void field(std::string_view key, std::string_view value) override { first_.field(key, value); second_.field(key, value); }
    void end() override { first_.end(); second_.end(); }

private:
    core::TraceWriter& first_;   // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    core::TraceWriter& second_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        // 1. Configuration
        algo::WardConfig ward_config;
        if (!config.config_file.empty()) {
            ward_config = io::load_config(config.config_file);
        }
        if (config.strict_conflicts) {
            ward_config.conflict_policy = algo::ConflictPolicy::Enforce;
        }

        // 2. Feed and previous snapshot (a missing snapshot is fatal)
        auto feed = io::load_request_feed(config.feed_file, ward_config.id_column);
        std::optional<core::AllocationState> prior;
        if (!config.state_dir.empty()) {
            prior = io::load_snapshot(config.state_dir);
        }

        // 3. Trace writers
        std::ofstream trace_file;
        std::unique_ptr<io::JsonTraceWriter> json_writer;
        std::unique_ptr<io::TextualTraceWriter> text_writer;
        std::unique_ptr<TeeTraceWriter> tee;
        core::TraceWriter* trace = nullptr;
        if (!config.trace_file.empty()) {
            trace_file.open(config.trace_file);
            if (!trace_file) {
                std::cerr << "Error: cannot open trace file: " << config.trace_file << std::endl;
                return 1;
            }
            json_writer = std::make_unique<io::JsonTraceWriter>(trace_file);
            trace = json_writer.get();
        }
        if (config.verbose) {
            text_writer = std::make_unique<io::TextualTraceWriter>(std::cerr, false);
            if (trace != nullptr) {
                tee = std::make_unique<TeeTraceWriter>(*json_writer, *text_writer);
                trace = tee.get();
            } else {
                trace = text_writer.get();
            }
        }

        // 4. Run the batch
        auto predictors = column_predictors(config);
        algo::AdmissionPipeline pipeline(ward_config, predictors, parse_variant(config.variant), trace);
        pipeline.set_parallel_predictions(config.parallel);

        algo::BatchWindow window{config.start, config.count.value_or(ward_config.default_batch_size)};
        auto result = pipeline.run(feed.rows(), window, prior ? &*prior : nullptr);

        // 5. Outputs
        auto paths = io::write_pipeline_output(result, config.output_dir);
        if (json_writer) {
            json_writer->finalize();
        }

        std::size_t admitted = 0;
        std::size_t booked = 0;
        for (const auto& risk : result.risk) {
            admitted += risk.admitted ? 1 : 0;
        }
        for (const auto& request : result.requests) {
            booked += request.assigned() ? 1 : 0;
        }
        std::cout << "Processed " << result.risk.size() << " request(s): " << admitted
                  << " admitted, " << booked << " booked, " << result.rotation.size()
                  << " round(s), " << result.unfilled.size() << " unfilled" << std::endl;
        for (const auto& description : result.conflicts.descriptions()) {
            std::cerr << "Warning: " << description << std::endl;
        }
        for (const auto& path : paths) {
            std::cout << "Wrote " << path.string() << std::endl;
        }
        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Input error: " << e.what() << std::endl;
        return 1;
    }
    catch (const algo::RotationConflictError& e) {
        std::cerr << "Rotation rejected: " << e.what() << std::endl;
        return 2;
    }
    catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
