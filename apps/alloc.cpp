#include <wardsched/algo/error.hpp>
#include <wardsched/algo/priority_allocator.hpp>
#include <wardsched/algo/ward_config.hpp>

#include <wardsched/io/batch_loader.hpp>
#include <wardsched/io/config_loader.hpp>
#include <wardsched/io/error.hpp>
#include <wardsched/io/output_writers.hpp>
#include <wardsched/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

namespace core = wardsched::core;
namespace algo = wardsched::algo;
namespace io = wardsched::io;

struct Config {
    std::string input_file;
    std::string config_file;
    std::string output_dir{"output"};
    bool strict_conflicts{false};
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("wardsched-alloc",
                             "Assign (staff, resource) pairs to a batch by descending risk");

    options.add_options()
        ("i,input", "Batch payload (JSON)", cxxopts::value<std::string>())
        ("c,config", "Ward configuration (JSON)", cxxopts::value<std::string>())
        ("o,output", "Output directory (default: output)", cxxopts::value<std::string>()->default_value("output"))
        ("strict-conflicts", "Fail when the rotation has staff conflicts")
        ("v,verbose", "Textual trace on stderr")
        ("h,help", "Show help");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.input_file = result["input"].as<std::string>();
    if (result.count("config") != 0U) {
        config.config_file = result["config"].as<std::string>();
    }
    config.output_dir = result["output"].as<std::string>();
    config.strict_conflicts = result.count("strict-conflicts") != 0U;
    config.verbose = result.count("verbose") != 0U;
    return config;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        auto config = parse_args(argc, argv);

        algo::WardConfig ward_config;
        if (!config.config_file.empty()) {
            ward_config = io::load_config(config.config_file);
        }
        if (config.strict_conflicts) {
            ward_config.conflict_policy = algo::ConflictPolicy::Enforce;
        }

        std::unique_ptr<core::TraceWriter> writer;
        if (config.verbose) {
            writer = std::make_unique<io::TextualTraceWriter>(std::cerr, false);
        } else {
            writer = std::make_unique<io::NullTraceWriter>();
        }

        auto payload = io::load_batch_payload(config.input_file, writer.get());
        for (const auto& error : payload.errors) {
            std::cerr << "Rejected: " << error.what() << std::endl;
        }

        algo::PriorityAllocator allocator(ward_config, writer.get());
        auto allocation = allocator.allocate(payload.requests);

        auto paths = io::write_allocation_output(allocation, payload.errors, config.output_dir);

        std::size_t assigned = 0;
        for (const auto& record : allocation.records) {
            assigned += record.status == core::AllocationStatus::Assigned ? 1 : 0;
        }
        std::cout << "Allocated " << assigned << " of " << allocation.records.size()
                  << " request(s), " << payload.errors.size() << " rejected" << std::endl;
        for (const auto& description : allocation.conflicts.descriptions()) {
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
