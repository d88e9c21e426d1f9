#include <wardsched/io/output_writers.hpp>
#include <wardsched/io/snapshot_io.hpp>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <algorithm>
#include <fstream>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <system_error>

namespace wardsched::io {

namespace {

using Writer = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void write_string(Writer& writer, std::string_view value) {
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_key_string(Writer& writer, const char* key, std::string_view value) {
    writer.Key(key);
    write_string(writer, value);
}

// Unset values are written as -1.
void write_key_optional(Writer& writer, const char* key, const std::optional<double>& value) {
    writer.Key(key);
    if (value) {
        writer.Double(*value);
    } else {
        writer.Int(-1);
    }
}

void write_key_optional(Writer& writer, const char* key, const std::optional<std::string>& value) {
    writer.Key(key);
    if (value) {
        write_string(writer, *value);
    } else {
        writer.Int(-1);
    }
}

void write_round(Writer& writer, const core::RotationRound& round) {
    writer.StartObject();
    write_key_string(writer, "nurse", round.staff_name);
    write_key_string(writer, "room_id", round.resource_id);
    write_key_string(writer, "patient_id", round.request_id);
    writer.Key("start");
    writer.Double(round.start);
    writer.Key("stop");
    writer.Double(round.stop);
    writer.EndObject();
}

// Rounds on the request's own room; an unassigned request has none
void write_rounds_for(Writer& writer, std::span<const core::RotationRound> rounds,
                      const core::Request& request) {
    writer.Key("nurse_rounds");
    writer.StartArray();
    for (const auto& round : rounds) {
        if (request.resource_id && round.resource_id == *request.resource_id
            && round.request_id == request.id) {
            write_round(writer, round);
        }
    }
    writer.EndArray();
}

void write_unfilled(Writer& writer, std::span<const algo::UnfilledSlot> unfilled) {
    writer.Key("unfilled_rounds");
    writer.StartArray();
    for (const auto& slot : unfilled) {
        writer.StartObject();
        write_key_string(writer, "room_id", slot.resource_id);
        write_key_string(writer, "patient_id", slot.request_id);
        writer.Key("round");
        writer.Int(slot.round_index);
        writer.Key("start");
        writer.Double(slot.start);
        writer.Key("stop");
        writer.Double(slot.stop);
        writer.EndObject();
    }
    writer.EndArray();
}

void write_conflicts(Writer& writer, const algo::ConflictReport& report) {
    writer.Key("conflicts");
    writer.StartArray();
    for (const auto& description : report.descriptions()) {
        write_string(writer, description);
    }
    writer.EndArray();
}

template<typename Body>
void write_document(std::ostream& out, Body&& body) {
    rapidjson::StringBuffer buffer;
    Writer writer(buffer);
    writer.SetIndent(' ', 2);
    writer.StartObject();
    std::forward<Body>(body)(writer);
    writer.EndObject();
    out << buffer.GetString() << "\n";
}

std::filesystem::path prepare_dir(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw LoaderError("cannot create directory: " + ec.message(), dir.string());
    }
    return dir;
}

std::filesystem::path write_file(const std::filesystem::path& path,
                                 const std::function<void(std::ostream&)>& writer) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    writer(file);
    return path;
}

} // anonymous namespace

void write_staff_view(std::span<const core::RotationRound> rounds, std::ostream& out) {
    std::map<std::string, std::vector<const core::RotationRound*>> by_staff;
    for (const auto& round : rounds) {
        by_staff[round.staff_name].push_back(&round);
    }

    write_document(out, [&](Writer& writer) {
        writer.Key("nurses");
        writer.StartArray();
        for (auto& [staff, staff_rounds] : by_staff) {
            std::stable_sort(staff_rounds.begin(), staff_rounds.end(),
                [](const core::RotationRound* lhs, const core::RotationRound* rhs) {
                    return lhs->start < rhs->start;
                });
            writer.StartObject();
            write_key_string(writer, "nurse", staff);
            writer.Key("rounds");
            writer.StartArray();
            for (const auto* round : staff_rounds) {
                writer.StartObject();
                write_key_string(writer, "patient_id", round->request_id);
                write_key_string(writer, "room_id", round->resource_id);
                writer.Key("start");
                writer.Double(round->start);
                writer.Key("stop");
                writer.Double(round->stop);
                writer.EndObject();
            }
            writer.EndArray();
            writer.EndObject();
        }
        writer.EndArray();
    });
}

void write_request_view(std::span<const core::Request> requests,
                        std::span<const core::RotationRound> rounds,
                        std::ostream& out) {
    write_document(out, [&](Writer& writer) {
        writer.Key("patients");
        writer.StartArray();
        for (const auto& request : requests) {
            writer.StartObject();
            write_key_string(writer, "patient_id", request.id);
            write_key_optional(writer, "room_id", request.resource_id);
            write_key_optional(writer, "start", request.start);
            write_key_optional(writer, "stop", request.stop);
            write_rounds_for(writer, rounds, request);
            writer.EndObject();
        }
        writer.EndArray();
    });
}

void write_record_view(std::span<const core::AllocationRecord> records, std::ostream& out) {
    write_document(out, [&](Writer& writer) {
        writer.Key("patients");
        writer.StartArray();
        for (const auto& record : records) {
            writer.StartObject();
            write_key_string(writer, "patient_id", record.request_id);
            write_key_string(writer, "status", core::to_string(record.status));
            write_key_optional(writer, "room_id", record.resource_id);
            write_key_optional(writer, "nurse", record.staff_name);
            writer.Key("nurse_rounds");
            writer.StartArray();
            for (const auto& round : record.rotation_rounds) {
                write_round(writer, round);
            }
            writer.EndArray();
            writer.EndObject();
        }
        writer.EndArray();
    });
}

void write_allocation_records(const algo::BatchAllocation& allocation,
                              std::span<const PayloadError> rejected,
                              std::ostream& out) {
    write_document(out, [&](Writer& writer) {
        writer.Key("allocations");
        writer.StartArray();
        for (const auto& record : allocation.records) {
            writer.StartObject();
            write_key_string(writer, "patient_id", record.request_id);
            write_key_string(writer, "status", core::to_string(record.status));
            writer.Key("risk_score");
            writer.Double(record.risk_score);
            write_key_string(writer, "risk_category", record.risk_category);
            if (record.status == core::AllocationStatus::Assigned) {
                write_key_string(writer, "room_id", *record.resource_id);
                write_key_string(writer, "nurse", *record.staff_name);
                writer.Key("match_score");
                writer.Double(record.match_score.value_or(0.0));
            } else {
                writer.Key("waitlist_position");
                writer.Int(record.waitlist_position.value_or(0));
            }
            if (record.duration_label) {
                write_key_string(writer, "predicted_duration_of_stay", *record.duration_label);
            }
            writer.Key("nurse_rounds");
            writer.StartArray();
            for (const auto& round : record.rotation_rounds) {
                write_round(writer, round);
            }
            writer.EndArray();
            writer.EndObject();
        }
        writer.EndArray();

        write_unfilled(writer, allocation.rotation.unfilled);
        write_conflicts(writer, allocation.conflicts);

        writer.Key("rejected");
        writer.StartArray();
        for (const auto& error : rejected) {
            writer.StartObject();
            writer.Key("index");
            writer.Uint64(error.request_index());
            write_key_string(writer, "kind", to_string(error.kind()));
            write_key_string(writer, "field", error.field());
            write_key_string(writer, "message", error.what());
            writer.EndObject();
        }
        writer.EndArray();

        writer.Key("cancelled");
        writer.Bool(allocation.cancelled);
    });
}

void write_batch_result(const algo::BatchResult& result, std::ostream& out) {
    write_document(out, [&](Writer& writer) {
        writer.Key("patients");
        writer.StartArray();
        for (const auto& request : result.requests) {
            writer.StartObject();
            write_key_string(writer, "id", request.id);
            write_key_optional(writer, "room", request.resource_id);
            write_key_optional(writer, "start", request.start);
            write_key_optional(writer, "stop", request.stop);
            writer.EndObject();
        }
        writer.EndArray();

        writer.Key("hospital_space");
        writer.StartArray();
        for (const auto& resource : result.snapshot.resources()) {
            writer.StartObject();
            write_key_string(writer, "id", resource.id);
            write_key_optional(writer, "start", resource.occupied_from);
            write_key_optional(writer, "stop", resource.occupied_until);
            writer.EndObject();
        }
        writer.EndArray();

        writer.Key("nurse_assignments");
        writer.StartArray();
        for (const auto& round : result.rotation) {
            write_round(writer, round);
        }
        writer.EndArray();

        writer.Key("risk_per_patient");
        writer.StartArray();
        for (const auto& risk : result.risk) {
            writer.StartObject();
            writer.Key("row_index");
            writer.Uint64(risk.row_index);
            write_key_string(writer, "patient_id", risk.request_id);
            writer.Key("probability");
            writer.Double(risk.probability);
            writer.Key("needs_bed");
            writer.Bool(risk.admitted);
            writer.Key("length_of_stay");
            writer.Double(risk.duration_hours);
            writer.Key("need_fallback");
            writer.Bool(risk.need_fallback);
            writer.Key("duration_fallback");
            writer.Bool(risk.duration_fallback);
            write_key_string(writer, "briefing", risk.briefing);
            writer.EndObject();
        }
        writer.EndArray();

        write_unfilled(writer, result.unfilled);
        write_conflicts(writer, result.conflicts);
        writer.Key("cancelled");
        writer.Bool(result.cancelled);
    });
}

std::vector<std::filesystem::path> write_pipeline_output(const algo::BatchResult& result,
                                                         const std::filesystem::path& dir) {
    auto base = prepare_dir(dir);
    std::vector<std::filesystem::path> paths;
    paths.push_back(write_file(base / ALLOCATIONS_FILE_NAME,
        [&](std::ostream& out) { write_batch_result(result, out); }));
    paths.push_back(write_file(base / REQUEST_VIEW_FILE_NAME,
        [&](std::ostream& out) { write_request_view(result.requests, result.rotation, out); }));
    paths.push_back(write_file(base / STAFF_VIEW_FILE_NAME,
        [&](std::ostream& out) { write_staff_view(result.rotation, out); }));
    paths.push_back(write_file(base / SNAPSHOT_FILE_NAME,
        [&](std::ostream& out) { write_snapshot_to_stream(result.snapshot, out); }));
    return paths;
}

std::vector<std::filesystem::path> write_allocation_output(const algo::BatchAllocation& allocation,
                                                           std::span<const PayloadError> rejected,
                                                           const std::filesystem::path& dir) {
    auto base = prepare_dir(dir);
    std::vector<std::filesystem::path> paths;
    paths.push_back(write_file(base / ALLOCATIONS_FILE_NAME,
        [&](std::ostream& out) { write_allocation_records(allocation, rejected, out); }));
    paths.push_back(write_file(base / REQUEST_VIEW_FILE_NAME,
        [&](std::ostream& out) { write_record_view(allocation.records, out); }));
    paths.push_back(write_file(base / STAFF_VIEW_FILE_NAME,
        [&](std::ostream& out) { write_staff_view(allocation.rotation.rounds, out); }));
    return paths;
}

} // namespace wardsched::io
