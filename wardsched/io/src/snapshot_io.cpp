#include <wardsched/io/snapshot_io.hpp>
#include <wardsched/io/error.hpp>

#include <wardsched/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace wardsched::io {

namespace {

// Negative bounds mean "unset".
std::optional<double> read_bound(const rapidjson::Value& obj, const char* name, const std::string& ctx) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", ctx);
    }
    const auto& value = obj[name];
    if (value.IsNull()) {
        return std::nullopt;
    }
    if (!value.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", ctx);
    }
    double bound = value.GetDouble();
    if (bound < 0.0) {
        return std::nullopt;
    }
    return bound;
}

} // anonymous namespace

void write_snapshot_to_stream(const core::AllocationState& state, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);

    writer.StartObject();
    writer.Key("hospital_space");
    writer.StartArray();
    for (const auto& resource : state.resources()) {
        writer.StartObject();
        writer.Key("id");
        writer.String(resource.id.c_str(), static_cast<rapidjson::SizeType>(resource.id.size()));
        writer.Key("start");
        writer.Double(resource.occupied_from.value_or(-1.0));
        writer.Key("stop");
        writer.Double(resource.occupied_until.value_or(-1.0));
        if (resource.occupant) {
            writer.Key("patient_id");
            writer.String(resource.occupant->c_str(),
                          static_cast<rapidjson::SizeType>(resource.occupant->size()));
        }
        writer.EndObject();
    }
    writer.EndArray();
    writer.EndObject();

    out << buffer.GetString() << "\n";
}

void write_snapshot(const core::AllocationState& state, const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_snapshot_to_stream(state, file);
}

core::AllocationState load_snapshot(const std::filesystem::path& path) {
    std::filesystem::path file_path = path;
    if (std::filesystem::is_directory(path)) {
        file_path = path / SNAPSHOT_FILE_NAME;
    }
    if (!std::filesystem::exists(file_path)) {
        throw LoaderError("state not found", file_path.string());
    }

    std::ifstream file(file_path);
    if (!file) {
        throw LoaderError("cannot open file", file_path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_snapshot_from_string(oss.str());
}

core::AllocationState load_snapshot_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }
    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "snapshot");
    }
    if (!doc.HasMember("hospital_space") || !doc["hospital_space"].IsArray()) {
        throw LoaderError("field 'hospital_space' must be an array", "snapshot");
    }

    const auto& entries = doc["hospital_space"];
    std::vector<core::Resource> resources;
    resources.reserve(entries.Size());
    for (rapidjson::SizeType i = 0; i < entries.Size(); ++i) {
        const auto& entry = entries[i];
        std::string ctx = "hospital_space[" + std::to_string(i) + "]";
        if (!entry.IsObject()) {
            throw LoaderError("entry must be an object", ctx);
        }
        if (!entry.HasMember("id") || !entry["id"].IsString()) {
            throw LoaderError("field 'id' must be a string", ctx);
        }
        core::Resource resource;
        resource.id = entry["id"].GetString();
        resource.occupied_from = read_bound(entry, "start", ctx);
        resource.occupied_until = read_bound(entry, "stop", ctx);
        if (entry.HasMember("patient_id")) {
            const auto& occupant = entry["patient_id"];
            if (!occupant.IsString()) {
                throw LoaderError("field 'patient_id' must be a string", ctx);
            }
            if (occupant.GetStringLength() > 0) {
                resource.occupant = std::string(occupant.GetString(), occupant.GetStringLength());
            }
        }
        resources.push_back(std::move(resource));
    }

    try {
        return core::AllocationState(std::move(resources), {});
    } catch (const core::AllocationError& e) {
        throw LoaderError(e.what(), "snapshot");
    }
}

} // namespace wardsched::io
