#include <wardsched/io/config_loader.hpp>
#include <wardsched/io/error.hpp>

#include <wardsched/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace wardsched::io {

namespace {

void read_double(const rapidjson::Value& obj, const char* name, const char* context, double& out) {
    if (!obj.HasMember(name)) {
        return;
    }
    const auto& member = obj[name];
    if (!member.IsNumber()) {
        throw LoaderError(std::string("field '") + name + "' must be a number", context);
    }
    out = member.GetDouble();
}

void read_int(const rapidjson::Value& obj, const char* name, const char* context, int& out) {
    if (!obj.HasMember(name)) {
        return;
    }
    const auto& member = obj[name];
    if (!member.IsInt()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer", context);
    }
    out = member.GetInt();
}

void read_size(const rapidjson::Value& obj, const char* name, const char* context, std::size_t& out) {
    if (!obj.HasMember(name)) {
        return;
    }
    const auto& member = obj[name];
    if (!member.IsUint64()) {
        throw LoaderError(std::string("field '") + name + "' must be a non-negative integer", context);
    }
    out = static_cast<std::size_t>(member.GetUint64());
}

std::vector<std::string> string_list(const rapidjson::Value& value, const std::string& context) {
    if (!value.IsArray()) {
        throw LoaderError("must be an array of strings", context);
    }
    std::vector<std::string> result;
    result.reserve(value.Size());
    for (const auto& item : value.GetArray()) {
        if (!item.IsString()) {
            throw LoaderError("must be an array of strings", context);
        }
        result.emplace_back(item.GetString(), item.GetStringLength());
    }
    return result;
}

void read_strings(const rapidjson::Value& obj, const char* name, const char* context,
                  std::vector<std::string>& out) {
    if (obj.HasMember(name)) {
        out = string_list(obj[name], std::string(context) + "." + name);
    }
}

void parse_rotation(const rapidjson::Value& obj, algo::RotationPolicy& rotation) {
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", "rotation");
    }
    read_double(obj, "window_hours", "rotation", rotation.window_hours);
    read_int(obj, "rounds_per_resource", "rotation", rotation.rounds_per_resource);
    read_double(obj, "interval_hours", "rotation", rotation.interval_hours);
    if (obj.HasMember("round_durations_minutes")) {
        const auto& durations = obj["round_durations_minutes"];
        if (!durations.IsArray()) {
            throw LoaderError("field 'round_durations_minutes' must be an array", "rotation");
        }
        rotation.round_durations_minutes.clear();
        for (const auto& item : durations.GetArray()) {
            if (!item.IsNumber()) {
                throw LoaderError("round durations must be numbers", "rotation");
            }
            rotation.round_durations_minutes.push_back(item.GetDouble());
        }
    }
}

void parse_scoring(const rapidjson::Value& obj, algo::ScoringPolicy& scoring) {
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", "scoring");
    }
    read_int(obj, "max_staff_load", "scoring", scoring.max_load);
    read_strings(obj, "default_preference", "scoring", scoring.default_preference);

    if (obj.HasMember("resource_preferences")) {
        const auto& table = obj["resource_preferences"];
        if (!table.IsObject()) {
            throw LoaderError("field 'resource_preferences' must be an object", "scoring");
        }
        for (const auto& entry : table.GetObject()) {
            std::string category(entry.name.GetString(), entry.name.GetStringLength());
            scoring.resource_preferences[category] =
                string_list(entry.value, "scoring.resource_preferences." + category);
        }
    }

    if (obj.HasMember("required_certifications")) {
        const auto& table = obj["required_certifications"];
        if (!table.IsObject()) {
            throw LoaderError("field 'required_certifications' must be an object", "scoring");
        }
        for (const auto& entry : table.GetObject()) {
            std::string category(entry.name.GetString(), entry.name.GetStringLength());
            auto list = string_list(entry.value, "scoring.required_certifications." + category);
            scoring.required_certifications[category] =
                std::set<std::string>(list.begin(), list.end());
        }
    }
}

void parse_roster(const rapidjson::Value& value, std::vector<algo::StaffCandidate>& roster) {
    if (!value.IsArray()) {
        throw LoaderError("must be an array", "roster");
    }
    roster.clear();
    for (rapidjson::SizeType i = 0; i < value.Size(); ++i) {
        const auto& item = value[i];
        std::string ctx = "roster[" + std::to_string(i) + "]";
        if (!item.IsObject() || !item.HasMember("name") || !item["name"].IsString()) {
            throw LoaderError("each entry needs a string 'name'", ctx);
        }
        algo::StaffCandidate staff;
        staff.name = item["name"].GetString();
        read_int(item, "load", ctx.c_str(), staff.load);
        roster.push_back(std::move(staff));
    }
}

algo::ConflictPolicy parse_conflict_policy(const rapidjson::Value& value) {
    if (value.IsString()) {
        std::string_view name(value.GetString(), value.GetStringLength());
        if (name == "advisory") {
            return algo::ConflictPolicy::Advisory;
        }
        if (name == "enforce") {
            return algo::ConflictPolicy::Enforce;
        }
    }
    throw LoaderError("must be \"advisory\" or \"enforce\"", "conflict_policy");
}

algo::WardConfig parse_config(const rapidjson::Document& doc) {
    const char* ctx = "config";
    algo::WardConfig config;

    read_double(doc, "admission_threshold", ctx, config.admission_threshold);
    if (doc.HasMember("rotation")) {
        parse_rotation(doc["rotation"], config.rotation);
    }
    if (doc.HasMember("scoring")) {
        parse_scoring(doc["scoring"], config.scoring);
    }
    read_size(doc, "default_resource_count", ctx, config.default_resource_count);
    read_strings(doc, "resource_ids", ctx, config.resource_ids);
    read_size(doc, "default_batch_size", ctx, config.default_batch_size);
    if (doc.HasMember("roster")) {
        parse_roster(doc["roster"], config.roster);
    }
    read_size(doc, "default_roster_size", ctx, config.default_roster_size);
    read_double(doc, "default_duration_hours", ctx, config.default_duration_hours);
    read_double(doc, "need_fallback_probability", ctx, config.need_fallback_probability);
    read_double(doc, "duration_fallback_hours", ctx, config.duration_fallback_hours);
    read_double(doc, "min_duration_hours", ctx, config.min_duration_hours);
    read_double(doc, "max_duration_hours", ctx, config.max_duration_hours);
    read_strings(doc, "need_features", ctx, config.need_features);
    read_strings(doc, "duration_features", ctx, config.duration_features);
    if (doc.HasMember("id_column")) {
        if (!doc["id_column"].IsString()) {
            throw LoaderError("field 'id_column' must be a string", ctx);
        }
        config.id_column = doc["id_column"].GetString();
    }
    if (doc.HasMember("conflict_policy")) {
        config.conflict_policy = parse_conflict_policy(doc["conflict_policy"]);
    }

    try {
        config.validate();
    } catch (const core::InvalidArgumentError& e) {
        throw LoaderError(e.what(), ctx);
    }
    return config;
}

} // anonymous namespace

algo::WardConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_config_from_string(oss.str());
}

algo::WardConfig load_config_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "config");
    }

    return parse_config(doc);
}

} // namespace wardsched::io
