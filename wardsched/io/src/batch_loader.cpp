#include <wardsched/io/batch_loader.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <initializer_list>
#include <set>
#include <sstream>
#include <string>
#include <utility>

namespace wardsched::io {

namespace {

using Kind = PayloadErrorKind;

// Checks one request; the first problem found is thrown as a PayloadError.
class RequestParser {
public:
    explicit RequestParser(std::size_t index)
        : index_(index) {}

    algo::AllocationRequest parse(const rapidjson::Value& obj) const {
        if (!obj.IsObject()) {
            fail(Kind::WrongType, "", "request must be an object");
        }
        reject_keys(obj, "", {"id", "numeric_score", "risk_category", "options"});

        algo::AllocationRequest request;
        request.request_id = required_string(obj, "patient_id", "patient_id");

        const auto& profile = member(obj, "risk_profile", "risk_profile");
        if (profile.IsString()) {
            fail(Kind::AmbiguousShape, "risk_profile", "must be an object, not a JSON string");
        }
        if (!profile.IsObject()) {
            fail(Kind::WrongType, "risk_profile", "must be an object");
        }
        reject_keys(profile, "risk_profile", {"risk_profile", "score", "category"});
        request.profile.score = score(profile);
        request.profile.category = required_string(profile, "risk_category", "risk_profile.risk_category");
        if (profile.HasMember("predicted_duration_of_stay")) {
            const auto& label = profile["predicted_duration_of_stay"];
            if (!label.IsString()) {
                fail(Kind::WrongType, "risk_profile.predicted_duration_of_stay", "must be a string");
            }
            request.duration_label = std::string(label.GetString(), label.GetStringLength());
        }

        const auto& options = member(obj, "feasibility_options", "feasibility_options");
        if (options.IsString()) {
            fail(Kind::AmbiguousShape, "feasibility_options", "must be an array, not a JSON string");
        }
        if (options.IsObject()) {
            fail(Kind::AmbiguousShape, "feasibility_options", "must be an array, not a wrapper object");
        }
        if (!options.IsArray()) {
            fail(Kind::WrongType, "feasibility_options", "must be an array");
        }
        for (rapidjson::SizeType i = 0; i < options.Size(); ++i) {
            request.options.push_back(option(options[i], "feasibility_options[" + std::to_string(i) + "]"));
        }
        return request;
    }

private:
    [[noreturn]] void fail(Kind kind, const std::string& field, const std::string& message) const {
        throw PayloadError(kind, index_, field, message);
    }

    static std::string join(const std::string& prefix, const char* name) {
        return prefix.empty() ? std::string(name) : prefix + "." + name;
    }

    void reject_keys(const rapidjson::Value& obj, const std::string& prefix,
                     std::initializer_list<const char*> keys) const {
        for (const char* key : keys) {
            if (obj.HasMember(key)) {
                fail(Kind::AmbiguousShape, join(prefix, key), "unexpected key");
            }
        }
    }

    const rapidjson::Value& member(const rapidjson::Value& obj, const char* name,
                                   const std::string& field) const {
        if (!obj.HasMember(name)) {
            fail(Kind::MissingField, field, "missing required field");
        }
        return obj[name];
    }

    std::string required_string(const rapidjson::Value& obj, const char* name,
                                 const std::string& field) const {
        const auto& value = member(obj, name, field);
        if (!value.IsString()) {
            fail(Kind::WrongType, field, "must be a string");
        }
        if (value.GetStringLength() == 0) {
            fail(Kind::Empty, field, "must not be empty");
        }
        return std::string(value.GetString(), value.GetStringLength());
    }

    double score(const rapidjson::Value& profile) const {
        const std::string field = "risk_profile.numeric_score";
        const auto& value = member(profile, "numeric_score", field);
        if (!value.IsNumber()) {
            fail(Kind::WrongType, field, "must be a number");
        }
        double result = value.GetDouble();
        if (result < 0.0 || result > 1.0) {
            fail(Kind::OutOfRange, field, "must be in [0, 1]");
        }
        return result;
    }

    core::FeasibleOption option(const rapidjson::Value& obj, const std::string& prefix) const {
        if (!obj.IsObject()) {
            fail(Kind::WrongType, prefix, "option must be an object");
        }
        reject_keys(obj, prefix, {"nurse", "room", "current_load"});

        core::FeasibleOption result;
        result.staff_name = required_string(obj, "nurse_name", join(prefix, "nurse_name"));
        result.resource_id = required_string(obj, "room_id", join(prefix, "room_id"));
        result.resource_type = required_string(obj, "room_type", join(prefix, "room_type"));

        const std::string load_field = join(prefix, "nurse_load");
        const auto& load = member(obj, "nurse_load", load_field);
        if (!load.IsInt()) {
            fail(Kind::WrongType, load_field, "must be an integer");
        }
        if (load.GetInt() < 0) {
            fail(Kind::OutOfRange, load_field, "must not be negative");
        }
        result.staff_load = load.GetInt();

        if (obj.HasMember("certifications")) {
            const std::string field = join(prefix, "certifications");
            const auto& certs = obj["certifications"];
            if (!certs.IsArray()) {
                fail(certs.IsString() ? Kind::AmbiguousShape : Kind::WrongType, field,
                     "must be an array of strings");
            }
            std::set<std::string> set;
            for (const auto& cert : certs.GetArray()) {
                if (!cert.IsString()) {
                    fail(Kind::WrongType, field, "must be an array of strings");
                }
                set.emplace(cert.GetString(), cert.GetStringLength());
            }
            result.staff_certifications = std::move(set);
        }
        return result;
    }

    std::size_t index_;
};

} // anonymous namespace

BatchPayload load_batch_payload(const std::filesystem::path& path, core::TraceWriter* trace) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_batch_payload_from_string(oss.str(), trace);
}

BatchPayload load_batch_payload_from_string(std::string_view json, core::TraceWriter* trace) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    const rapidjson::Value* patients = nullptr;
    if (doc.IsArray()) {
        patients = &doc;
    } else if (doc.IsObject() && doc.HasMember("patients") && doc["patients"].IsArray()) {
        patients = &doc["patients"];
    } else {
        throw LoaderError("root must be an array or an object with a 'patients' array", "payload");
    }

    BatchPayload payload;
    std::set<std::string> seen_ids;
    for (rapidjson::SizeType i = 0; i < patients->Size(); ++i) {
        try {
            auto request = RequestParser(i).parse((*patients)[i]);
            if (!seen_ids.insert(request.request_id).second) {
                throw PayloadError(Kind::DuplicateId, i, "patient_id",
                                   "duplicate patient id '" + request.request_id + "'");
            }
            payload.requests.push_back(std::move(request));
        } catch (const PayloadError& e) {
            core::emit_trace(trace, 0.0, [&](core::TraceWriter& w) {
                w.type("payload_rejected");
                w.field("index", static_cast<uint64_t>(i));
                w.field("kind", std::string_view{to_string(e.kind())});
                w.field("field", std::string_view{e.field()});
            });
            payload.errors.push_back(e);
        }
    }
    return payload;
}

} // namespace wardsched::io
