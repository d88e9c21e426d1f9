#include <wardsched/io/trace_writers.hpp>

#include <algorithm>
#include <array>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace wardsched::io {

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(double /*time_hours*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, uint64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// =============================================================================
// JsonTraceWriter
// =============================================================================

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : output_(output)
    , writer_(buffer_) {
    output_ << "[";
}

JsonTraceWriter::~JsonTraceWriter() {
    finalize();
}

void JsonTraceWriter::begin(double time_hours) {
    buffer_.Clear();
    writer_.Reset(buffer_);
    writer_.StartObject();
    writer_.Key("time");
    writer_.Double(time_hours);
}

void JsonTraceWriter::key(std::string_view name) {
    writer_.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::type(std::string_view name) {
    key("type");
    writer_.String(name.data(), static_cast<rapidjson::SizeType>(name.size()));
}

void JsonTraceWriter::field(std::string_view name, double value) {
    key(name);
    writer_.Double(value);
}

void JsonTraceWriter::field(std::string_view name, uint64_t value) {
    key(name);
    writer_.Uint64(value);
}

void JsonTraceWriter::field(std::string_view name, std::string_view value) {
    key(name);
    writer_.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void JsonTraceWriter::end() {
    writer_.EndObject();
    output_ << (first_record_ ? "\n  " : ",\n  ") << buffer_.GetString();
    first_record_ = false;
}

void JsonTraceWriter::finalize() {
    if (finalized_) {
        return;
    }
    output_ << (first_record_ ? "]\n" : "\n]\n");
    output_.flush();
    finalized_ = true;
}

// =============================================================================
// TraceRecord / MemoryTraceWriter
// =============================================================================

std::string TraceRecord::text(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return {};
    }
    if (const auto* value = std::get_if<std::string>(&it->second)) {
        return *value;
    }
    return {};
}

double TraceRecord::number(const std::string& key) const {
    auto it = fields.find(key);
    if (it == fields.end()) {
        return 0.0;
    }
    if (const auto* value = std::get_if<double>(&it->second)) {
        return *value;
    }
    if (const auto* value = std::get_if<uint64_t>(&it->second)) {
        return static_cast<double>(*value);
    }
    return 0.0;
}

void MemoryTraceWriter::begin(double time_hours) {
    current_ = TraceRecord{};
    current_.time = time_hours;
}

void MemoryTraceWriter::type(std::string_view name) {
    current_.type = std::string(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, uint64_t value) {
    current_.fields[std::string(key)] = value;
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    current_.fields[std::string(key)] = std::string(value);
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(current_));
    current_ = TraceRecord{};
}

std::vector<TraceRecord> MemoryTraceWriter::of_type(std::string_view name) const {
    std::vector<TraceRecord> result;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(result),
                 [name](const TraceRecord& record) { return record.type == name; });
    return result;
}

std::size_t MemoryTraceWriter::count(std::string_view name) const {
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
        [name](const TraceRecord& record) { return record.type == name; }));
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

namespace {

constexpr const char* RESET = "\033[0m";
constexpr const char* RED = "\033[31m";
constexpr const char* YELLOW = "\033[33m";
constexpr const char* CYAN = "\033[36m";

constexpr std::array<std::string_view, 5> FAILURE_EVENTS{
    "round_unfilled", "rotation_conflict", "payload_rejected", "booking_failed", "predictor_fallback"};
constexpr std::array<std::string_view, 3> NOTICE_EVENTS{
    "request_waitlisted", "admission_skipped", "batch_cancelled"};

} // anonymous namespace

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color_enabled)
    : output_(output)
    , color_enabled_(color_enabled) {}

void TextualTraceWriter::begin(double time_hours) {
    current_time_ = time_hours;
    current_type_.clear();
    current_fields_.clear();
}

void TextualTraceWriter::type(std::string_view name) {
    current_type_ = std::string(name);
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    current_fields_.emplace_back(std::string(key), oss.str());
}

void TextualTraceWriter::field(std::string_view key, uint64_t value) {
    current_fields_.emplace_back(std::string(key), std::to_string(value));
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    current_fields_.emplace_back(std::string(key), std::string(value));
}

const char* TextualTraceWriter::color_for(std::string_view type) const noexcept {
    if (std::find(FAILURE_EVENTS.begin(), FAILURE_EVENTS.end(), type) != FAILURE_EVENTS.end()) {
        return RED;
    }
    if (std::find(NOTICE_EVENTS.begin(), NOTICE_EVENTS.end(), type) != NOTICE_EVENTS.end()) {
        return YELLOW;
    }
    return CYAN;
}

void TextualTraceWriter::end() {
    // Format: [  time h] (+ delta h)   event_name: key = value, key = value
    output_ << "[" << std::setw(10) << std::fixed << std::setprecision(4)
            << current_time_ << "h] ";

    if (prev_time_ >= 0.0 && current_time_ != prev_time_) {
        output_ << "(+" << std::setw(9) << std::fixed << std::setprecision(4)
                << (current_time_ - prev_time_) << "h) ";
    } else {
        output_ << "(           ) ";
    }

    if (color_enabled_) {
        output_ << color_for(current_type_);
    }
    output_ << std::setw(22) << std::right << current_type_;
    if (color_enabled_) {
        output_ << RESET;
    }
    output_ << ":";

    for (std::size_t i = 0; i < current_fields_.size(); ++i) {
        if (i > 0) {
            output_ << ",";
        }
        output_ << " " << current_fields_[i].first << " = " << current_fields_[i].second;
    }

    output_ << "\n";
    output_.unsetf(std::ios_base::floatfield);
    prev_time_ = current_time_;
}

} // namespace wardsched::io
