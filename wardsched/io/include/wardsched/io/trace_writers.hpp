#pragma once

/// @file trace_writers.hpp
/// @brief Concrete TraceWriter implementations for allocation runs.
///
/// A no-op writer, a JSON array writer, an in-memory buffer used by tests
/// and post-processing, and a human-readable line writer with optional
/// ANSI colour.
///
/// @ingroup io_writers

#include <wardsched/core/trace_writer.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace wardsched::io {

/// @brief Trace writer that discards all events.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(double time_hours) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Trace writer that streams a JSON array, one object per event.
///
/// Each record is `{"time": <hours>, "type": "...", <fields>}`. Call
/// finalize() (or destroy the writer) to close the array.
///
/// Non-copyable and non-movable because it holds a reference to the
/// output stream.
///
/// @ingroup io_writers
class JsonTraceWriter : public core::TraceWriter {
public:
    /// @param output Destination stream (must outlive this writer).
    explicit JsonTraceWriter(std::ostream& output);

    /// @brief Calls finalize() if not already called.
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(double time_hours) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Write the closing bracket of the array. Idempotent.
    void finalize();

private:
    void key(std::string_view name);

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::StringBuffer buffer_;
    rapidjson::Writer<rapidjson::StringBuffer> writer_;
    bool first_record_{true};
    bool finalized_{false};
};

/// @brief A single trace record stored in memory.
/// @ingroup io_writers
struct TraceRecord {
    double time{0.0};   ///< Time of the event (hours).
    std::string type;   ///< Event type (e.g. "room_booked").
    /// Named fields; values are @c double, @c uint64_t or @c std::string.
    std::unordered_map<std::string, std::variant<double, uint64_t, std::string>> fields;

    /// @brief String value of @p key, or empty when absent or not a string.
    [[nodiscard]] std::string text(const std::string& key) const;

    /// @brief Numeric value of @p key (double or integer), or 0 when absent.
    [[nodiscard]] double number(const std::string& key) const;
};

/// @brief Trace writer that buffers all events as TraceRecord objects.
/// @ingroup io_writers
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(double time_hours) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records of type @p name, in emission order.
    [[nodiscard]] std::vector<TraceRecord> of_type(std::string_view name) const;

    /// @brief Number of records of type @p name.
    [[nodiscard]] std::size_t count(std::string_view name) const;

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord current_;
};

/// @brief Human-readable trace writer, one aligned line per event.
///
/// Lines look like
/// `[   12.0000h] (+  4.0000h)       round_assigned: staff = Nurse_1, ...`.
/// With colour enabled, failures (unfilled rounds, conflicts, rejected
/// payloads, failed bookings, predictor fallbacks) are red and waitlist or
/// skip events yellow.
///
/// @ingroup io_writers
class TextualTraceWriter : public core::TraceWriter {
public:
    /// @param output         Destination stream (must outlive this writer).
    /// @param color_enabled  Emit ANSI escape codes.
    explicit TextualTraceWriter(std::ostream& output, bool color_enabled = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(double time_hours) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, uint64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    [[nodiscard]] const char* color_for(std::string_view type) const noexcept;

    std::ostream& output_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_enabled_;
    double current_time_{0.0};
    double prev_time_{-1.0};
    std::string current_type_;
    std::vector<std::pair<std::string, std::string>> current_fields_;
};

} // namespace wardsched::io
