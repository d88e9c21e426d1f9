#pragma once

#include <cstdint>
#include <string_view>
#include <utility>

namespace wardsched::core {

/// @brief Abstract interface for recording allocation progress events.
/// @ingroup core
///
/// Implementations of TraceWriter serialise allocation events to a
/// specific format (JSON, text, memory buffer, etc.).
/// Each trace record is built incrementally:
///   1. begin() -- opens a new record at a given time (hours)
///   2. type()  -- sets the event type name
///   3. field() -- (repeated) adds key/value data fields
///   4. end()   -- closes and optionally flushes the record
///
/// Components hold an optional, non-owning pointer to a TraceWriter that
/// is injected by whoever runs the batch. When no writer is installed the
/// overhead is a single null-pointer check.
///
/// @see emit_trace
class TraceWriter {
public:
    /// @brief Virtual destructor for safe polymorphic deletion.
    virtual ~TraceWriter() = default;

    /// @brief Begin a new trace record at the given time.
    /// @param time_hours Time of the event, in hours since the epoch.
    virtual void begin(double time_hours) = 0;

    /// @brief Set the event type name for the current record.
    /// @param name A short identifier for the event category
    ///        (e.g. `"room_booked"`, `"request_waitlisted"`).
    virtual void type(std::string_view name) = 0;

    /// @brief Add a floating-point field to the current record.
    /// @param key   Field name.
    /// @param value Field value.
    virtual void field(std::string_view key, double value) = 0;

    /// @brief Add an unsigned integer field to the current record.
    /// @param key   Field name.
    /// @param value Field value.
    virtual void field(std::string_view key, uint64_t value) = 0;

    /// @brief Add a string field to the current record.
    /// @param key   Field name.
    /// @param value Field value.
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief End the current record and flush if needed.
    ///
    /// After this call the writer is ready for a new begin()/end() cycle.
    virtual void end() = 0;

protected:
    /// @brief Default constructor (protected -- instantiate subclasses only).
    TraceWriter() = default;

    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

/// @brief Invoke a tracing callback only if a trace writer is set.
///
/// Wraps @p func in a begin()/end() pair at @p time_hours.
///
/// @tparam F Callable with signature void(TraceWriter&).
/// @param writer Writer to record into, or nullptr to skip.
/// @param time_hours Time of the event.
/// @param func Callback that writes the type and fields.
template<typename F>
void emit_trace(TraceWriter* writer, double time_hours, F&& func) {
    if (writer) {
        writer->begin(time_hours);
        std::forward<F>(func)(*writer);
        writer->end();
    }
}

} // namespace wardsched::core
