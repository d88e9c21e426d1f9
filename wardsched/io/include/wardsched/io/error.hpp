#pragma once

/// @file error.hpp
/// @brief Exception types for the wardsched I/O library.
/// @ingroup io

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace wardsched::io {

/// @brief Exception for I/O errors (loading, parsing, validation).
///
/// Thrown when a file cannot be opened, JSON or CSV input is malformed,
/// or a value fails validation. Always fatal for the run that hit it.
///
/// @ingroup io
/// @see load_config, load_request_feed, load_snapshot
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError with a contextual prefix.
    ///
    /// The resulting message is formatted as `"context: message"`.
    ///
    /// @param message  Human-readable description of the error.
    /// @param context  Additional context such as the file path or field name.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

/// @brief What was wrong with one request of a batch payload.
/// @ingroup io
enum class PayloadErrorKind {
    MissingField,    ///< A required key is absent.
    WrongType,       ///< A value has the wrong JSON type.
    OutOfRange,      ///< A number is outside its allowed range.
    AmbiguousShape,  ///< Alternative spellings, nested or stringified JSON.
    Empty,           ///< A required string or list is empty.
    DuplicateId      ///< The request id was already used earlier in the batch.
};

/// @brief A single malformed request of a batch payload.
///
/// Batch loading collects these instead of throwing, so one bad request
/// does not drop the rest of the batch.
///
/// @ingroup io
/// @see load_batch_payload
class PayloadError : public LoaderError {
public:
    PayloadError(PayloadErrorKind kind, std::size_t request_index,
                 std::string field, const std::string& message)
        : LoaderError(message, "patients[" + std::to_string(request_index) + "]." + field)
        , kind_(kind)
        , request_index_(request_index)
        , field_(std::move(field)) {}

    [[nodiscard]] PayloadErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] std::size_t request_index() const noexcept { return request_index_; }
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    PayloadErrorKind kind_;
    std::size_t request_index_;
    std::string field_;
};

/// @brief Short name of a payload error kind ("missing_field", ...).
[[nodiscard]] constexpr const char* to_string(PayloadErrorKind kind) noexcept {
    switch (kind) {
        case PayloadErrorKind::MissingField: return "missing_field";
        case PayloadErrorKind::WrongType: return "wrong_type";
        case PayloadErrorKind::OutOfRange: return "out_of_range";
        case PayloadErrorKind::AmbiguousShape: return "ambiguous_shape";
        case PayloadErrorKind::Empty: return "empty";
        case PayloadErrorKind::DuplicateId: return "duplicate_id";
    }
    return "unknown";
}

} // namespace wardsched::io
