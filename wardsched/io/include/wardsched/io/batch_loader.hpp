#pragma once

/// @file batch_loader.hpp
/// @brief Strict loader for priority-allocation batch payloads.
/// @ingroup io_loaders

#include <wardsched/io/error.hpp>

#include <wardsched/algo/priority_allocator.hpp>

#include <wardsched/core/trace_writer.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace wardsched::io {

/// @brief Well-formed requests of a payload plus one error per rejected request.
/// @ingroup io_loaders
struct BatchPayload {
    std::vector<algo::AllocationRequest> requests;  ///< In payload order.
    std::vector<PayloadError> errors;
};

/// @brief Load a batch payload from a JSON file.
///
/// The root is either `{"patients": [...]}` or a bare array of requests:
/// @code{.json}
/// { "patients": [ {
///     "patient_id": "P1",
///     "risk_profile": { "numeric_score": 0.9, "risk_category": "Critical",
///                       "predicted_duration_of_stay": "2-3 days" },
///     "feasibility_options": [
///         { "nurse_name": "N1", "room_id": "R1", "room_type": "Isolation",
///           "nurse_load": 2, "certifications": ["ICU-certified"] } ] } ] }
/// @endcode
///
/// Each request is checked on its own; a malformed request is left out of
/// @c requests and reported in @c errors (and as a `payload_rejected`
/// trace event) without affecting the others. Shapes that would need
/// guessing are rejected as PayloadErrorKind::AmbiguousShape: strings
/// holding JSON, alternative key spellings (`id`, `nurse`, `room`,
/// `current_load`), a nested `risk_profile.risk_profile`, and score or
/// category keys outside `risk_profile`.
///
/// @throws LoaderError if the file cannot be read, is not valid JSON, or
///         its root has neither accepted shape.
/// @ingroup io_loaders
[[nodiscard]] BatchPayload load_batch_payload(const std::filesystem::path& path,
                                              core::TraceWriter* trace = nullptr);

/// @brief Load a batch payload from a JSON string.
/// @see load_batch_payload
/// @ingroup io_loaders
[[nodiscard]] BatchPayload load_batch_payload_from_string(std::string_view json,
                                                          core::TraceWriter* trace = nullptr);

} // namespace wardsched::io
