#pragma once

/// @file output_writers.hpp
/// @brief JSON artifacts of allocation runs (allocations, request view, staff view).
/// @ingroup io_writers

#include <wardsched/io/error.hpp>

#include <wardsched/algo/admission_pipeline.hpp>
#include <wardsched/algo/priority_allocator.hpp>

#include <wardsched/core/request.hpp>

#include <filesystem>
#include <ostream>
#include <span>
#include <string_view>
#include <vector>

namespace wardsched::io {

inline constexpr std::string_view ALLOCATIONS_FILE_NAME = "final_allocations.json";
inline constexpr std::string_view REQUEST_VIEW_FILE_NAME = "patient_view.json";
inline constexpr std::string_view STAFF_VIEW_FILE_NAME = "nurse_view.json";

/// @brief Staff-centric view of @p rounds.
///
/// Writes `{"nurses": [{"nurse", "rounds": [{"patient_id", "room_id",
/// "start", "stop"}]}]}` with staff sorted by name and each staff member's
/// rounds sorted by start.
///
/// @ingroup io_writers
void write_staff_view(std::span<const core::RotationRound> rounds, std::ostream& out);

/// @brief Request-centric view of a pipeline batch.
///
/// Writes `{"patients": [{"patient_id", "room_id", "start", "stop",
/// "nurse_rounds"}]}` in submission order; unset values are -1.
///
/// @ingroup io_writers
void write_request_view(std::span<const core::Request> requests,
                        std::span<const core::RotationRound> rounds,
                        std::ostream& out);

/// @brief Request-centric view of a priority allocation.
/// @ingroup io_writers
void write_record_view(std::span<const core::AllocationRecord> records, std::ostream& out);

/// @brief Full result of a priority allocation, including rejected payload entries.
/// @ingroup io_writers
void write_allocation_records(const algo::BatchAllocation& allocation,
                              std::span<const PayloadError> rejected,
                              std::ostream& out);

/// @brief Full result of a pipeline batch.
/// @ingroup io_writers
void write_batch_result(const algo::BatchResult& result, std::ostream& out);

/// @brief Write final_allocations, patient_view, nurse_view and hospital_space
///        for a pipeline batch into @p dir (created if needed).
/// @return Paths of the written files.
/// @throws LoaderError if a file cannot be written.
/// @ingroup io_writers
std::vector<std::filesystem::path> write_pipeline_output(const algo::BatchResult& result,
                                                         const std::filesystem::path& dir);

/// @brief Write final_allocations, patient_view and nurse_view for a
///        priority allocation into @p dir (created if needed).
/// @return Paths of the written files.
/// @throws LoaderError if a file cannot be written.
/// @ingroup io_writers
std::vector<std::filesystem::path> write_allocation_output(const algo::BatchAllocation& allocation,
                                                           std::span<const PayloadError> rejected,
                                                           const std::filesystem::path& dir);

} // namespace wardsched::io
