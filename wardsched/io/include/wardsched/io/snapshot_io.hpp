#pragma once

/// @file snapshot_io.hpp
/// @brief Persist and reload the resource snapshot chained between batches.
/// @ingroup io_loaders

#include <wardsched/core/allocation_state.hpp>

#include <filesystem>
#include <ostream>
#include <string_view>

namespace wardsched::io {

/// File name of the snapshot inside an output directory.
inline constexpr std::string_view SNAPSHOT_FILE_NAME = "hospital_space.json";

/// @brief Write the resources of @p state as `{"hospital_space": [...]}`.
///
/// Each resource is `{"id", "start", "stop"}`, plus `"patient_id"` when the
/// request holding the latest occupancy is known. Unset bounds are written
/// as -1.
///
/// @ingroup io_loaders
void write_snapshot_to_stream(const core::AllocationState& state, std::ostream& out);

/// @brief Write the snapshot to @p path.
/// @throws LoaderError if the file cannot be opened for writing.
/// @ingroup io_loaders
void write_snapshot(const core::AllocationState& state, const std::filesystem::path& path);

/// @brief Load a snapshot written by write_snapshot().
///
/// @p path may name the snapshot file or a directory holding
/// hospital_space.json. The returned state carries the resources only;
/// their occupants come from the optional `"patient_id"` keys.
///
/// @throws LoaderError if the snapshot does not exist or is malformed.
/// @ingroup io_loaders
[[nodiscard]] core::AllocationState load_snapshot(const std::filesystem::path& path);

/// @brief Load a snapshot from a JSON string.
/// @see load_snapshot
/// @ingroup io_loaders
[[nodiscard]] core::AllocationState load_snapshot_from_string(std::string_view json);

} // namespace wardsched::io
