#pragma once

/// @file config_loader.hpp
/// @brief Load a WardConfig from JSON.
/// @ingroup io_loaders

#include <wardsched/algo/ward_config.hpp>

#include <filesystem>
#include <string_view>

namespace wardsched::io {

/// @brief Load a ward configuration from a JSON file.
///
/// Every key is optional; a missing key keeps the WardConfig default.
/// Recognised keys:
/// @code{.json}
/// {
///   "admission_threshold": 0.35,
///   "rotation": { "window_hours": 12, "rounds_per_resource": 4,
///                 "round_durations_minutes": [15, 20, 30], "interval_hours": 4 },
///   "scoring": { "max_staff_load": 6,
///                "resource_preferences": { "Critical": ["Negative Pressure", "Isolation", "General"] },
///                "default_preference": ["Negative Pressure", "Isolation", "General"],
///                "required_certifications": { "Critical": ["ICU-certified"] } },
///   "default_resource_count": 50, "resource_ids": ["R1", "R2"],
///   "default_batch_size": 25,
///   "roster": [ { "name": "Nurse_1", "load": 0 } ], "default_roster_size": 30,
///   "default_duration_hours": 72,
///   "need_fallback_probability": 0.5, "duration_fallback_hours": 72,
///   "min_duration_hours": 6, "max_duration_hours": 336,
///   "need_features": [], "duration_features": [], "id_column": "encounter_id",
///   "conflict_policy": "advisory"
/// }
/// @endcode
///
/// A category present in `resource_preferences` or
/// `required_certifications` replaces the default entry for that category.
///
/// @param path Path to the JSON file.
/// @return The validated configuration.
/// @throws LoaderError if the file cannot be read, a value has the wrong
///         type, or the resulting configuration is invalid.
/// @ingroup io_loaders
[[nodiscard]] algo::WardConfig load_config(const std::filesystem::path& path);

/// @brief Load a ward configuration from a JSON string.
/// @see load_config
/// @ingroup io_loaders
[[nodiscard]] algo::WardConfig load_config_from_string(std::string_view json);

} // namespace wardsched::io
