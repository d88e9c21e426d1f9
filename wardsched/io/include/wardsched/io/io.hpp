#pragma once

/// @defgroup io I/O Library
/// @brief Config, request feed, batch payload and snapshot loaders; output and trace writers.
///
/// The I/O library handles every external data format: the JSON ward
/// configuration, the CSV request feed, strict batch payloads, the
/// resource snapshot chained between batches, the JSON output views and
/// the trace writers. Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief JSON and CSV loaders.

/// @defgroup io_writers Writers
/// @ingroup io
/// @brief Output views and JSON, textual, memory and null trace writers.

// Convenience header for Library 3 (I/O)

#include <wardsched/io/batch_loader.hpp>
#include <wardsched/io/config_loader.hpp>
#include <wardsched/io/error.hpp>
#include <wardsched/io/output_writers.hpp>
#include <wardsched/io/request_feed.hpp>
#include <wardsched/io/snapshot_io.hpp>
#include <wardsched/io/trace_writers.hpp>
