#pragma once

/// @defgroup core Core Library
/// @brief Data model, time windows, resource pool and allocation snapshots.
///
/// The core library holds the state every allocation run mutates: the
/// ResourcePool of bookable rooms, the Request ledger, and the
/// AllocationState snapshots chained between batch runs. It has no
/// dependencies on allocation policies or I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Time windows and unit helpers.

/// @defgroup core_model Data Model
/// @ingroup core
/// @brief Requests, risk profiles, feasible options, rotation rounds, records.

/// @defgroup core_pool Resource Pool
/// @ingroup core
/// @brief ResourcePool and AllocationState.

// Convenience header for Library 1
#include <wardsched/core/allocation_state.hpp>
#include <wardsched/core/error.hpp>
#include <wardsched/core/request.hpp>
#include <wardsched/core/resource_pool.hpp>
#include <wardsched/core/trace_writer.hpp>
#include <wardsched/core/types.hpp>
