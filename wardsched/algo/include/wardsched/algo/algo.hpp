#pragma once

/// @defgroup algo Algo Library
/// @brief Rotation scheduling, priority allocation, conflict checks and the admission pipeline.
///
/// The algo library implements the allocation policies on top of the core
/// data model: the serial-dictatorship PriorityAllocator, the
/// RotationScheduler with its per-staff ledger, the post-hoc conflict
/// validator, the guarded risk predictors and the batch AdmissionPipeline.
/// Depends on core only.

/// @defgroup algo_allocators Allocators
/// @ingroup algo
/// @brief Option scoring and priority (serial dictatorship) allocation.

/// @defgroup algo_rotation Rotation
/// @ingroup algo
/// @brief Staff rotation rounds, duration labels and conflict validation.

/// @defgroup algo_predictors Predictors
/// @ingroup algo
/// @brief Risk predictor contract, variants and fallbacks.

/// @defgroup algo_pipeline Pipeline
/// @ingroup algo
/// @brief Batch admission runs and the Ward that chains them.

// Convenience header for Library 2 (libwardsched-algo)
// Includes all public headers for allocation algorithms

#include <wardsched/algo/admission_pipeline.hpp>
#include <wardsched/algo/conflict_validator.hpp>
#include <wardsched/algo/duration_label.hpp>
#include <wardsched/algo/error.hpp>
#include <wardsched/algo/option_scoring.hpp>
#include <wardsched/algo/priority_allocator.hpp>
#include <wardsched/algo/risk_predictor.hpp>
#include <wardsched/algo/rotation_scheduler.hpp>
#include <wardsched/algo/ward.hpp>
#include <wardsched/algo/ward_config.hpp>
