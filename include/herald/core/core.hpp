#pragma once

/// @file core.hpp
/// @brief Main include file for herald_core module
///
/// This header includes all herald_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Error handling and logging (no dependencies on other herald_core headers)
#include "error.hpp"
#include "log.hpp"

// Scheduling
#include "task_pool.hpp"

// Configuration
#include "config.hpp"

/// @namespace herald_core
/// @brief Infrastructure shared by every herald module
///
/// - **Error Handling**: Result<T> with typed domain errors
/// - **Logging**: spdlog-backed named loggers
/// - **Scheduling**: TaskPool worker threads and the shared default pool
/// - **Configuration**: JSON runtime configuration
