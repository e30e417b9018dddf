#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for herald_core module

#include <cstdint>

namespace herald_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct ConfigError;
struct TaskPoolError;
class Error;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

// =============================================================================
// Scheduling
// =============================================================================

struct TaskPoolConfig;
class TaskPool;

// =============================================================================
// Configuration
// =============================================================================

struct RuntimeConfig;

} // namespace herald_core
