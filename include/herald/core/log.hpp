#pragma once

/// @file log.hpp
/// @brief Logging utilities for herald

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define HERALD_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define HERALD_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define HERALD_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define HERALD_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define HERALD_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define HERALD_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace herald_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the default logger pattern and level
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for herald_core (task pool, config)
std::shared_ptr<spdlog::logger> core_logger();

/// Logger for herald_event (buses, delivery queues)
std::shared_ptr<spdlog::logger> event_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Log Scoping (RAII)
// =============================================================================

/// RAII log scope for function/block tracing
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "herald_core");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define HERALD_LOG_CONCAT_IMPL(a, b) a##b
#define HERALD_LOG_CONCAT(a, b) HERALD_LOG_CONCAT_IMPL(a, b)
#define HERALD_LOG_SCOPE(name) ::herald_core::LogScope HERALD_LOG_CONCAT(_log_scope_, __LINE__)(name)

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace herald_core
