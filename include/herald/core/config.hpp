#pragma once

/// @file config.hpp
/// @brief Runtime configuration loaded from JSON
///
/// Example document:
/// ```json
/// {
///     "log": { "level": "debug", "console": true, "file": true, "directory": "logs" },
///     "task_pool": { "workers": 4, "name": "herald" }
/// }
/// ```
/// Every field is optional; missing fields keep their defaults.

#include "fwd.hpp"
#include "error.hpp"
#include "log.hpp"
#include "task_pool.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace herald_core {

/// Aggregated runtime configuration
struct RuntimeConfig {
    LogConfig log;
    TaskPoolConfig task_pool;

    /// Build from a parsed JSON document
    [[nodiscard]] static Result<RuntimeConfig> from_json(const nlohmann::json& j);

    /// Serialize to JSON (round-trips through from_json)
    [[nodiscard]] nlohmann::json to_json() const;
};

/// Parse configuration from JSON text
[[nodiscard]] Result<RuntimeConfig> parse_runtime_config(const std::string& text);

/// Load configuration from a JSON file
[[nodiscard]] Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path);

/// Apply logging settings and the default task pool configuration
/// @return TaskPoolError::in_use if the default pool is already shared by a bus
[[nodiscard]] Result<void> apply_runtime_config(const RuntimeConfig& config);

} // namespace herald_core
