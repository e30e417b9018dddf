/// @file config.cpp
/// @brief Runtime configuration parsing for herald_core

#include <herald/core/config.hpp>

#include <fstream>
#include <sstream>

namespace herald_core {

namespace {

/// Read an optional boolean field
Result<void> read_bool(const nlohmann::json& obj, const char* key, const std::string& path, bool& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return Ok();
    }
    if (!it->is_boolean()) {
        return Err(ConfigError::invalid_value(path + key, "expected boolean"));
    }
    out = it->get<bool>();
    return Ok();
}

/// Read an optional non-negative integer field
Result<void> read_size(const nlohmann::json& obj, const char* key, const std::string& path, std::size_t& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return Ok();
    }
    if (!it->is_number_unsigned()) {
        return Err(ConfigError::invalid_value(path + key, "expected non-negative integer"));
    }
    out = it->get<std::size_t>();
    return Ok();
}

/// Read an optional string field
Result<void> read_string(const nlohmann::json& obj, const char* key, const std::string& path, std::string& out) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        return Ok();
    }
    if (!it->is_string()) {
        return Err(ConfigError::invalid_value(path + key, "expected string"));
    }
    out = it->get<std::string>();
    return Ok();
}

Result<void> parse_log_section(const nlohmann::json& j, LogConfig& log) {
    if (!j.is_object()) {
        return Err(ConfigError::invalid_value("log", "expected object"));
    }

    std::string level_name = log_level_name(log.level);
    if (auto r = read_string(j, "level", "log.", level_name); !r) return r;
    auto level = parse_log_level(level_name);
    if (!level) {
        return Err(ConfigError::invalid_value("log.level", "unknown level '" + level_name + "'"));
    }
    log.level = *level;

    if (auto r = read_bool(j, "console", "log.", log.console_enabled); !r) return r;
    if (auto r = read_bool(j, "file", "log.", log.file_enabled); !r) return r;
    if (auto r = read_string(j, "directory", "log.", log.log_directory); !r) return r;
    if (auto r = read_size(j, "max_file_size", "log.", log.max_file_size); !r) return r;
    if (auto r = read_size(j, "max_files", "log.", log.max_files); !r) return r;

    if (log.file_enabled && log.log_directory.empty()) {
        return Err(ConfigError::invalid_value("log.directory", "required when file output is enabled"));
    }
    return Ok();
}

Result<void> parse_task_pool_section(const nlohmann::json& j, TaskPoolConfig& pool) {
    if (!j.is_object()) {
        return Err(ConfigError::invalid_value("task_pool", "expected object"));
    }

    if (auto r = read_size(j, "workers", "task_pool.", pool.worker_count); !r) return r;
    if (auto r = read_string(j, "name", "task_pool.", pool.name); !r) return r;

    if (pool.name.empty()) {
        return Err(ConfigError::invalid_value("task_pool.name", "must not be empty"));
    }
    return Ok();
}

} // anonymous namespace

// =============================================================================
// RuntimeConfig
// =============================================================================

Result<RuntimeConfig> RuntimeConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Err<RuntimeConfig>(ConfigError::invalid_value("<root>", "expected object"));
    }

    RuntimeConfig config;

    if (auto it = j.find("log"); it != j.end()) {
        if (auto r = parse_log_section(*it, config.log); !r) {
            return Err<RuntimeConfig>(r.error());
        }
    }

    if (auto it = j.find("task_pool"); it != j.end()) {
        if (auto r = parse_task_pool_section(*it, config.task_pool); !r) {
            return Err<RuntimeConfig>(r.error());
        }
    }

    return Ok(std::move(config));
}

nlohmann::json RuntimeConfig::to_json() const {
    nlohmann::json j;
    j["log"] = {
        {"level", log_level_name(log.level)},
        {"console", log.console_enabled},
        {"file", log.file_enabled},
        {"directory", log.log_directory},
        {"max_file_size", log.max_file_size},
        {"max_files", log.max_files},
    };
    j["task_pool"] = {
        {"workers", task_pool.worker_count},
        {"name", task_pool.name},
    };
    return j;
}

// =============================================================================
// Loading
// =============================================================================

Result<RuntimeConfig> parse_runtime_config(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<RuntimeConfig>(ConfigError::parse_error("<string>", e.what()));
    }
    return RuntimeConfig::from_json(j);
}

Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Err<RuntimeConfig>(ConfigError::file_not_found(path.string()));
    }

    std::ifstream file(path);
    if (!file) {
        return Err<RuntimeConfig>(ConfigError::read_failed(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return Err<RuntimeConfig>(ConfigError::parse_error(path.string(), e.what()));
    }

    auto result = RuntimeConfig::from_json(j);
    if (!result) {
        Error err = result.error();
        err.with_context("file", path.string());
        return Err<RuntimeConfig>(std::move(err));
    }
    return result;
}

Result<void> apply_runtime_config(const RuntimeConfig& config) {
    configure_logging(config.log);
    auto result = configure_default_task_pool(config.task_pool);
    if (!result) {
        core_logger()->warn("Default task pool not reconfigured: {}", result.error().message());
        return result;
    }
    core_logger()->info("Runtime configured (log level {}, {} worker(s))",
        log_level_name(config.log.level), config.task_pool.resolved_worker_count());
    return Ok();
}

} // namespace herald_core
