/// @file error.cpp
/// @brief Error handling implementation for herald_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities

#include <herald/core/error.hpp>
#include <sstream>
#include <vector>

namespace herald_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

/// Format config error with full context
std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.field.empty()) {
        oss << " (field: " << err.field << ")";
    }
    if (!err.source.empty() && err.kind == ConfigError::Kind::InvalidValue) {
        oss << " (source: " << err.source << ")";
    }

    return oss.str();
}

/// Format task pool error with full context
std::string format_task_pool_error(const TaskPoolError& err) {
    std::ostringstream oss;
    oss << "[TaskPoolError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        } else if constexpr (std::is_same_v<T, TaskPoolError>) {
            oss << detail::format_task_pool_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;

} // namespace herald_core
