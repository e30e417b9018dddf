/// @file event.cpp
/// @brief herald_event module information and formatting helpers
///
/// herald_event is primarily header-only with template implementations.
/// This file provides:
/// - A compilation unit for the CMake library target
/// - SubscriberId and EventStats formatting
/// - Version information

#include <herald/event/event.hpp>

#include <fmt/format.h>

namespace herald_event {

/// Module version
static constexpr const char* k_version = "1.0.0";

/// Module name
static constexpr const char* k_module_name = "herald_event";

const char* version() noexcept {
    return k_version;
}

const char* module_name() noexcept {
    return k_module_name;
}

// =============================================================================
// Formatting
// =============================================================================

std::string SubscriberId::to_string() const {
    return fmt::format("{:#x}", value);
}

std::string format_stats(const EventStats& stats) {
    return fmt::format(
        "events fired:           {}\n"
        "deliveries enqueued:    {}\n"
        "deliveries completed:   {}\n"
        "deliveries dropped:     {}\n"
        "handler failures:       {}\n"
        "subscriptions replaced: {}\n"
        "subscribers swept:      {}\n"
        "active subscribers:     {}\n"
        "pending deliveries:     {}",
        stats.events_fired,
        stats.deliveries_enqueued,
        stats.deliveries_completed,
        stats.deliveries_dropped,
        stats.handler_failures,
        stats.subscriptions_replaced,
        stats.subscribers_swept,
        stats.active_subscribers,
        stats.pending_deliveries);
}

} // namespace herald_event
