#pragma once

/// @file stats.hpp
/// @brief Per-bus delivery statistics

#include "fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace herald_event {

/// Counters for one bus, cumulative since construction
struct EventStats {
    std::uint64_t events_fired = 0;           ///< fire / fire_and_wait calls
    std::uint64_t deliveries_enqueued = 0;    ///< values appended to delivery queues
    std::uint64_t deliveries_completed = 0;   ///< handler invocations that returned or threw
    std::uint64_t deliveries_dropped = 0;     ///< values discarded by teardown or a stopped pool
    std::uint64_t handler_failures = 0;       ///< handler invocations that threw
    std::uint64_t subscriptions_replaced = 0; ///< subscribe calls that replaced an entry
    std::uint64_t subscribers_swept = 0;      ///< entries removed because the subscriber died
    std::size_t active_subscribers = 0;       ///< entries currently registered
    std::size_t pending_deliveries = 0;       ///< sum of pending counters right now
};

/// Format EventStats as a human-readable block
[[nodiscard]] std::string format_stats(const EventStats& stats);

} // namespace herald_event
