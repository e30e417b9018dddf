#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for herald_event

#include <cstdint>

namespace herald_event {

// IDs
struct SubscriberId;

// Accounting
class PendingCounter;
struct EventStats;

// Core types
template<typename T>
class DeliveryQueue;

template<typename T>
class SubscriptionRegistry;

struct BusConfig;
struct Unit;

template<typename T>
class Event;

class ScopedSubscription;

} // namespace herald_event
