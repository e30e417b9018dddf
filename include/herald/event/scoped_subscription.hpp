#pragma once

/// @file scoped_subscription.hpp
/// @brief RAII guard that unsubscribes on destruction

#include "fwd.hpp"
#include "subscriber_id.hpp"

#include <memory>

namespace herald_event {

namespace detail {

/// Type-erased unsubscribe entry point of a bus
class Unsubscriber {
public:
    virtual ~Unsubscriber() = default;
    virtual void unsubscribe(SubscriberId id) = 0;
};

} // namespace detail

/// Move-only guard that unsubscribes its subscriber when destroyed.
/// Holds the bus weakly: outliving the bus is safe.
class ScopedSubscription {
public:
    ScopedSubscription() = default;

    ScopedSubscription(std::weak_ptr<detail::Unsubscriber> bus, SubscriberId id)
        : m_bus(std::move(bus)), m_id(id) {}

    ~ScopedSubscription() {
        reset();
    }

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : m_bus(std::move(other.m_bus)), m_id(other.m_id) {
        other.m_bus.reset();
    }

    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            m_bus = std::move(other.m_bus);
            m_id = other.m_id;
            other.m_bus.reset();
        }
        return *this;
    }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    /// Unsubscribe now
    void reset() {
        if (auto bus = m_bus.lock()) {
            bus->unsubscribe(m_id);
        }
        m_bus.reset();
    }

    /// Release ownership without unsubscribing
    SubscriberId release() {
        m_bus.reset();
        return m_id;
    }

    [[nodiscard]] SubscriberId id() const noexcept { return m_id; }

    /// True while the guard is attached to a bus that still exists
    [[nodiscard]] bool is_active() const { return !m_bus.expired(); }

private:
    std::weak_ptr<detail::Unsubscriber> m_bus;
    SubscriberId m_id;
};

} // namespace herald_event
