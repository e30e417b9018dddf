#pragma once

/// @file registry.hpp
/// @brief Subscriber registry with weak-reference liveness tracking
///
/// Maps each SubscriberId to its subscription: weak reference, delivery
/// queue and pending counter. The registry is not synchronized on its own;
/// the owning bus serializes every call under its mutex.

#include "fwd.hpp"
#include "subscriber_id.hpp"
#include "pending_counter.hpp"
#include "delivery_queue.hpp"
#include <herald/core/task_pool.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace herald_event {

/// Registry of live subscriptions for one bus
template<typename T>
class SubscriptionRegistry {
public:
    /// One registration
    struct Entry {
        SubscriberId id;
        std::weak_ptr<const void> subscriber;
        std::shared_ptr<DeliveryQueue<T>> queue;
        PendingCounter pending;

        [[nodiscard]] bool is_alive() const noexcept { return !subscriber.expired(); }
    };

    using EntryPtr = std::shared_ptr<Entry>;

    /// Teardown counters, cumulative for the registry's lifetime
    struct Counters {
        std::size_t replaced = 0;
        std::size_t swept = 0;
        std::size_t removed = 0;
        std::size_t discarded_values = 0;
    };

    SubscriptionRegistry(std::shared_ptr<herald_core::TaskPool> pool, std::string bus_name)
        : m_pool(std::move(pool))
        , m_bus_name(std::move(bus_name)) {}

    SubscriptionRegistry(const SubscriptionRegistry&) = delete;
    SubscriptionRegistry& operator=(const SubscriptionRegistry&) = delete;

    /// Callbacks handed to every queue created from now on
    void set_callbacks(DeliveryCallbacks<T> callbacks) {
        m_callbacks = std::move(callbacks);
    }

    /// Register a subscriber, tearing down any previous entry for the same id
    /// @return true if an existing entry was replaced
    bool register_subscriber(SubscriberId id, std::weak_ptr<const void> subscriber, Handler<T> handler) {
        bool replaced = false;
        auto it = m_entries.find(id);
        if (it != m_entries.end()) {
            teardown(*it->second);
            m_entries.erase(it);
            ++m_counters.replaced;
            replaced = true;
        }

        auto entry = std::make_shared<Entry>();
        entry->id = id;
        entry->subscriber = subscriber;
        entry->queue = std::make_shared<DeliveryQueue<T>>(
            id, std::move(subscriber), std::move(handler), m_pool, m_callbacks, m_bus_name);
        m_entries.emplace(id, std::move(entry));
        return replaced;
    }

    /// Remove a subscriber. No-op if absent.
    /// @return true if an entry was removed
    bool deregister(SubscriberId id) {
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return false;
        }
        teardown(*it->second);
        m_entries.erase(it);
        ++m_counters.removed;
        return true;
    }

    /// Tear down every entry whose subscriber has been destroyed
    /// @return Number of entries removed
    std::size_t sweep() {
        std::size_t removed = 0;
        for (auto it = m_entries.begin(); it != m_entries.end();) {
            if (!it->second->is_alive()) {
                teardown(*it->second);
                it = m_entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        m_counters.swept += removed;
        return removed;
    }

    /// Tear down every entry
    void clear() {
        for (auto& [id, entry] : m_entries) {
            teardown(*entry);
        }
        m_counters.removed += m_entries.size();
        m_entries.clear();
    }

    /// Snapshot of registered entries whose subscriber is still alive
    [[nodiscard]] std::vector<EntryPtr> active_entries() const {
        std::vector<EntryPtr> entries;
        entries.reserve(m_entries.size());
        for (const auto& [id, entry] : m_entries) {
            if (entry->is_alive()) {
                entries.push_back(entry);
            }
        }
        return entries;
    }

    /// Entry for an id, or null
    [[nodiscard]] EntryPtr find(SubscriberId id) const {
        auto it = m_entries.find(id);
        return it != m_entries.end() ? it->second : nullptr;
    }

    /// Entry currently served by this queue, or null if the queue was torn down
    [[nodiscard]] EntryPtr find_owner(const DeliveryQueue<T>& queue) const {
        auto entry = find(queue.subscriber());
        if (entry && entry->queue.get() == &queue) {
            return entry;
        }
        return nullptr;
    }

    [[nodiscard]] bool contains(SubscriberId id) const { return m_entries.count(id) > 0; }

    /// Pending count for one id (0 if absent)
    [[nodiscard]] std::size_t pending_for(SubscriberId id) const {
        auto entry = find(id);
        return entry ? entry->pending.count() : 0;
    }

    /// Sum of all tracked pending counters
    [[nodiscard]] std::size_t total_pending() const {
        std::size_t total = 0;
        for (const auto& [id, entry] : m_entries) {
            total += entry->pending.count();
        }
        return total;
    }

    /// True when every tracked pending counter is zero
    [[nodiscard]] bool all_idle() const {
        for (const auto& [id, entry] : m_entries) {
            if (!entry->pending.is_zero()) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] const Counters& counters() const noexcept { return m_counters; }

private:
    /// Cancel the processing task, drop queued values and the counter
    void teardown(Entry& entry) {
        m_counters.discarded_values += entry.queue->cancel();
        entry.pending.reset();
    }

    std::shared_ptr<herald_core::TaskPool> m_pool;
    std::string m_bus_name;
    DeliveryCallbacks<T> m_callbacks;
    std::unordered_map<SubscriberId, EntryPtr> m_entries;
    Counters m_counters;
};

} // namespace herald_event
