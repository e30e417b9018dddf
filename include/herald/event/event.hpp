#pragma once

/// @file event.hpp
/// @brief Typed broadcast event with weakly held subscribers
///
/// herald_event::Event<T> broadcasts values of type T to subscriber objects:
/// - Subscribers are held through weak references and dropped once destroyed
/// - One subscription per subscriber object; subscribing again replaces it
/// - Each subscriber gets values in the order they were fired
/// - fire() returns at once; fire_and_wait() blocks until handlers finished
///
/// ## Quick Start
/// ```cpp
/// herald_event::Event<std::string> name_changed;
///
/// auto view = std::make_shared<ProfileView>();
/// name_changed.subscribe(view, [raw = view.get()](const std::string& name) {
///     raw->show(name);
/// });
///
/// name_changed.fire("John Doe");           // non-blocking
/// name_changed.fire_and_wait("Jane Doe");  // returns after show() ran
///
/// view.reset();                            // implicitly unsubscribed
/// ```
///
/// A handler only runs while its subscriber is alive: the delivery queue
/// locks the subscriber for the call, and values still queued for a destroyed
/// subscriber are dropped. Capturing a raw pointer to the subscriber, as
/// above, is therefore safe.
///
/// Handlers run on the bus's TaskPool. Calling fire_and_wait() or
/// wait_for_pending_events() from inside a handler of the same bus never
/// returns: the calling handler keeps its own pending count above zero.

#include "fwd.hpp"
#include "subscriber_id.hpp"
#include "pending_counter.hpp"
#include "delivery_queue.hpp"
#include "registry.hpp"
#include "scoped_subscription.hpp"
#include "stats.hpp"
#include <herald/core/log.hpp>
#include <herald/core/task_pool.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace herald_event {

// =============================================================================
// Types
// =============================================================================

/// Handler that completes through a future; the subscriber's next value is
/// delivered only after the future is ready
template<typename T>
using AsyncHandler = std::function<std::future<void>(const T&)>;

/// Sentinel payload of Event<void>
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept = default;
};

/// Bus configuration
struct BusConfig {
    /// Name used in log output
    std::string name = "event";
};

/// Adapt an AsyncHandler to a Handler that waits for the future
template<typename T>
[[nodiscard]] Handler<T> wrap_async(AsyncHandler<T> handler) {
    return [h = std::move(handler)](const T& value) {
        auto done = h(value);
        if (done.valid()) {
            done.get();
        }
    };
}

// =============================================================================
// BusState
// =============================================================================

namespace detail {

/// Shared state of one bus. Owns the registry and the single mutex that
/// serializes every registry mutation and counter update. Drain jobs reach it
/// through weak references, so they may safely outlive the bus.
template<typename T>
class BusState final
    : public Unsubscriber
    , public std::enable_shared_from_this<BusState<T>> {
public:
    BusState(BusConfig config, std::shared_ptr<herald_core::TaskPool> pool)
        : m_name(std::move(config.name))
        , m_pool(std::move(pool))
        , m_registry(m_pool, m_name) {}

    /// Wire queue callbacks back to this state (needs a live shared_ptr)
    void bind() {
        std::weak_ptr<BusState> weak = this->weak_from_this();
        DeliveryCallbacks<T> callbacks;
        callbacks.completed = [weak](const DeliveryQueue<T>& queue, bool handler_failed) {
            if (auto state = weak.lock()) {
                state->on_completed(queue, handler_failed);
            }
        };
        callbacks.dropped = [weak](const DeliveryQueue<T>& queue, std::size_t count) {
            if (auto state = weak.lock()) {
                state->on_dropped(queue, count);
            }
        };
        m_registry.set_callbacks(std::move(callbacks));
    }

    void subscribe(SubscriberId id, std::weak_ptr<const void> subscriber, Handler<T> handler) {
        bool notify = false;
        {
            std::lock_guard lock(m_mutex);
            notify = sweep_locked() > 0;
            if (m_registry.register_subscriber(id, std::move(subscriber), std::move(handler))) {
                herald_core::event_logger()->debug("[{}] subscriber {} replaced", m_name, id.to_string());
                notify = true;
            } else {
                herald_core::event_logger()->debug("[{}] subscriber {} registered", m_name, id.to_string());
            }
        }
        if (notify) {
            m_idle.notify_all();
        }
    }

    void unsubscribe(SubscriberId id) override {
        bool removed = false;
        {
            std::lock_guard lock(m_mutex);
            removed = m_registry.deregister(id);
        }
        if (removed) {
            herald_core::event_logger()->debug("[{}] subscriber {} unsubscribed", m_name, id.to_string());
            m_idle.notify_all();
        }
    }

    /// Sweep, then enqueue the value for every live subscriber
    void fire(std::shared_ptr<const T> value) {
        bool notify = false;
        {
            std::lock_guard lock(m_mutex);
            notify = sweep_locked() > 0;
            ++m_stats.events_fired;

            for (const auto& entry : m_registry.active_entries()) {
                entry->pending.increment();
                ++m_stats.deliveries_enqueued;

                auto result = entry->queue->push(value);
                if (!result) {
                    std::size_t lost = entry->pending.reset();
                    m_stats.deliveries_dropped += lost;
                    herald_core::event_logger()->error("[{}] subscriber {}: {} value(s) dropped: {}",
                        m_name, entry->id.to_string(), lost, result.error().message());
                    notify = true;
                }
            }
            herald_core::event_logger()->trace("[{}] fired to {} subscriber(s)", m_name, m_registry.size());
        }
        if (notify) {
            m_idle.notify_all();
        }
    }

    /// Block until every tracked pending counter is zero
    void wait_idle() {
        warn_if_worker();
        std::unique_lock lock(m_mutex);
        m_idle.wait(lock, [this] { return m_registry.all_idle(); });
    }

    /// Bounded wait_idle()
    /// @return true if everything drained before the timeout
    bool wait_idle_for(std::chrono::nanoseconds timeout) {
        warn_if_worker();
        std::unique_lock lock(m_mutex);
        return m_idle.wait_for(lock, timeout, [this] { return m_registry.all_idle(); });
    }

    /// Tear down every subscription
    void shutdown() {
        {
            std::lock_guard lock(m_mutex);
            if (!m_registry.empty()) {
                herald_core::event_logger()->debug("[{}] shutting down with {} subscriber(s)",
                    m_name, m_registry.size());
            }
            m_registry.clear();
        }
        m_idle.notify_all();
    }

    [[nodiscard]] std::size_t subscriber_count() const {
        std::lock_guard lock(m_mutex);
        return m_registry.size();
    }

    [[nodiscard]] bool is_subscribed(SubscriberId id) const {
        std::lock_guard lock(m_mutex);
        auto entry = m_registry.find(id);
        return entry && entry->is_alive();
    }

    [[nodiscard]] std::size_t pending_count() const {
        std::lock_guard lock(m_mutex);
        return m_registry.total_pending();
    }

    [[nodiscard]] EventStats stats() const {
        std::lock_guard lock(m_mutex);
        EventStats s = m_stats;
        const auto& counters = m_registry.counters();
        s.deliveries_dropped += counters.discarded_values;
        s.subscriptions_replaced = counters.replaced;
        s.subscribers_swept = counters.swept;
        s.active_subscribers = m_registry.size();
        s.pending_deliveries = m_registry.total_pending();
        return s;
    }

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    [[nodiscard]] const std::shared_ptr<herald_core::TaskPool>& pool() const noexcept { return m_pool; }

private:
    std::size_t sweep_locked() {
        std::size_t swept = m_registry.sweep();
        if (swept > 0) {
            herald_core::event_logger()->debug("[{}] swept {} destroyed subscriber(s)", m_name, swept);
        }
        return swept;
    }

    void on_completed(const DeliveryQueue<T>& queue, bool handler_failed) {
        bool reached_zero = false;
        {
            std::lock_guard lock(m_mutex);
            ++m_stats.deliveries_completed;
            if (handler_failed) {
                ++m_stats.handler_failures;
            }
            // A torn-down queue still finishes its in-flight value; its counter is gone
            if (auto entry = m_registry.find_owner(queue)) {
                reached_zero = entry->pending.decrement();
            }
        }
        if (reached_zero) {
            m_idle.notify_all();
        }
    }

    void on_dropped(const DeliveryQueue<T>& queue, std::size_t count) {
        {
            std::lock_guard lock(m_mutex);
            m_stats.deliveries_dropped += count;
            if (auto entry = m_registry.find_owner(queue)) {
                for (std::size_t i = 0; i < count; ++i) {
                    entry->pending.decrement();
                }
            }
        }
        m_idle.notify_all();
    }

    void warn_if_worker() const {
        if (m_pool->is_worker_thread()) {
            herald_core::event_logger()->warn(
                "[{}] waiting for pending events on a worker of pool '{}'; this stalls if the pool has no free worker",
                m_name, m_pool->name());
        }
    }

    const std::string m_name;
    const std::shared_ptr<herald_core::TaskPool> m_pool;

    mutable std::mutex m_mutex;
    std::condition_variable m_idle;
    SubscriptionRegistry<T> m_registry;
    EventStats m_stats;
};

} // namespace detail

// =============================================================================
// Event<T>
// =============================================================================

/// Broadcast event carrying values of type T
/// @tparam T Payload type (copy- or move-constructible)
template<typename T>
class Event {
public:
    using value_type = T;
    using handler_type = Handler<T>;
    using async_handler_type = AsyncHandler<T>;

    /// Create an event on the default task pool
    Event() : Event(BusConfig{}) {}

    /// Create an event with a name and an optional dedicated pool
    explicit Event(BusConfig config, std::shared_ptr<herald_core::TaskPool> pool = nullptr)
        : m_state(std::make_shared<detail::BusState<T>>(
              std::move(config), pool ? std::move(pool) : herald_core::default_task_pool())) {
        m_state->bind();
    }

    ~Event() {
        if (m_state) {
            m_state->shutdown();
        }
    }

    // Non-copyable
    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;

    // Movable
    Event(Event&&) noexcept = default;
    Event& operator=(Event&& other) noexcept {
        if (this != &other) {
            if (m_state) {
                m_state->shutdown();
            }
            m_state = std::move(other.m_state);
        }
        return *this;
    }

    // =========================================================================
    // Subscribing
    // =========================================================================

    /// Subscribe an object, replacing its previous subscription if any.
    /// The bus holds the subscriber weakly; destroying it unsubscribes.
    template<typename S>
    void subscribe(const std::shared_ptr<S>& subscriber, Handler<T> handler) {
        if (!subscriber || !handler) {
            herald_core::event_logger()->warn("[{}] subscribe ignored: {}", m_state->name(),
                subscriber ? "empty handler" : "null subscriber");
            return;
        }
        m_state->subscribe(SubscriberId::of(subscriber),
            std::weak_ptr<const void>(subscriber), std::move(handler));
    }

    /// Subscribe with a handler that completes through a future
    template<typename S>
    void subscribe_async(const std::shared_ptr<S>& subscriber, AsyncHandler<T> handler) {
        if (!handler) {
            subscribe(subscriber, Handler<T>{});
            return;
        }
        subscribe(subscriber, wrap_async<T>(std::move(handler)));
    }

    /// Subscribe and get a guard that unsubscribes when it goes out of scope
    template<typename S>
    [[nodiscard]] ScopedSubscription subscribe_scoped(const std::shared_ptr<S>& subscriber, Handler<T> handler) {
        subscribe(subscriber, std::move(handler));
        return ScopedSubscription(m_state, SubscriberId::of(subscriber));
    }

    /// Remove the subscription of an object. No effect if not subscribed.
    template<typename S>
    void unsubscribe(const S& subscriber) {
        m_state->unsubscribe(SubscriberId::of(subscriber));
    }

    template<typename S>
    void unsubscribe(const std::shared_ptr<S>& subscriber) {
        m_state->unsubscribe(SubscriberId::of(subscriber));
    }

    // =========================================================================
    // Firing
    // =========================================================================

    /// Deliver a value to every live subscriber without waiting for handlers
    void fire(T value) {
        m_state->fire(std::make_shared<const T>(std::move(value)));
    }

    /// Deliver a value and block until every pending delivery has finished
    void fire_and_wait(T value) {
        fire(std::move(value));
        m_state->wait_idle();
    }

    /// Block until every pending delivery has finished
    void wait_for_pending_events() {
        m_state->wait_idle();
    }

    /// Bounded wait_for_pending_events()
    /// @return true if everything drained, false on timeout
    template<typename Rep, typename Period>
    bool wait_for_pending_events_for(std::chrono::duration<Rep, Period> timeout) {
        return m_state->wait_idle_for(std::chrono::duration_cast<std::chrono::nanoseconds>(timeout));
    }

    // =========================================================================
    // Introspection
    // =========================================================================

    /// Registered subscriptions, including destroyed subscribers not yet swept
    [[nodiscard]] std::size_t subscriber_count() const { return m_state->subscriber_count(); }

    /// True if the object has a subscription and is still alive
    template<typename S>
    [[nodiscard]] bool is_subscribed(const S& subscriber) const {
        return m_state->is_subscribed(SubscriberId::of(subscriber));
    }

    template<typename S>
    [[nodiscard]] bool is_subscribed(const std::shared_ptr<S>& subscriber) const {
        return m_state->is_subscribed(SubscriberId::of(subscriber));
    }

    /// Sum of pending counters
    [[nodiscard]] std::size_t pending_count() const { return m_state->pending_count(); }

    [[nodiscard]] EventStats stats() const { return m_state->stats(); }

    [[nodiscard]] const std::string& name() const noexcept { return m_state->name(); }

private:
    std::shared_ptr<detail::BusState<T>> m_state;
};

// =============================================================================
// Event<void>
// =============================================================================

/// Event without payload
template<>
class Event<void> {
public:
    using handler_type = std::function<void()>;
    using async_handler_type = std::function<std::future<void>()>;

    Event() = default;

    explicit Event(BusConfig config, std::shared_ptr<herald_core::TaskPool> pool = nullptr)
        : m_inner(std::move(config), std::move(pool)) {}

    template<typename S>
    void subscribe(const std::shared_ptr<S>& subscriber, handler_type handler) {
        m_inner.subscribe(subscriber, adapt(std::move(handler)));
    }

    template<typename S>
    void subscribe_async(const std::shared_ptr<S>& subscriber, async_handler_type handler) {
        if (!handler) {
            m_inner.subscribe(subscriber, Handler<Unit>{});
            return;
        }
        m_inner.subscribe_async(subscriber,
            AsyncHandler<Unit>([h = std::move(handler)](const Unit&) { return h(); }));
    }

    template<typename S>
    [[nodiscard]] ScopedSubscription subscribe_scoped(const std::shared_ptr<S>& subscriber, handler_type handler) {
        return m_inner.subscribe_scoped(subscriber, adapt(std::move(handler)));
    }

    template<typename S>
    void unsubscribe(const S& subscriber) {
        m_inner.unsubscribe(subscriber);
    }

    void fire() { m_inner.fire(Unit{}); }
    void fire_and_wait() { m_inner.fire_and_wait(Unit{}); }
    void wait_for_pending_events() { m_inner.wait_for_pending_events(); }

    template<typename Rep, typename Period>
    bool wait_for_pending_events_for(std::chrono::duration<Rep, Period> timeout) {
        return m_inner.wait_for_pending_events_for(timeout);
    }

    [[nodiscard]] std::size_t subscriber_count() const { return m_inner.subscriber_count(); }

    template<typename S>
    [[nodiscard]] bool is_subscribed(const S& subscriber) const {
        return m_inner.is_subscribed(subscriber);
    }

    [[nodiscard]] std::size_t pending_count() const { return m_inner.pending_count(); }
    [[nodiscard]] EventStats stats() const { return m_inner.stats(); }
    [[nodiscard]] const std::string& name() const noexcept { return m_inner.name(); }

private:
    static Handler<Unit> adapt(handler_type handler) {
        if (!handler) {
            return {};
        }
        return [h = std::move(handler)](const Unit&) { h(); };
    }

    Event<Unit> m_inner;
};

/// Module version string
const char* version() noexcept;

/// Module name
const char* module_name() noexcept;

} // namespace herald_event
