#pragma once

/// @file delivery_queue.hpp
/// @brief Per-subscriber ordered delivery queue and its processing task
///
/// Each queue drains on the shared TaskPool. At most one drain job per queue
/// is scheduled at any time, which keeps handler invocations for one
/// subscriber strictly sequential and in enqueue order while different
/// subscribers run in parallel. A drain job handles a bounded batch and then
/// resubmits itself, so a busy subscriber cannot monopolize a worker.
///
/// The subscriber is locked for the duration of every handler call. Once it
/// has been destroyed, the values still queued are dropped instead of handed
/// to the handler. A subscriber whose last owner lets go while its handler
/// runs is destroyed on the pool thread.

#include "fwd.hpp"
#include "subscriber_id.hpp"
#include <herald/core/log.hpp>
#include <herald/core/task_pool.hpp>

#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace herald_event {

/// Handler invoked once per delivered value; returning is its completion
template<typename T>
using Handler = std::function<void(const T&)>;

/// Callbacks a queue reports to its owning bus. Invoked from pool threads,
/// never while the queue's own mutex is held.
template<typename T>
struct DeliveryCallbacks {
    /// One value finished processing (handler_failed: it threw)
    std::function<void(const DeliveryQueue<T>& queue, bool handler_failed)> completed;
    /// Values were discarded: the pool refused the drain job or the
    /// subscriber was destroyed
    std::function<void(const DeliveryQueue<T>& queue, std::size_t count)> dropped;
};

/// Unbounded FIFO of values for one subscriber
template<typename T>
class DeliveryQueue : public std::enable_shared_from_this<DeliveryQueue<T>> {
public:
    using value_ptr = std::shared_ptr<const T>;

    /// Values handled by one drain job before it yields its worker
    static constexpr std::size_t k_drain_batch = 64;

    DeliveryQueue(SubscriberId subscriber,
                  std::weak_ptr<const void> subscriber_ref,
                  Handler<T> handler,
                  std::shared_ptr<herald_core::TaskPool> pool,
                  DeliveryCallbacks<T> callbacks,
                  std::string bus_name)
        : m_subscriber(subscriber)
        , m_subscriber_ref(std::move(subscriber_ref))
        , m_handler(std::move(handler))
        , m_pool(std::move(pool))
        , m_callbacks(std::move(callbacks))
        , m_bus_name(std::move(bus_name)) {}

    DeliveryQueue(const DeliveryQueue&) = delete;
    DeliveryQueue& operator=(const DeliveryQueue&) = delete;

    /// Append a value and make sure a drain job is scheduled.
    /// On failure the pool refused the job: every queued value has been
    /// discarded and the caller owns their accounting.
    [[nodiscard]] herald_core::Result<void> push(value_ptr value) {
        {
            std::lock_guard lock(m_mutex);
            if (m_cancelled) {
                return herald_core::Ok();
            }
            m_values.push_back(std::move(value));
            if (m_scheduled) {
                return herald_core::Ok();
            }
            m_scheduled = true;
        }

        auto result = schedule();
        if (!result) {
            std::lock_guard lock(m_mutex);
            m_values.clear();
            m_scheduled = false;
        }
        return result;
    }

    /// Stop delivery. A value already handed to the handler finishes;
    /// every value still queued is discarded.
    /// @return Number of discarded values
    std::size_t cancel() {
        std::lock_guard lock(m_mutex);
        m_cancelled = true;
        std::size_t discarded = m_values.size();
        m_values.clear();
        return discarded;
    }

    [[nodiscard]] bool is_cancelled() const {
        std::lock_guard lock(m_mutex);
        return m_cancelled;
    }

    /// Values waiting for the handler (excludes one in flight)
    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(m_mutex);
        return m_values.size();
    }

    [[nodiscard]] SubscriberId subscriber() const noexcept { return m_subscriber; }

private:
    herald_core::Result<void> schedule() {
        auto self = this->shared_from_this();
        return m_pool->submit([self] { self->drain(); });
    }

    /// Body of the processing task
    void drain() {
        for (std::size_t handled = 0; handled < k_drain_batch; ++handled) {
            value_ptr next;
            {
                std::lock_guard lock(m_mutex);
                if (m_cancelled || m_values.empty()) {
                    m_scheduled = false;
                    return;
                }
                next = std::move(m_values.front());
                m_values.pop_front();
            }

            auto alive = m_subscriber_ref.lock();
            if (!alive) {
                discard_rest(1, "subscriber destroyed");
                return;
            }

            bool failed = !invoke(*next);
            alive.reset();
            if (m_callbacks.completed) {
                m_callbacks.completed(*this, failed);
            }
        }

        {
            std::lock_guard lock(m_mutex);
            if (m_cancelled || m_values.empty()) {
                m_scheduled = false;
                return;
            }
        }

        // More work: go to the back of the pool queue
        auto result = schedule();
        if (!result) {
            herald_core::event_logger()->error("[{}] subscriber {}: drain not rescheduled: {}",
                m_bus_name, m_subscriber.to_string(), result.error().message());
            discard_rest(0, "task pool refused the drain job");
        }
    }

    /// End this drain job, dropping every queued value plus `taken` values
    /// already popped from the queue
    void discard_rest(std::size_t taken, const char* reason) {
        std::size_t discarded = taken;
        {
            std::lock_guard lock(m_mutex);
            discarded += m_values.size();
            m_values.clear();
            m_scheduled = false;
        }
        herald_core::event_logger()->debug("[{}] subscriber {}: {} value(s) dropped: {}",
            m_bus_name, m_subscriber.to_string(), discarded, reason);
        if (discarded > 0 && m_callbacks.dropped) {
            m_callbacks.dropped(*this, discarded);
        }
    }

    /// Run the handler on one value
    /// @return false if the handler threw
    bool invoke(const T& value) {
        try {
            m_handler(value);
            return true;
        } catch (const std::exception& e) {
            herald_core::event_logger()->error("[{}] handler of subscriber {} threw: {}",
                m_bus_name, m_subscriber.to_string(), e.what());
            return false;
        }
    }

    const SubscriberId m_subscriber;
    const std::weak_ptr<const void> m_subscriber_ref;
    const Handler<T> m_handler;
    const std::shared_ptr<herald_core::TaskPool> m_pool;
    const DeliveryCallbacks<T> m_callbacks;
    const std::string m_bus_name;

    mutable std::mutex m_mutex;
    std::deque<value_ptr> m_values;
    bool m_scheduled = false;
    bool m_cancelled = false;
};

} // namespace herald_event
