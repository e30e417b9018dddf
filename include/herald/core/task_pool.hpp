#pragma once

/// @file task_pool.hpp
/// @brief Shared worker pool that runs subscriber processing tasks
///
/// A fixed set of worker threads pulls jobs from one FIFO deque. Jobs are
/// short: a delivery queue submits one job to drain a bounded batch of its
/// values and resubmits itself while work remains, so many subscribers share
/// a few threads without a thread per subscriber.

#include "fwd.hpp"
#include "error.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace herald_core {

// =============================================================================
// TaskPoolConfig
// =============================================================================

/// Configuration for a task pool
struct TaskPoolConfig {
    /// Number of worker threads (0 = hardware concurrency, at least 1)
    std::size_t worker_count = 0;
    /// Name used in log output and errors
    std::string name = "herald";

    /// Worker count after resolving the 0 default
    [[nodiscard]] std::size_t resolved_worker_count() const;
};

// =============================================================================
// TaskPool
// =============================================================================

/// Thread pool for subscriber processing tasks
class TaskPool {
public:
    using Task = std::function<void()>;

    /// Create pool and start its workers
    explicit TaskPool(TaskPoolConfig config = {});

    /// Destructor - runs every task already queued, then joins the workers.
    /// Released from one of its own workers, that worker is detached and
    /// exits on its own once the queue is empty.
    ~TaskPool();

    // Non-copyable, non-movable
    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;
    TaskPool(TaskPool&&) = delete;
    TaskPool& operator=(TaskPool&&) = delete;

    /// Submit a task for execution
    /// @return TaskPoolError::stopped once shutdown() has been called
    [[nodiscard]] Result<void> submit(Task task);

    /// Number of tasks queued or running
    [[nodiscard]] std::size_t pending_count() const;

    /// Number of worker threads
    [[nodiscard]] std::size_t worker_count() const noexcept { return m_threads.size(); }

    /// Pool name
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    /// Block until no task is queued or running
    /// @warning Deadlocks when called from one of this pool's workers
    void wait_all();

    /// Stop accepting tasks; queued tasks still run
    void shutdown();

    /// Check if the pool stopped accepting tasks
    [[nodiscard]] bool is_stopped() const noexcept { return m_shared->stop.load(); }

    /// Check if the calling thread is one of this pool's workers
    [[nodiscard]] bool is_worker_thread() const;

private:
    /// State shared with the workers, so a detached worker never touches the pool
    struct Shared {
        std::deque<Task> tasks;
        std::mutex mutex;
        std::condition_variable condition;
        std::condition_variable done_condition;
        std::atomic<bool> stop{false};
        std::atomic<std::size_t> pending{0};
    };

    static void worker_thread(std::shared_ptr<Shared> shared);

    std::string m_name;
    std::shared_ptr<Shared> m_shared;
    std::vector<std::thread> m_threads;
};

// =============================================================================
// Default Pool
// =============================================================================

/// Process-wide pool shared by every bus built without an explicit pool.
/// Created on first use from the configuration set by configure_default_task_pool().
[[nodiscard]] std::shared_ptr<TaskPool> default_task_pool();

/// Set the configuration of the default pool.
/// Replaces an existing default pool only if nothing else references it.
/// @return TaskPoolError::in_use if a bus still holds the current default pool
[[nodiscard]] Result<void> configure_default_task_pool(TaskPoolConfig config);

} // namespace herald_core
