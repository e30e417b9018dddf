/// @file task_pool.cpp
/// @brief TaskPool implementation and the process-wide default pool

#include <herald/core/task_pool.hpp>
#include <herald/core/log.hpp>

#include <algorithm>
#include <utility>

namespace herald_core {

// =============================================================================
// TaskPoolConfig
// =============================================================================

std::size_t TaskPoolConfig::resolved_worker_count() const {
    if (worker_count != 0) {
        return worker_count;
    }
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

// =============================================================================
// TaskPool
// =============================================================================

TaskPool::TaskPool(TaskPoolConfig config)
    : m_name(std::move(config.name))
    , m_shared(std::make_shared<Shared>()) {
    const std::size_t count = config.resolved_worker_count();
    m_threads.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        m_threads.emplace_back(&TaskPool::worker_thread, m_shared);
    }
    core_logger()->debug("Task pool '{}' started with {} worker(s)", m_name, count);
}

TaskPool::~TaskPool() {
    shutdown();

    const auto self = std::this_thread::get_id();
    for (auto& thread : m_threads) {
        if (thread.get_id() == self) {
            thread.detach();
        } else if (thread.joinable()) {
            thread.join();
        }
    }
    core_logger()->debug("Task pool '{}' stopped", m_name);
}

Result<void> TaskPool::submit(Task task) {
    {
        std::lock_guard lock(m_shared->mutex);
        if (m_shared->stop) {
            return Err(TaskPoolError::stopped(m_name));
        }
        m_shared->tasks.push_back(std::move(task));
        ++m_shared->pending;
    }
    m_shared->condition.notify_one();
    return Ok();
}

std::size_t TaskPool::pending_count() const {
    return m_shared->pending.load();
}

void TaskPool::wait_all() {
    std::unique_lock lock(m_shared->mutex);
    m_shared->done_condition.wait(lock, [this] {
        return m_shared->pending == 0;
    });
}

void TaskPool::shutdown() {
    {
        std::lock_guard lock(m_shared->mutex);
        m_shared->stop = true;
    }
    m_shared->condition.notify_all();
}

bool TaskPool::is_worker_thread() const {
    const auto self = std::this_thread::get_id();
    return std::any_of(m_threads.begin(), m_threads.end(),
        [self](const std::thread& t) { return t.get_id() == self; });
}

void TaskPool::worker_thread(std::shared_ptr<Shared> shared) {
    while (true) {
        Task task;
        {
            std::unique_lock lock(shared->mutex);
            shared->condition.wait(lock, [&shared] {
                return shared->stop || !shared->tasks.empty();
            });

            if (shared->stop && shared->tasks.empty()) {
                return;
            }

            task = std::move(shared->tasks.front());
            shared->tasks.pop_front();
        }

        task();
        // Captures may hold the last reference to the pool itself
        task = nullptr;

        {
            // Decrement under the lock so wait_all() cannot miss the wakeup
            std::lock_guard lock(shared->mutex);
            --shared->pending;
        }
        shared->done_condition.notify_all();
    }
}

// =============================================================================
// Default Pool
// =============================================================================

namespace {

struct DefaultPoolState {
    std::mutex mutex;
    TaskPoolConfig config;
    std::shared_ptr<TaskPool> pool;
};

DefaultPoolState& default_pool_state() {
    // The pool and the drain jobs it still runs at exit log through these,
    // so they must be constructed first and therefore destroyed last
    static const auto loggers = std::make_pair(core_logger(), event_logger());
    static DefaultPoolState state;
    return state;
}

} // anonymous namespace

std::shared_ptr<TaskPool> default_task_pool() {
    auto& state = default_pool_state();
    std::lock_guard lock(state.mutex);
    if (!state.pool) {
        state.pool = std::make_shared<TaskPool>(state.config);
    }
    return state.pool;
}

Result<void> configure_default_task_pool(TaskPoolConfig config) {
    auto& state = default_pool_state();
    std::shared_ptr<TaskPool> retired;
    {
        std::lock_guard lock(state.mutex);
        if (state.pool) {
            if (state.pool.use_count() > 1) {
                return Err(TaskPoolError::in_use(state.pool->name()));
            }
            retired = std::move(state.pool);
        }
        state.config = std::move(config);
    }
    // Joined outside the lock
    retired.reset();
    return Ok();
}

} // namespace herald_core
