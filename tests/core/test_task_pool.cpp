// herald_core TaskPool tests

#include <catch2/catch_test_macros.hpp>
#include <herald/core/task_pool.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace herald_core;

TEST_CASE("TaskPool: creation", "[core][task_pool]") {
    SECTION("explicit worker count") {
        TaskPool pool(TaskPoolConfig{2, "test"});
        REQUIRE(pool.worker_count() == 2);
        REQUIRE(pool.name() == "test");
        REQUIRE(pool.pending_count() == 0);
        REQUIRE_FALSE(pool.is_stopped());
    }

    SECTION("zero means hardware concurrency") {
        TaskPoolConfig config;
        config.worker_count = 0;
        REQUIRE(config.resolved_worker_count() >= 1);
    }
}

TEST_CASE("TaskPool: runs submitted tasks", "[core][task_pool]") {
    TaskPool pool(TaskPoolConfig{4, "test"});
    std::atomic<int> count{0};

    for (int i = 0; i < 100; ++i) {
        auto result = pool.submit([&count] { count.fetch_add(1); });
        REQUIRE(result.is_ok());
    }

    pool.wait_all();
    REQUIRE(count.load() == 100);
    REQUIRE(pool.pending_count() == 0);
}

TEST_CASE("TaskPool: single worker keeps FIFO order", "[core][task_pool]") {
    TaskPool pool(TaskPoolConfig{1, "fifo"});
    std::vector<int> order;

    for (int i = 0; i < 20; ++i) {
        REQUIRE(pool.submit([&order, i] { order.push_back(i); }).is_ok());
    }
    pool.wait_all();

    REQUIRE(order.size() == 20);
    for (int i = 0; i < 20; ++i) {
        REQUIRE(order[i] == i);
    }
}

TEST_CASE("TaskPool: worker thread detection", "[core][task_pool]") {
    TaskPool pool(TaskPoolConfig{2, "test"});
    std::atomic<bool> on_worker{false};

    REQUIRE_FALSE(pool.is_worker_thread());
    REQUIRE(pool.submit([&] { on_worker = pool.is_worker_thread(); }).is_ok());
    pool.wait_all();
    REQUIRE(on_worker.load());
}

TEST_CASE("TaskPool: shutdown", "[core][task_pool]") {
    SECTION("submit after shutdown fails") {
        TaskPool pool(TaskPoolConfig{1, "stopping"});
        pool.shutdown();
        REQUIRE(pool.is_stopped());

        auto result = pool.submit([] {});
        REQUIRE(result.is_err());
        REQUIRE(result.error().is<TaskPoolError>());
        REQUIRE(result.error().as<TaskPoolError>()->kind == TaskPoolError::Kind::Stopped);
    }

    SECTION("destructor runs queued tasks") {
        std::atomic<int> count{0};
        {
            TaskPool pool(TaskPoolConfig{1, "draining"});
            for (int i = 0; i < 10; ++i) {
                REQUIRE(pool.submit([&count] {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    count.fetch_add(1);
                }).is_ok());
            }
        }
        REQUIRE(count.load() == 10);
    }

    SECTION("last reference released on a worker") {
        auto pool = std::make_shared<TaskPool>(TaskPoolConfig{2, "self-owned"});
        std::atomic<bool> ran{false};
        std::weak_ptr<TaskPool> weak = pool;

        REQUIRE(pool->submit([keep = pool, &ran] {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            ran = true;
        }).is_ok());
        pool.reset();

        for (int i = 0; i < 500 && !weak.expired(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        REQUIRE(ran.load());
        REQUIRE(weak.expired());
    }
}

TEST_CASE("TaskPool: default pool", "[core][task_pool]") {
    auto first = default_task_pool();
    auto second = default_task_pool();
    REQUIRE(first != nullptr);
    REQUIRE(first == second);

    SECTION("cannot be replaced while referenced") {
        auto result = configure_default_task_pool(TaskPoolConfig{1, "replacement"});
        REQUIRE(result.is_err());
        REQUIRE(result.error().as<TaskPoolError>()->kind == TaskPoolError::Kind::InUse);
    }

    SECTION("replaced once released") {
        first.reset();
        second.reset();

        auto result = configure_default_task_pool(TaskPoolConfig{2, "replacement"});
        REQUIRE(result.is_ok());

        auto pool = default_task_pool();
        REQUIRE(pool->name() == "replacement");
        REQUIRE(pool->worker_count() == 2);
    }
}
