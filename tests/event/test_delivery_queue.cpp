/// @file test_delivery_queue.cpp
/// @brief Tests for DeliveryQueue

#include <catch2/catch_test_macros.hpp>
#include <herald/event/delivery_queue.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace herald_event;
using herald_core::TaskPool;
using herald_core::TaskPoolConfig;

namespace {

/// Collects callback reports from a queue
struct Reports {
    std::atomic<int> completed{0};
    std::atomic<int> failed{0};
    std::atomic<int> dropped{0};

    DeliveryCallbacks<int> callbacks() {
        DeliveryCallbacks<int> cb;
        cb.completed = [this](const DeliveryQueue<int>&, bool handler_failed) {
            completed.fetch_add(1);
            if (handler_failed) {
                failed.fetch_add(1);
            }
        };
        cb.dropped = [this](const DeliveryQueue<int>&, std::size_t count) {
            dropped.fetch_add(static_cast<int>(count));
        };
        return cb;
    }
};

std::shared_ptr<const int> value(int v) {
    return std::make_shared<const int>(v);
}

} // anonymous namespace

TEST_CASE("DeliveryQueue: delivers in order", "[event][queue]") {
    Reports reports;
    auto owner = std::make_shared<int>(0);
    std::mutex mutex;
    std::vector<int> seen;
    auto pool = std::make_shared<TaskPool>(TaskPoolConfig{4, "queue-test"});

    auto queue = std::make_shared<DeliveryQueue<int>>(
        SubscriberId(1), owner,
        [&](const int& v) {
            std::lock_guard lock(mutex);
            seen.push_back(v);
        },
        pool, reports.callbacks(), "test");

    // More than one drain batch
    const int count = static_cast<int>(DeliveryQueue<int>::k_drain_batch) * 3 + 7;
    for (int i = 0; i < count; ++i) {
        REQUIRE(queue->push(value(i)).is_ok());
    }
    pool->wait_all();

    REQUIRE(reports.completed.load() == count);
    REQUIRE(reports.failed.load() == 0);
    REQUIRE(queue->size() == 0);

    std::lock_guard lock(mutex);
    REQUIRE(seen.size() == static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        REQUIRE(seen[i] == i);
    }
}

TEST_CASE("DeliveryQueue: handler runs one value at a time", "[event][queue]") {
    Reports reports;
    auto owner = std::make_shared<int>(0);
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
    auto pool = std::make_shared<TaskPool>(TaskPoolConfig{4, "queue-test"});

    auto queue = std::make_shared<DeliveryQueue<int>>(
        SubscriberId(1), owner,
        [&](const int&) {
            int now = active.fetch_add(1) + 1;
            int prev = max_active.load();
            while (now > prev && !max_active.compare_exchange_weak(prev, now)) {}
            std::this_thread::yield();
            active.fetch_sub(1);
        },
        pool, reports.callbacks(), "test");

    for (int i = 0; i < 200; ++i) {
        REQUIRE(queue->push(value(i)).is_ok());
    }
    pool->wait_all();

    REQUIRE(max_active.load() == 1);
    REQUIRE(reports.completed.load() == 200);
}

TEST_CASE("DeliveryQueue: handler exception", "[event][queue]") {
    Reports reports;
    auto owner = std::make_shared<int>(0);
    std::atomic<int> handled{0};
    auto pool = std::make_shared<TaskPool>(TaskPoolConfig{1, "queue-test"});

    auto queue = std::make_shared<DeliveryQueue<int>>(
        SubscriberId(1), owner,
        [&](const int& v) {
            if (v == 2) {
                throw std::runtime_error("bad value");
            }
            handled.fetch_add(1);
        },
        pool, reports.callbacks(), "test");

    for (int i = 1; i <= 4; ++i) {
        REQUIRE(queue->push(value(i)).is_ok());
    }
    pool->wait_all();

    REQUIRE(handled.load() == 3);
    REQUIRE(reports.completed.load() == 4);
    REQUIRE(reports.failed.load() == 1);
}

TEST_CASE("DeliveryQueue: cancel", "[event][queue]") {
    Reports reports;
    auto owner = std::make_shared<int>(0);
    std::promise<void> started;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    std::atomic<int> handled{0};
    auto pool = std::make_shared<TaskPool>(TaskPoolConfig{2, "queue-test"});

    auto queue = std::make_shared<DeliveryQueue<int>>(
        SubscriberId(1), owner,
        [&](const int& v) {
            if (v == 0) {
                started.set_value();
                release_future.wait();
            }
            handled.fetch_add(1);
        },
        pool, reports.callbacks(), "test");

    for (int i = 0; i < 5; ++i) {
        REQUIRE(queue->push(value(i)).is_ok());
    }
    started.get_future().wait();

    SECTION("discards queued values, in-flight value finishes") {
        REQUIRE(queue->cancel() == 4);
        REQUIRE(queue->is_cancelled());

        release.set_value();
        pool->wait_all();
        REQUIRE(handled.load() == 1);
        REQUIRE(reports.completed.load() == 1);
    }

    SECTION("push after cancel is ignored") {
        queue->cancel();
        REQUIRE(queue->push(value(99)).is_ok());
        REQUIRE(queue->size() == 0);

        release.set_value();
        pool->wait_all();
        REQUIRE(handled.load() == 1);
    }
}

TEST_CASE("DeliveryQueue: stopped pool", "[event][queue]") {
    Reports reports;
    auto owner = std::make_shared<int>(0);
    std::atomic<int> handled{0};
    auto pool = std::make_shared<TaskPool>(TaskPoolConfig{1, "stopped"});
    pool->shutdown();

    auto queue = std::make_shared<DeliveryQueue<int>>(
        SubscriberId(1), owner,
        [&](const int&) { handled.fetch_add(1); },
        pool, reports.callbacks(), "test");

    auto result = queue->push(value(1));
    REQUIRE(result.is_err());
    REQUIRE(result.error().is<herald_core::TaskPoolError>());
    REQUIRE(queue->size() == 0);
    REQUIRE(handled.load() == 0);
}

TEST_CASE("DeliveryQueue: subscriber destroyed", "[event][queue]") {
    Reports reports;
    auto owner = std::make_shared<int>(0);
    std::weak_ptr<int> watch = owner;
    std::promise<void> started;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    std::atomic<int> handled{0};
    std::atomic<bool> alive_during_handler{true};
    auto pool = std::make_shared<TaskPool>(TaskPoolConfig{2, "queue-test"});

    auto queue = std::make_shared<DeliveryQueue<int>>(
        SubscriberId(1), owner,
        [&](const int& v) {
            if (v == 0) {
                started.set_value();
                release_future.wait();
                alive_during_handler = !watch.expired();
            }
            handled.fetch_add(1);
        },
        pool, reports.callbacks(), "test");

    for (int i = 0; i < 5; ++i) {
        REQUIRE(queue->push(value(i)).is_ok());
    }
    started.get_future().wait();

    owner.reset();
    release.set_value();
    pool->wait_all();

    // The running handler kept its subscriber alive; the rest were dropped
    REQUIRE(alive_during_handler.load());
    REQUIRE(watch.expired());
    REQUIRE(handled.load() == 1);
    REQUIRE(reports.completed.load() == 1);
    REQUIRE(reports.dropped.load() == 4);
    REQUIRE(queue->size() == 0);

    SECTION("later pushes are dropped too") {
        REQUIRE(queue->push(value(5)).is_ok());
        pool->wait_all();
        REQUIRE(handled.load() == 1);
        REQUIRE(reports.dropped.load() == 5);
    }
}
