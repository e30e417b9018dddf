/// @file main.cpp
/// @brief Ticker demo
///
/// Broadcasts price ticks to a few subscribers on the shared task pool.
/// Usage: herald_ticker [config.json]

#include <herald/core/core.hpp>
#include <herald/event/event.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

struct Tick {
    std::string symbol;
    double price = 0.0;
};

/// Prints every tick
class Display {
public:
    explicit Display(std::string name) : m_name(std::move(name)) {}

    void show(const Tick& tick) const {
        spdlog::info("[{}] {} {:.2f}", m_name, tick.symbol, tick.price);
    }

private:
    std::string m_name;
};

/// Tracks the last price per symbol
class PriceBook {
public:
    void update(const Tick& tick) {
        std::lock_guard lock(m_mutex);
        for (auto& [symbol, price] : m_prices) {
            if (symbol == tick.symbol) {
                price = tick.price;
                return;
            }
        }
        m_prices.emplace_back(tick.symbol, tick.price);
    }

    void dump() const {
        std::lock_guard lock(m_mutex);
        for (const auto& [symbol, price] : m_prices) {
            spdlog::info("  {} = {:.2f}", symbol, price);
        }
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::pair<std::string, double>> m_prices;
};

} // anonymous namespace

int main(int argc, char* argv[]) {
    herald_core::init_logging();
    spdlog::info("=== herald ticker ===");

    if (argc > 1) {
        auto config = herald_core::load_runtime_config(argv[1]);
        if (!config) {
            spdlog::error("Failed to load configuration: {}", herald_core::build_error_chain(config.error()));
            return EXIT_FAILURE;
        }
        auto applied = herald_core::apply_runtime_config(config.value());
        if (!applied) {
            spdlog::error("Failed to apply configuration: {}", applied.error().message());
            return EXIT_FAILURE;
        }
    }

    herald_event::Event<Tick> ticks(herald_event::BusConfig{"ticks"});
    herald_event::Event<void> closed(herald_event::BusConfig{"closed"});

    auto book = std::make_shared<PriceBook>();
    auto display = std::make_shared<Display>("screen");
    auto late_display = std::make_shared<Display>("late");

    ticks.subscribe(book, [raw = book.get()](const Tick& t) { raw->update(t); });
    ticks.subscribe(display, [raw = display.get()](const Tick& t) { raw->show(t); });

    std::atomic<bool> closing{false};
    closed.subscribe(book, [&closing] { closing = true; });

    ticks.fire(Tick{"ACME", 101.25});
    ticks.fire(Tick{"INIT", 12.50});
    ticks.fire_and_wait(Tick{"ACME", 101.75});

    // Subscribed late: only sees what is fired from now on
    ticks.subscribe(late_display, [raw = late_display.get()](const Tick& t) { raw->show(t); });
    ticks.fire(Tick{"INIT", 12.65});
    ticks.wait_for_pending_events();

    // Dropping the screen unsubscribes it
    display.reset();
    ticks.fire_and_wait(Tick{"ACME", 102.10});

    closed.fire_and_wait();

    spdlog::info("Closing: {}", closing.load());
    spdlog::info("Final prices:");
    book->dump();
    spdlog::info("Bus statistics:\n{}", herald_event::format_stats(ticks.stats()));

    herald_core::shutdown_logging();
    return EXIT_SUCCESS;
}
