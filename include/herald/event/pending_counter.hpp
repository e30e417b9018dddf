#pragma once

/// @file pending_counter.hpp
/// @brief Count of a subscriber's enqueued-but-unprocessed values

#include "fwd.hpp"

#include <cstddef>

namespace herald_event {

/// Pending delivery count for one subscription.
/// Not synchronized: owned by the registry and only touched under the bus mutex.
class PendingCounter {
public:
    PendingCounter() = default;

    /// One value was enqueued
    void increment() noexcept { ++m_count; }

    /// One value finished processing. Saturates at zero.
    /// @return true if the counter is zero afterwards
    bool decrement() noexcept {
        if (m_count > 0) {
            --m_count;
        }
        return m_count == 0;
    }

    /// Drop every outstanding value at once
    /// @return Count before the reset
    std::size_t reset() noexcept {
        std::size_t previous = m_count;
        m_count = 0;
        return previous;
    }

    [[nodiscard]] std::size_t count() const noexcept { return m_count; }
    [[nodiscard]] bool is_zero() const noexcept { return m_count == 0; }

private:
    std::size_t m_count = 0;
};

} // namespace herald_event
