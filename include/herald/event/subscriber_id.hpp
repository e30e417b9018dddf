#pragma once

/// @file subscriber_id.hpp
/// @brief Identity token for subscriber objects

#include "fwd.hpp"

#include <compare>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>

namespace herald_event {

// =============================================================================
// SubscriberId
// =============================================================================

/// Identity of a subscriber object, derived from its address.
/// Stable for the lifetime of the object and never keeps it alive.
/// Polymorphic objects are identified by their most-derived address, so a
/// subscriber seen through different base classes has a single identity.
struct SubscriberId {
    std::uintptr_t value = 0;

    constexpr SubscriberId() = default;
    constexpr explicit SubscriberId(std::uintptr_t v) : value(v) {}

    /// Identity of an object
    template<typename S>
    [[nodiscard]] static SubscriberId of(const S& subscriber) noexcept {
        return SubscriberId(reinterpret_cast<std::uintptr_t>(most_derived(std::addressof(subscriber))));
    }

    /// Identity of the object a shared_ptr points to (null for an empty pointer)
    template<typename S>
    [[nodiscard]] static SubscriberId of(const std::shared_ptr<S>& subscriber) noexcept {
        if (!subscriber) {
            return SubscriberId{};
        }
        return of(*subscriber);
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0; }

    /// Hex representation for logs
    [[nodiscard]] std::string to_string() const;

    constexpr auto operator<=>(const SubscriberId&) const noexcept = default;
    constexpr bool operator==(const SubscriberId&) const noexcept = default;

private:
    template<typename S>
    static const void* most_derived(const S* p) noexcept {
        if constexpr (std::is_polymorphic_v<S>) {
            return dynamic_cast<const void*>(p);
        } else {
            return static_cast<const void*>(p);
        }
    }
};

} // namespace herald_event

template<>
struct std::hash<herald_event::SubscriberId> {
    std::size_t operator()(const herald_event::SubscriberId& id) const noexcept {
        return std::hash<std::uintptr_t>{}(id.value);
    }
};
