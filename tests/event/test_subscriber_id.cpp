/// @file test_subscriber_id.cpp
/// @brief Tests for SubscriberId and PendingCounter

#include <catch2/catch_test_macros.hpp>
#include <herald/event/subscriber_id.hpp>
#include <herald/event/pending_counter.hpp>
#include <memory>
#include <unordered_set>

using namespace herald_event;

namespace {

struct Plain {
    int value = 0;
};

struct Named {
    virtual ~Named() = default;
    int name = 1;
};

struct Sized {
    virtual ~Sized() = default;
    int size = 2;
};

struct Widget : Named, Sized {
    int extra = 3;
};

} // anonymous namespace

TEST_CASE("SubscriberId: identity", "[event][id]") {
    SECTION("default is invalid") {
        SubscriberId id;
        REQUIRE_FALSE(id.is_valid());
        REQUIRE(id == SubscriberId{});
    }

    SECTION("same object, same id") {
        Plain p;
        REQUIRE(SubscriberId::of(p) == SubscriberId::of(p));
        REQUIRE(SubscriberId::of(p).is_valid());
    }

    SECTION("different objects, different ids") {
        Plain a;
        Plain b;
        REQUIRE(SubscriberId::of(a) != SubscriberId::of(b));
    }

    SECTION("shared_ptr and reference agree") {
        auto p = std::make_shared<Plain>();
        REQUIRE(SubscriberId::of(p) == SubscriberId::of(*p));
    }

    SECTION("empty shared_ptr gives the null id") {
        std::shared_ptr<Plain> none;
        REQUIRE_FALSE(SubscriberId::of(none).is_valid());
    }

    SECTION("polymorphic object seen through different bases") {
        auto w = std::make_shared<Widget>();
        const Named& as_named = *w;
        const Sized& as_sized = *w;
        REQUIRE(SubscriberId::of(as_named) == SubscriberId::of(*w));
        REQUIRE(SubscriberId::of(as_sized) == SubscriberId::of(*w));

        std::shared_ptr<Sized> base = w;
        REQUIRE(SubscriberId::of(base) == SubscriberId::of(w));
    }

    SECTION("hashable") {
        Plain a;
        Plain b;
        std::unordered_set<SubscriberId> ids{SubscriberId::of(a), SubscriberId::of(b), SubscriberId::of(a)};
        REQUIRE(ids.size() == 2);
    }

    SECTION("hex text") {
        SubscriberId id(0x2a);
        REQUIRE(id.to_string() == "0x2a");
    }
}

TEST_CASE("PendingCounter", "[event][pending]") {
    PendingCounter counter;
    REQUIRE(counter.is_zero());

    SECTION("increment and decrement") {
        counter.increment();
        counter.increment();
        REQUIRE(counter.count() == 2);
        REQUIRE_FALSE(counter.decrement());
        REQUIRE(counter.decrement());
        REQUIRE(counter.is_zero());
    }

    SECTION("decrement saturates at zero") {
        REQUIRE(counter.decrement());
        REQUIRE(counter.count() == 0);
    }

    SECTION("reset returns previous count") {
        counter.increment();
        counter.increment();
        counter.increment();
        REQUIRE(counter.reset() == 3);
        REQUIRE(counter.is_zero());
    }
}
