// herald_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <herald/core/log.hpp>

using namespace herald_core;

TEST_CASE("Log level parsing", "[core][log]") {
    SECTION("known names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("unknown name") {
        REQUIRE_FALSE(parse_log_level("loud").has_value());
        REQUIRE_FALSE(parse_log_level("").has_value());
    }

    SECTION("names parse back") {
        for (auto level : {spdlog::level::trace, spdlog::level::info, spdlog::level::err,
                           spdlog::level::critical}) {
            REQUIRE(parse_log_level(log_level_name(level)) == level);
        }
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns same logger") {
        auto a = get_logger("herald_test_logger");
        auto b = get_logger("herald_test_logger");
        REQUIRE(a != nullptr);
        REQUIRE(a == b);
        REQUIRE(a->name() == "herald_test_logger");
    }

    SECTION("module loggers") {
        REQUIRE(core_logger()->name() == "herald_core");
        REQUIRE(event_logger()->name() == "herald_event");
    }

    SECTION("level management") {
        auto logger = get_logger("herald_test_levels");
        set_logger_level("herald_test_levels", spdlog::level::err);
        REQUIRE(logger->level() == spdlog::level::err);

        auto previous = get_global_log_level();
        set_global_log_level(spdlog::level::debug);
        REQUIRE(get_global_log_level() == spdlog::level::debug);
        REQUIRE(logger->level() == spdlog::level::debug);
        set_global_log_level(previous);
    }
}

TEST_CASE("LogConfig applies levels", "[core][log]") {
    auto logger = get_logger("herald_test_config");

    LogConfig config;
    config.level = spdlog::level::warn;
    configure_logging(config);
    REQUIRE(logger->level() == spdlog::level::warn);
    REQUIRE(get_global_log_level() == spdlog::level::warn);

    config.level = spdlog::level::info;
    configure_logging(config);
    REQUIRE(logger->level() == spdlog::level::info);
}

TEST_CASE("LogScope", "[core][log]") {
    REQUIRE_NOTHROW([] {
        HERALD_LOG_SCOPE("scoped block");
        HERALD_LOG_DEBUG("inside {}", "scope");
    }());

    SECTION("several scopes in one block") {
        REQUIRE_NOTHROW([] {
            HERALD_LOG_SCOPE("outer");
            HERALD_LOG_SCOPE("inner");
            HERALD_LOG_SCOPE("innermost");
        }());
    }

    flush_all_loggers();
}
