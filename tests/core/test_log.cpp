// strata_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <strata/core/log.hpp>

using namespace strata_core;

TEST_CASE("parse_log_level", "[core][log]") {
    SECTION("known names") {
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("info") == spdlog::level::info);
        REQUIRE(parse_log_level("warn") == spdlog::level::warn);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
    }

    SECTION("aliases") {
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    }

    SECTION("unknown") {
        REQUIRE_FALSE(parse_log_level("verbose").has_value());
        REQUIRE_FALSE(parse_log_level("").has_value());
    }
}

TEST_CASE("log_level_name", "[core][log]") {
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
    REQUIRE(std::string(log_level_name(spdlog::level::warn)) == "warn");
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns same logger") {
        auto a = get_logger("strata_test");
        auto b = get_logger("strata_test");
        REQUIRE(a == b);
        REQUIRE(a->name() == "strata_test");
    }

    SECTION("layer loggers") {
        REQUIRE(model_logger()->name() == "strata_model");
        REQUIRE(ops_logger()->name() == "strata_ops");
        REQUIRE(tx_logger()->name() == "strata_tx");
        REQUIRE(bridge_logger()->name() == "strata_bridge");
    }

    SECTION("per-logger level") {
        auto logger = get_logger("strata_level_test");
        set_logger_level("strata_level_test", spdlog::level::critical);
        REQUIRE(logger->level() == spdlog::level::critical);
    }
}

TEST_CASE("Global log level", "[core][log]") {
    auto previous = get_global_log_level();

    set_global_log_level(spdlog::level::err);
    REQUIRE(get_global_log_level() == spdlog::level::err);
    REQUIRE(tx_logger()->level() == spdlog::level::err);

    set_global_log_level(previous);
    REQUIRE(get_global_log_level() == previous);
}

TEST_CASE("Structured logging and scopes do not throw", "[core][log]") {
    REQUIRE_NOTHROW(log_structured(spdlog::level::debug, "strata_test", "event",
        {{"batch", "b"}, {"failed", "0"}}));

    REQUIRE_NOTHROW([] {
        LogScope scope("test scope", "strata_test");
    }());
}
