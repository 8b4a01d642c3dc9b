#include <catch2/catch_test_macros.hpp>
#include <hikari/core/log.h>
#include <hikari/core/time.h>
#include <string>

TEST_CASE("Logging system initialization", "[core][log]") {
    SECTION("Initialize logger") {
        REQUIRE_NOTHROW(hikari::log::init());
        REQUIRE(hikari::log::get_logger() != nullptr);
        REQUIRE(hikari::log::get_logger()->name() == "hikari");
    }

    SECTION("Re-initializing keeps the same logger and updates the level") {
        hikari::log::init(spdlog::level::warn);
        auto first = hikari::log::get_logger();
        REQUIRE(first->level() == spdlog::level::warn);

        hikari::log::init(spdlog::level::debug);
        REQUIRE(hikari::log::get_logger() == first);
        REQUIRE(first->level() == spdlog::level::debug);

        hikari::log::init(spdlog::level::info);
    }

    SECTION("Log messages at different levels") {
        hikari::log::init();

        REQUIRE_NOTHROW(HIKARI_LOG_TRACE("Trace message"));
        REQUIRE_NOTHROW(HIKARI_LOG_DEBUG("Debug message"));
        REQUIRE_NOTHROW(HIKARI_LOG_INFO("Info message"));
        REQUIRE_NOTHROW(HIKARI_LOG_WARN("Warning message"));
        REQUIRE_NOTHROW(HIKARI_LOG_ERROR("Error message"));
    }
}

TEST_CASE("Logging with parameters", "[core][log]") {
    hikari::log::init();

    SECTION("Format strings work correctly") {
        int value = 42;
        std::string text = "test";

        REQUIRE_NOTHROW(HIKARI_LOG_INFO("Integer: {}", value));
        REQUIRE_NOTHROW(HIKARI_LOG_INFO("String: {}", text));
        REQUIRE_NOTHROW(HIKARI_LOG_INFO("Multiple: {} and {}", value, text));
    }
}

TEST_CASE("Level names", "[core][log]") {
    using hikari::log::parse_level;

    REQUIRE(parse_level("trace") == spdlog::level::trace);
    REQUIRE(parse_level("debug") == spdlog::level::debug);
    REQUIRE(parse_level("info") == spdlog::level::info);
    REQUIRE(parse_level("warn") == spdlog::level::warn);
    REQUIRE(parse_level("Warning") == spdlog::level::warn);
    REQUIRE(parse_level("error") == spdlog::level::err);
    REQUIRE(parse_level("CRITICAL") == spdlog::level::critical);
    REQUIRE(parse_level("off") == spdlog::level::off);
    REQUIRE(parse_level("nonsense") == spdlog::level::info);
}

TEST_CASE("Timers", "[core][time]") {
    SECTION("Stopwatch is monotonic") {
        hikari::time::Stopwatch watch;
        const double first = watch.elapsed_milliseconds();
        const double second = watch.elapsed_milliseconds();
        REQUIRE(first >= 0.0);
        REQUIRE(second >= first);

        watch.reset();
        REQUIRE(watch.elapsed_seconds() >= 0.0);
    }

    SECTION("Timestamp format") {
        const auto stamp = hikari::time::format_timestamp(hikari::time::Clock::now());
        // HH:MM:SS.mmm
        REQUIRE(stamp.size() == 12);
        REQUIRE(stamp[2] == ':');
        REQUIRE(stamp[5] == ':');
        REQUIRE(stamp[8] == '.');
    }

    SECTION("Scoped timer logs on destruction") {
        REQUIRE_NOTHROW([] { hikari::time::ScopedTimer timer("test scope"); }());
    }
}
