#include "./log.hpp"

#include <catch2/catch.hpp>

TEST_CASE("Parse log level names") {
    using semkit::log::level;
    struct case_ {
        std::string_view str;
        level            expect;
    };
    case_ cases[] = {
        {"trace", level::trace},
        {"debug", level::debug},
        {"info", level::info},
        {"warn", level::warn},
        {"error", level::error},
        {"critical", level::critical},
        {"silent", level::silent},
        {"DEBUG", level::debug},
        {"Warn", level::warn},
    };
    for (auto [str, expect] : cases) {
        INFO("Parsing log level '" << str << "'");
        auto lvl = semkit::log::level_from_string(str);
        REQUIRE(lvl.has_value());
        CHECK(*lvl == expect);
    }
    CHECK_FALSE(semkit::log::level_from_string("").has_value());
    CHECK_FALSE(semkit::log::level_from_string("verbose").has_value());
    CHECK_FALSE(semkit::log::level_from_string("warning").has_value());
}

TEST_CASE("Log level names round-trip") {
    using semkit::log::level;
    for (auto l : {level::trace, level::info, level::critical, level::silent}) {
        CHECK(semkit::log::level_from_string(semkit::log::level_name(l)) == l);
    }
}

TEST_CASE("Log level filtering") {
    auto prev = semkit::log::current_log_level;
    semkit::log::current_log_level = semkit::log::level::warn;
    CHECK_FALSE(semkit::log::level_enabled(semkit::log::level::info));
    CHECK(semkit::log::level_enabled(semkit::log::level::warn));
    CHECK(semkit::log::level_enabled(semkit::log::level::error));
    semkit_log(info, "This message is filtered out: {}", 42);
    semkit_log(warn, "Testing the logger: {} {}", "warn", 1);

    // Arguments to a disabled level are never evaluated
    int  evaluated = 0;
    auto count     = [&] { return ++evaluated; };
    semkit_log(debug, "Skipped: {}", count());
    CHECK(evaluated == 0);
    semkit_log(error, "Testing the logger: {}", count());
    CHECK(evaluated == 1);

    semkit::log::current_log_level = semkit::log::level::silent;
    CHECK_FALSE(semkit::log::level_enabled(semkit::log::level::critical));
    semkit::log::current_log_level = prev;
}
