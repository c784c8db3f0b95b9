#include "./config.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <string>
#include <utility>

namespace {

struct scoped_env {
    std::string name;

    scoped_env(std::string n, const char* value)
        : name(std::move(n)) {
        ::setenv(name.data(), value, 1);
    }
    ~scoped_env() { ::unsetenv(name.data()); }
};

}  // namespace

TEST_CASE("Default log level from the environment") {
    using semkit::log::level;
    ::unsetenv("SEMKIT_LOG_LEVEL");
    CHECK(semkit::config::default_log_level() == level::info);
    {
        scoped_env var{"SEMKIT_LOG_LEVEL", "trace"};
        CHECK(semkit::config::default_log_level() == level::trace);
    }
    {
        scoped_env var{"SEMKIT_LOG_LEVEL", "Silent"};
        CHECK(semkit::config::default_log_level() == level::silent);
    }
    {
        scoped_env var{"SEMKIT_LOG_LEVEL", "loud"};
        CHECK(semkit::config::default_log_level() == level::info);
    }
}

TEST_CASE("Initialize the logger") {
    auto prev = semkit::log::current_log_level;
    {
        scoped_env var{"SEMKIT_LOG_LEVEL", "error"};
        semkit::log::init_logger();
        CHECK(semkit::log::current_log_level == semkit::log::level::error);
    }
    semkit::log::current_log_level = prev;
}
