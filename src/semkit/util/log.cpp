#include "./log.hpp"

#include <semkit/config.hpp>

#include <neo/assert.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <string>

using namespace semkit;

void log::init_logger() noexcept {
    spdlog::set_pattern("[%^%-5l%$] %v");
    current_log_level = config::default_log_level();
}

void log::log_print(log::level l, std::string_view msg) noexcept {
    static auto logger_inst = [] {
        auto logger = spdlog::default_logger_raw();
        logger->set_level(spdlog::level::trace);
        return logger;
    }();

    const auto lvl = [&] {
        switch (l) {
        case level::trace:
            return spdlog::level::trace;
        case level::debug:
            return spdlog::level::debug;
        case level::info:
            return spdlog::level::info;
        case level::warn:
            return spdlog::level::warn;
        case level::error:
            return spdlog::level::err;
        case level::critical:
            return spdlog::level::critical;
        case level::silent:
            return spdlog::level::off;
        }
        neo_assert_always(invariant, false, "Invalid log level", msg, int(l));
    }();

    logger_inst->log(lvl, "{}", msg);
}

std::optional<log::level> log::level_from_string(std::string_view s) noexcept {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (auto l : {level::trace,
                   level::debug,
                   level::info,
                   level::warn,
                   level::error,
                   level::critical,
                   level::silent}) {
        if (lower == level_name(l)) {
            return l;
        }
    }
    return std::nullopt;
}

std::string_view log::level_name(log::level l) noexcept {
    switch (l) {
    case level::trace:
        return "trace";
    case level::debug:
        return "debug";
    case level::info:
        return "info";
    case level::warn:
        return "warn";
    case level::error:
        return "error";
    case level::critical:
        return "critical";
    case level::silent:
        return "silent";
    }
    neo_assert_always(invariant, false, "Invalid log level", int(l));
}
