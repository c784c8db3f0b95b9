#pragma once

#include <fmt/core.h>

#include <optional>
#include <string_view>

namespace semkit::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

/**
 * @brief Set the output pattern of the underlying logger and apply the log level named by the
 * environment (see config::default_log_level())
 */
void init_logger() noexcept;

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "silent").
 * Matching is case-insensitive. Returns nullopt for unknown names.
 */
std::optional<level> level_from_string(std::string_view s) noexcept;

std::string_view level_name(level l) noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

inline bool level_enabled(level l) noexcept { return int(l) >= int(current_log_level); }

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (level_enabled(l)) {
        auto message = fmt::format(fmt::runtime(s), args...);
        log_print(l, message);
    }
}

#define semkit_log(Level, str, ...)                                                                \
    do {                                                                                           \
        if (::semkit::log::level_enabled(::semkit::log::level::Level)) {                           \
            ::semkit::log::log(::semkit::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                                          \
    } while (0)

}  // namespace semkit::log
