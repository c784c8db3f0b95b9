#include "./config.hpp"

#include <semkit/util/log.hpp>

#include <cstdlib>
#include <string_view>

using namespace semkit;

log::level config::defaults::default_log_level() noexcept {
    auto env = std::getenv("SEMKIT_LOG_LEVEL");
    if (env == nullptr) {
        return log::level::info;
    }
    auto lvl = log::level_from_string(env);
    if (!lvl) {
        semkit_log(warn, "Ignoring unknown SEMKIT_LOG_LEVEL '{}'", std::string_view(env));
        return log::level::info;
    }
    return *lvl;
}
