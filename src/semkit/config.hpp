#pragma once

#include <semkit/util/log.hpp>

namespace semkit::config {

namespace defaults {

/**
 * @brief The log level used by log::init_logger(). Taken from the SEMKIT_LOG_LEVEL environment
 * variable if it names a valid level, otherwise log::level::info.
 */
log::level default_log_level() noexcept;

}  // namespace defaults

using namespace defaults;

}  // namespace semkit::config
