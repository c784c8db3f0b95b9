#pragma once

#include <neo/pp.hpp>

#include <boost/leaf/on_error.hpp>

/// Wrap an expression in a lambda for Boost.LEAF's error-loading APIs
#define SEMKIT_E_ARG(...) ([&] { return __VA_ARGS__; })

/**
 * @brief Attach the given error object to any semkit exception that propagates out of the
 * enclosing scope
 */
#define SEMKIT_E_SCOPE(...)                                                                        \
    auto NEO_CONCAT(_err_info_, __LINE__) = boost::leaf::on_error(SEMKIT_E_ARG(__VA_ARGS__))
