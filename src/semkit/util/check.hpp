#pragma once

#include <semkit/error/errors.hpp>

#include <boost/leaf/exception.hpp>

#include <string_view>
#include <utility>

namespace semkit {

/**
 * @brief Throw an invalid_version_number with the result of `message()` unless `pred(value)`
 * holds.
 */
template <typename T, typename Pred, typename Message>
void must_pass(const T& value, Pred&& pred, Message&& message) {
    if (!pred(value)) {
        BOOST_LEAF_THROW_EXCEPTION(invalid_version_number(std::string(message())));
    }
}

/**
 * @brief Require that the named version component is zero or greater.
 *
 * The thrown error carries an e_version_component.
 */
void must_not_be_negative(std::string_view component, int value);

}  // namespace semkit
