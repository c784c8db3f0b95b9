#include "./prerelease.hpp"

#include <semkit/error/errors.hpp>
#include <semkit/util/log.hpp>

#include <boost/leaf/exception.hpp>

using namespace semkit;

void prerelease_ident::validate(std::string_view label) {
    ident::validate(label);
    if (label.size() > 1 && label[0] == '0' && is_all_digits(label)) {
        semkit_log(debug, "Rejecting numeric prerelease identifier '{}' with leading zero", label);
        BOOST_LEAF_THROW_EXCEPTION(leading_zero_ident(std::string(label)),
                                   e_ident_label{std::string(label)});
    }
}
