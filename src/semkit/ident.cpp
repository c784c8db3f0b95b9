#include "./ident.hpp"

#include <semkit/error/errors.hpp>
#include <semkit/util/log.hpp>

#include <boost/leaf/exception.hpp>

#include <algorithm>

using namespace semkit;

bool semkit::is_ident_char(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '-';
}

bool semkit::is_all_digits(std::string_view s) noexcept {
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

std::string_view ident::require_non_null(const char* str) {
    if (str == nullptr) {
        semkit_log(debug, "Rejecting null identifier label");
        BOOST_LEAF_THROW_EXCEPTION(null_ident());
    }
    return str;
}

void ident::validate(std::string_view label) {
    auto bad = std::find_if_not(label.begin(), label.end(), is_ident_char);
    if (bad != label.end()) {
        semkit_log(debug,
                   "Rejecting identifier '{}': invalid character '{}' at offset {}",
                   label,
                   *bad,
                   bad - label.begin());
        BOOST_LEAF_THROW_EXCEPTION(invalid_ident(std::string(label), pattern),
                                   e_ident_label{std::string(label)});
    }
}

void ident::validate(const char* label) { validate(require_non_null(label)); }

bool ident::is_numeric() const noexcept { return is_all_digits(_str); }
