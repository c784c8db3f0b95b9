#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace semkit {

/**
 * @brief Error object naming the version component that failed validation
 */
struct e_version_component {
    std::string name;
    int         value;
};

/**
 * @brief Error object carrying the identifier label that was rejected
 */
struct e_ident_label {
    std::string value;
};

/**
 * @brief Base class of all exceptions thrown by semkit
 */
class semver_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

/**
 * @brief A major, minor, or patch number is outside of the range permitted by SemVer
 */
class invalid_version_number : public semver_error {
public:
    using semver_error::semver_error;
};

/**
 * @brief An identifier label was given as a null pointer
 */
class null_ident : public semver_error {
public:
    null_ident()
        : semver_error("Identifier must not be null") {}
};

/**
 * @brief An identifier label contains characters outside of [0-9A-Za-z-]
 */
class invalid_ident : public semver_error {
    std::string _str;
    std::string _pattern;

public:
    invalid_ident(std::string s, std::string_view pattern)
        : semver_error("Identifier '" + s + "' does not match with pattern '"
                       + std::string(pattern) + "'")
        , _str(s)
        , _pattern(pattern) {}

    auto& string() const noexcept { return _str; }
    auto& pattern() const noexcept { return _pattern; }
};

/**
 * @brief A numeric prerelease identifier was written with a leading zero
 */
class leading_zero_ident : public semver_error {
    std::string _str;

public:
    explicit leading_zero_ident(std::string s)
        : semver_error("Leading zeros are not allowed for numerical identifier '" + s + "'")
        , _str(s) {}

    auto& string() const noexcept { return _str; }
};

}  // namespace semkit
