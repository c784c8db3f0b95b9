#pragma once

#include <semkit/ident.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace semkit {

/**
 * @brief An identifier in the prerelease part of a version.
 *
 * In addition to the common identifier grammar, a numeric prerelease identifier may not begin
 * with a zero unless it is exactly "0".
 */
class prerelease_ident : public ident {
    static std::string_view _validated(std::string_view s) {
        validate(s);
        return s;
    }

public:
    explicit prerelease_ident(std::string_view str)
        : ident(_validated(str)) {}
    explicit prerelease_ident(const char* str)
        : prerelease_ident(require_non_null(str)) {}

    /**
     * @throws invalid_ident if the label does not match the identifier pattern
     * @throws leading_zero_ident if the label is numeric and has a leading zero
     */
    static void validate(std::string_view label);
    static void validate(const char* label) { validate(require_non_null(label)); }
};

/**
 * @brief The ordered prerelease identifiers of a version
 */
class prerelease_tag {
    std::vector<prerelease_ident> _ids;

public:
    prerelease_tag() = default;

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    void add_ident(prerelease_ident id) { _ids.push_back(std::move(id)); }
    void add_ident(std::string_view s) { add_ident(prerelease_ident(s)); }
    void add_ident(const char* s) { add_ident(prerelease_ident(s)); }

    void clear() noexcept { _ids.clear(); }

    auto& idents() const noexcept { return _ids; }

    std::string to_string() const { return dotted_string(_ids); }

    friend bool operator==(const prerelease_tag&, const prerelease_tag&) = default;
};

/// Create a validated prerelease identifier
inline prerelease_ident prerelease(std::string_view label) { return prerelease_ident(label); }
inline prerelease_ident prerelease(const char* label) { return prerelease_ident(label); }

}  // namespace semkit
