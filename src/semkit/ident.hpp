#pragma once

#include <string>
#include <string_view>

namespace semkit {

/**
 * @brief Base of the prerelease and build metadata identifiers.
 *
 * An identifier is a label drawn from [0-9A-Za-z-]. Instances are only created through
 * the derived types, which validate their label before storing it. Once created, an identifier
 * does not change.
 */
class ident {
    std::string _str;

protected:
    explicit ident(std::string_view str)
        : _str(str) {}

    /// Throws null_ident if `str` is null
    static std::string_view require_non_null(const char* str);

public:
    /// The character grammar shared by all identifiers
    static constexpr std::string_view pattern = "^[0-9A-Za-z-]*$";

    /**
     * @brief Check that `label` fully matches `pattern`. The empty string is accepted.
     *
     * @throws invalid_ident if any character is outside of the grammar
     */
    static void validate(std::string_view label);

    /// @throws null_ident if `label` is null, then as validate(std::string_view)
    static void validate(const char* label);

    const std::string& string() const noexcept { return _str; }

    /// Whether the label is made only of ASCII digits (an empty label counts as numeric)
    [[nodiscard]] bool is_numeric() const noexcept;

    friend bool operator==(const ident&, const ident&) = default;
};

[[nodiscard]] bool is_ident_char(char c) noexcept;
[[nodiscard]] bool is_all_digits(std::string_view s) noexcept;

/**
 * @brief Join the labels of a sequence of identifiers with '.'
 */
template <typename Idents>
std::string dotted_string(const Idents& ids) {
    std::string acc;
    auto        it   = ids.cbegin();
    auto        stop = ids.cend();
    while (it != stop) {
        acc += it->string();
        ++it;
        if (it != stop) {
            acc += ".";
        }
    }
    return acc;
}

}  // namespace semkit
