#pragma once

#include <semkit/ident.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace semkit {

/**
 * @brief An identifier in the build metadata part of a version. Leading zeros are permitted.
 */
class build_ident : public ident {
    static std::string_view _validated(std::string_view s) {
        validate(s);
        return s;
    }

public:
    explicit build_ident(std::string_view str)
        : ident(_validated(str)) {}
    explicit build_ident(const char* str)
        : build_ident(require_non_null(str)) {}
};

class build_metadata {
    std::vector<build_ident> _ids;

public:
    build_metadata() = default;

    [[nodiscard]] bool empty() const noexcept { return _ids.empty(); }

    void add_ident(build_ident id) { _ids.push_back(std::move(id)); }
    void add_ident(std::string_view s) { add_ident(build_ident(s)); }
    void add_ident(const char* s) { add_ident(build_ident(s)); }

    void clear() noexcept { _ids.clear(); }

    auto& idents() const noexcept { return _ids; }

    std::string to_string() const { return dotted_string(_ids); }

    friend bool operator==(const build_metadata&, const build_metadata&) = default;
};

/// Create a validated build metadata identifier
inline build_ident build(std::string_view label) { return build_ident(label); }
inline build_ident build(const char* label) { return build_ident(label); }

}  // namespace semkit
