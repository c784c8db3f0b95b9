#pragma once

#include <semkit/build_metadata.hpp>
#include <semkit/prerelease.hpp>

#include <fmt/core.h>

#include <iosfwd>
#include <string>
#include <string_view>

namespace semkit {

/**
 * @brief A Semantic Version: major.minor.patch with optional prerelease and build metadata
 * identifiers.
 *
 * The major, minor, and patch numbers are never negative. The with*() and increment_*()
 * mutators modify the version in-place and return a reference to it, so calls may be chained:
 *
 *      auto v = semkit::version(1, 2, 3);
 *      v.increment_minor().with(semkit::prerelease("rc")).with(semkit::prerelease("1"));
 *      v.to_string();  // "1.3.0-rc.1"
 *
 * Copy the version beforehand to keep the original value.
 */
class version {
    int _major = 0;
    int _minor = 0;
    int _patch = 0;
    // Prerelease tag is optional:
    prerelease_tag _prerelease;
    // Build metadata is optional:
    build_metadata _build;

    void _reset_metadata() noexcept;

public:
    version() = default;

    /**
     * @throws invalid_version_number if any of the numbers is negative. The numbers are checked
     * in the order major, minor, patch, and the first negative one is reported.
     */
    version(int major, int minor, int patch);

    static version zero() noexcept { return version(); }
    static version of(int major, int minor, int patch) { return version(major, minor, patch); }

    /**
     * @brief Re-check the major, minor, and patch numbers. Throws the same error as the
     * constructor.
     */
    void validate() const;

    int major() const noexcept { return _major; }
    int minor() const noexcept { return _minor; }
    int patch() const noexcept { return _patch; }

    auto& prerelease_part() const noexcept { return _prerelease; }
    auto& build_part() const noexcept { return _build; }

    /// Major version zero is for initial development
    bool is_initial_development() const noexcept { return _major == 0; }
    bool is_prerelease() const noexcept { return !_prerelease.empty(); }

    /// Append an identifier to the prerelease tag
    version& with(prerelease_ident id);
    /// Append an identifier to the build metadata
    version& with(build_ident id);

    /**
     * @brief Validate `label` as a prerelease identifier and append it.
     *
     * Nothing is appended if validation fails.
     */
    version& with_release_identifier(std::string_view label);
    /// @throws null_ident if `label` is null
    version& with_release_identifier(const char* label);

    /// Replace the whole prerelease tag with the single given identifier
    version& with_new(prerelease_ident id);
    /// Replace the whole build metadata with the single given identifier
    version& with_new(build_ident id);

    /**
     * @brief Increment the major number. Minor and patch are set to zero, and all prerelease and
     * build metadata identifiers are removed.
     *
     * @throws invalid_version_number if the major number cannot be incremented without
     * overflowing. The version is unchanged in that case.
     */
    version& increment_major();
    /// As increment_major(), but only resets the patch number
    version& increment_minor();
    /// As increment_major(), but does not reset any numbers
    version& increment_patch();

    std::string to_string() const;

    friend inline std::string to_string(const version& ver) { return ver.to_string(); }
};

std::ostream& operator<<(std::ostream& out, const version& ver);

}  // namespace semkit

template <>
struct fmt::formatter<semkit::version> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const semkit::version& ver, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(ver.to_string(), ctx);
    }
};
