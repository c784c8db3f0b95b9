#include "./version.hpp"

#include <semkit/error/errors.hpp>
#include <semkit/util/check.hpp>
#include <semkit/util/log.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/format.h>

#include <limits>
#include <ostream>

using namespace semkit;

namespace {

void check_can_increment(std::string_view component, int value) {
    if (value == std::numeric_limits<int>::max()) {
        semkit_log(debug, "Rejecting increment of {} version number {}", component, value);
        BOOST_LEAF_THROW_EXCEPTION(
            invalid_version_number(
                fmt::format("Version {} number {} cannot be incremented", component, value)),
            e_version_component{std::string(component), value});
    }
}

}  // namespace

version::version(int major, int minor, int patch)
    : _major(major)
    , _minor(minor)
    , _patch(patch) {
    validate();
}

void version::validate() const {
    must_not_be_negative("major", _major);
    must_not_be_negative("minor", _minor);
    must_not_be_negative("patch", _patch);
}

void version::_reset_metadata() noexcept {
    if (!_prerelease.empty() || !_build.empty()) {
        semkit_log(trace,
                   "Dropping identifiers '{}' and '{}' from version {}.{}.{}",
                   _prerelease.to_string(),
                   _build.to_string(),
                   _major,
                   _minor,
                   _patch);
    }
    _prerelease.clear();
    _build.clear();
}

version& version::with(prerelease_ident id) {
    _prerelease.add_ident(std::move(id));
    return *this;
}

version& version::with(build_ident id) {
    _build.add_ident(std::move(id));
    return *this;
}

version& version::with_release_identifier(std::string_view label) {
    return with(prerelease_ident(label));
}

version& version::with_release_identifier(const char* label) {
    return with(prerelease_ident(label));
}

version& version::with_new(prerelease_ident id) {
    if (!_prerelease.empty()) {
        _prerelease.clear();
    }
    return with(std::move(id));
}

version& version::with_new(build_ident id) {
    if (!_build.empty()) {
        _build.clear();
    }
    return with(std::move(id));
}

version& version::increment_major() {
    check_can_increment("major", _major);
    _reset_metadata();
    ++_major;
    _minor = 0;
    _patch = 0;
    semkit_log(trace, "Incremented major version to {}", *this);
    return *this;
}

version& version::increment_minor() {
    check_can_increment("minor", _minor);
    _reset_metadata();
    ++_minor;
    _patch = 0;
    semkit_log(trace, "Incremented minor version to {}", *this);
    return *this;
}

version& version::increment_patch() {
    check_can_increment("patch", _patch);
    _reset_metadata();
    ++_patch;
    semkit_log(trace, "Incremented patch version to {}", *this);
    return *this;
}

std::string version::to_string() const {
    auto ret = fmt::format("{}.{}.{}", _major, _minor, _patch);
    if (!_prerelease.empty()) {
        ret += "-" + _prerelease.to_string();
    }
    if (!_build.empty()) {
        ret += "+" + _build.to_string();
    }
    return ret;
}

std::ostream& semkit::operator<<(std::ostream& out, const version& ver) {
    out << ver.to_string();
    return out;
}
