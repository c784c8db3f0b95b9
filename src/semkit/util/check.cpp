#include "./check.hpp"

#include <semkit/error/on_error.hpp>
#include <semkit/util/log.hpp>

#include <fmt/format.h>

using namespace semkit;

void semkit::must_not_be_negative(std::string_view component, int value) {
    SEMKIT_E_SCOPE(e_version_component{std::string(component), value});
    must_pass(
        value,
        [](int v) { return v >= 0; },
        [&] {
            semkit_log(debug, "Rejecting negative {} version number {}", component, value);
            return fmt::format("Version {} number {} must not be negative", component, value);
        });
}
