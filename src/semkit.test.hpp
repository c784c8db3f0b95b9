#pragma once

#include <catch2/catch.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <boost/leaf/pred.hpp>

#include <exception>

namespace semkit::testing {

template <typename Fn>
constexpr auto leaf_handle_nofail(Fn&& fn) {
    return boost::leaf::try_catch(  //
        fn,
        [](const boost::leaf::verbose_diagnostic_info& info) -> decltype(fn()) {
            FAIL("Operation failed: " << info);
            std::terminate();
        });
}

#define REQUIRES_LEAF_NOFAIL(...)                                                                  \
    (::semkit::testing::leaf_handle_nofail([&] { return (__VA_ARGS__); }))

}  // namespace semkit::testing
