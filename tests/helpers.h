#pragma once

#include <catch2/catch_test_macros.hpp>

#include "jdoc/error.h"

// Run fn and return the kind of the jdoc::Error it throws.
// Fails the current test if fn returns normally.
template <typename Fn>
jdoc::error_kind thrown_kind(Fn&& fn) {
    try {
        fn();
    } catch (const jdoc::Error& e) {
        return e.kind();
    }
    FAIL("expected jdoc::Error to be thrown");
    return jdoc::error_kind::invalid_value;
}
