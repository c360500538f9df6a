#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <limits>

#include "helpers.h"
#include "jdoc/value.h"

using jdoc::Value;

// -----------------------------------------------------------------------
// Tests for value rendering and iteration (jdoc/value.h)
// -----------------------------------------------------------------------

TEST_CASE("Value: format_float uses shortest digits", "[value]")
{
    CHECK(jdoc::format_float(1.0) == "1");
    CHECK(jdoc::format_float(1.5) == "1.5");
    CHECK(jdoc::format_float(-2.25) == "-2.25");
    CHECK(jdoc::format_float(0.0) == "0");
    CHECK(jdoc::format_float(0.1) == "0.1");
    CHECK(jdoc::format_float(123456.0) == "123456");
    CHECK(jdoc::format_float(0.0001) == "0.0001");
}

TEST_CASE("Value: format_float switches to exponent form", "[value]")
{
    CHECK(jdoc::format_float(1000000.0) == "1e+06");
    CHECK(jdoc::format_float(1234567.0) == "1.234567e+06");
    CHECK(jdoc::format_float(0.00001) == "1e-05");
    CHECK(jdoc::format_float(1.5e-7) == "1.5e-07");
    CHECK(jdoc::format_float(2e100) == "2e+100");
}

TEST_CASE("Value: format_float special values", "[value]")
{
    CHECK(jdoc::format_float(std::numeric_limits<double>::infinity()) == "+Inf");
    CHECK(jdoc::format_float(-std::numeric_limits<double>::infinity()) == "-Inf");
    CHECK(jdoc::format_float(std::numeric_limits<double>::quiet_NaN()) == "NaN");
}

TEST_CASE("Value: format_value of scalars", "[value]")
{
    CHECK(jdoc::format_value(Value(nullptr)) == "<nil>");
    CHECK(jdoc::format_value(Value(true)) == "true");
    CHECK(jdoc::format_value(Value(false)) == "false");
    CHECK(jdoc::format_value(Value(42)) == "42");
    CHECK(jdoc::format_value(Value(-7)) == "-7");
    CHECK(jdoc::format_value(Value(std::uint64_t{18446744073709551615ULL})) == "18446744073709551615");
    CHECK(jdoc::format_value(Value(2.5)) == "2.5");
    CHECK(jdoc::format_value(Value("text")) == "text");
}

TEST_CASE("Value: format_value of containers", "[value]")
{
    CHECK(jdoc::format_value(Value::array()) == "[]");
    CHECK(jdoc::format_value(Value::parse(R"(["a", 1, true])")) == "[a 1 true]");
    CHECK(jdoc::format_value(Value::parse(R"({"b": 2, "a": [1]})")) == "map[a:[1] b:2]");
}

TEST_CASE("Value: to_iterable returns arrays", "[value]")
{
    Value arr = Value::parse("[1, 2, 3]");
    const jdoc::Array& items = jdoc::to_iterable(arr);
    REQUIRE(items.size() == 3u);
    REQUIRE(items[2] == 3);
}

TEST_CASE("Value: to_iterable rejects everything else", "[value]")
{
    CHECK(thrown_kind([] { jdoc::to_iterable(Value("abc")); }) == jdoc::error_kind::not_iterable);
    CHECK(thrown_kind([] { jdoc::to_iterable(Value::object()); }) == jdoc::error_kind::not_iterable);
    CHECK(thrown_kind([] { jdoc::to_iterable(Value(nullptr)); }) == jdoc::error_kind::not_iterable);
}
