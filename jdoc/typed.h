#pragma once

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/multiprecision/cpp_dec_float.hpp>

#include "rfc3339.h"
#include "value.h"

namespace jdoc {

using Decimal = boost::multiprecision::cpp_dec_float_50;

/**
 * Typed extraction of a Value.
 *
 * A specialization provides:
 *   name               type name used in diagnostics
 *   matches(v)         whether v has a shape T can be read from
 *   convert(v)         the T value, or std::nullopt when the shape matched
 *                      but the content is unusable (an unparsable time,
 *                      an integer out of range)
 */
template <typename T>
struct value_traits;

template <>
struct value_traits<std::string> {
    static constexpr const char* name = "STRING";
    static bool matches(const Value& v) { return v.is_string(); }
    static std::optional<std::string> convert(const Value& v) { return v.get<std::string>(); }
};

template <>
struct value_traits<bool> {
    static constexpr const char* name = "BOOLEAN";
    static bool matches(const Value& v) { return v.is_boolean(); }
    static std::optional<bool> convert(const Value& v) { return v.get<bool>(); }
};

// Decoded text only ever carries floating-point numbers for fractional
// values, but programmatically built documents may hold true integers, so
// both are accepted. Floating-point sources are truncated toward zero.
template <>
struct value_traits<std::int64_t> {
    static constexpr const char* name = "INT";
    static bool matches(const Value& v) { return v.is_number(); }
    static std::optional<std::int64_t> convert(const Value& v) {
        if (v.is_number_unsigned()) {
            auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
            return static_cast<std::int64_t>(u);
        }
        if (v.is_number_integer()) {
            return v.get<std::int64_t>();
        }
        double d = std::trunc(v.get<double>());
        // 2^63 is exactly representable; anything at or above it overflows.
        if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(d);
    }
};

template <>
struct value_traits<int> {
    static constexpr const char* name = "INT";
    static bool matches(const Value& v) { return v.is_number(); }
    static std::optional<int> convert(const Value& v) {
        auto wide = value_traits<std::int64_t>::convert(v);
        if (!wide || *wide < std::numeric_limits<int>::min() || *wide > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(*wide);
    }
};

template <>
struct value_traits<double> {
    static constexpr const char* name = "FLOAT64";
    static bool matches(const Value& v) { return v.is_number(); }
    static std::optional<double> convert(const Value& v) { return v.get<double>(); }
};

template <>
struct value_traits<Timestamp> {
    static constexpr const char* name = "TIME";
    static bool matches(const Value& v) { return v.is_string(); }
    static std::optional<Timestamp> convert(const Value& v) {
        return parse_rfc3339(v.get_ref<const std::string&>());
    }
};

/** Whether s is a plain decimal literal: [+-]digits[.digits][(e|E)[+-]digits]. */
inline bool is_decimal_literal(const std::string& s) {
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    std::size_t digits = 0;
    while (i < s.size() && s[i] >= '0' && s[i] <= '9') { ++i; ++digits; }
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') { ++i; ++digits; }
    }
    if (digits == 0) return false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        std::size_t exp_digits = 0;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') { ++i; ++exp_digits; }
        if (exp_digits == 0) return false;
    }
    return i == s.size();
}

template <>
struct value_traits<Decimal> {
    static constexpr const char* name = "DECIMAL";
    static bool matches(const Value& v) { return v.is_string(); }
    static std::optional<Decimal> convert(const Value& v) {
        const auto& s = v.get_ref<const std::string&>();
        if (!is_decimal_literal(s)) return std::nullopt;
        try {
            return Decimal(s.c_str());
        } catch (const std::runtime_error&) {
            return std::nullopt;
        }
    }
};

template <>
struct value_traits<Array> {
    static constexpr const char* name = "ARRAY";
    static bool matches(const Value& v) { return v.is_array(); }
    static std::optional<Array> convert(const Value& v) { return v.get<Array>(); }
};

template <>
struct value_traits<Value> {
    static constexpr const char* name = "ANY";
    static bool matches(const Value&) { return true; }
    static std::optional<Value> convert(const Value& v) { return v; }
};

} // namespace jdoc
