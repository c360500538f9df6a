#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.h"

namespace jdoc {

// A Value is one node of a decoded document: null, boolean, number, string,
// array or object. Arrays are always Value::array_t; there is no other list
// shape to reconcile.
using Value = nlohmann::json;
using Array = Value::array_t;
using Bytes = std::vector<std::uint8_t>;

/** Name of the type held by v, as used in diagnostics. */
inline std::string type_name(const Value& v) {
    return v.type_name();
}

/**
 * Return v as an ordered sequence.
 * Throws Error(not_iterable) unless v is an array.
 */
inline const Array& to_iterable(const Value& v) {
    if (!v.is_array()) {
        throw Error(error_kind::not_iterable,
                    std::string("value is not iterable, type is: ") + v.type_name(),
                    {}, "array", v.type_name());
    }
    return v.get_ref<const Array&>();
}

/**
 * Render a floating-point number the way the default "%v" verb does:
 * shortest round-trip digits, switching to exponent form when the decimal
 * exponent is below -4 or at least 6 ("1e+06", "1.5e-05", "123456").
 */
inline std::string format_float(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "+Inf" : "-Inf";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    std::string sci(buf, res.ptr);

    bool negative = !sci.empty() && sci[0] == '-';
    if (negative) sci.erase(0, 1);

    auto epos = sci.find('e');
    int exp = std::atoi(sci.c_str() + epos + 1);
    std::string digits;
    for (std::size_t i = 0; i < epos; ++i) {
        if (sci[i] != '.') digits += sci[i];
    }

    std::string out;
    if (exp < -4 || exp >= 6) {
        out = digits.substr(0, 1);
        if (digits.size() > 1) out += "." + digits.substr(1);
        out += exp < 0 ? "e-" : "e+";
        int mag = std::abs(exp);
        if (mag < 10) out += '0';
        out += std::to_string(mag);
    } else if (exp < 0) {
        out = "0." + std::string(static_cast<std::size_t>(-exp - 1), '0') + digits;
    } else {
        auto int_digits = static_cast<std::size_t>(exp) + 1;
        if (digits.size() <= int_digits) {
            out = digits + std::string(int_digits - digits.size(), '0');
        } else {
            out = digits.substr(0, int_digits) + "." + digits.substr(int_digits);
        }
    }
    return negative ? "-" + out : out;
}

/**
 * Generic "%v"-style text of a value: strings verbatim, numbers as above,
 * null as "<nil>", arrays as "[a b c]", objects as "map[k:v ...]" in key
 * order.
 */
inline std::string format_value(const Value& v) {
    switch (v.type()) {
        case Value::value_t::null:
            return "<nil>";
        case Value::value_t::boolean:
            return v.get<bool>() ? "true" : "false";
        case Value::value_t::number_integer:
            return std::to_string(v.get<std::int64_t>());
        case Value::value_t::number_unsigned:
            return std::to_string(v.get<std::uint64_t>());
        case Value::value_t::number_float:
            return format_float(v.get<double>());
        case Value::value_t::string:
            return v.get_ref<const std::string&>();
        case Value::value_t::array: {
            std::string out = "[";
            bool first = true;
            for (const auto& elem : v) {
                if (!first) out += ' ';
                out += format_value(elem);
                first = false;
            }
            return out + "]";
        }
        case Value::value_t::object: {
            std::string out = "map[";
            bool first = true;
            for (const auto& item : v.items()) {
                if (!first) out += ' ';
                out += item.key() + ":" + format_value(item.value());
                first = false;
            }
            return out + "]";
        }
        case Value::value_t::binary: {
            std::string out = "[";
            bool first = true;
            for (auto b : v.get_binary()) {
                if (!first) out += ' ';
                out += std::to_string(static_cast<unsigned>(b));
                first = false;
            }
            return out + "]";
        }
        case Value::value_t::discarded:
            break;
    }
    return "<invalid>";
}

} // namespace jdoc
