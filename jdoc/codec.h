#pragma once

#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <istream>
#include <iterator>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include "error.h"
#include "value.h"

namespace jdoc {

// =============================================================================
// Text codecs: JSON through nlohmann/json, YAML through yaml-cpp.
//
// Both decoders produce the same Value shape. Decoded numbers are always
// floating point; integer nodes only appear in values a program builds.
// Every third-party exception is rethrown as Error(decode_failed) with the
// original message kept.
// =============================================================================

namespace detail {

// Shortest round-trip text of a double as a JSON number: plain decimal
// notation, exponent form below 1e-6 or from 1e21 on ("1e-7", "1e+21").
// JSON has no NaN or infinity; they are written as null.
inline std::string format_json_float(double v) {
    if (!std::isfinite(v)) return "null";
    double mag = std::fabs(v);
    bool exponent = mag != 0 && (mag < 1e-6 || mag >= 1e21);
    char buf[400];
    auto res = std::to_chars(buf, buf + sizeof(buf), v,
                             exponent ? std::chars_format::scientific : std::chars_format::fixed);
    std::string out(buf, res.ptr);
    auto n = out.size();
    if (exponent && n >= 4 && out[n - 4] == 'e' && out[n - 3] == '-' && out[n - 2] == '0') {
        out.erase(n - 2, 1);
    }
    return out;
}

// nlohmann escaping, plus "<", ">", "&", U+2028 and U+2029 as \u escapes so
// the text is safe to embed in HTML. Invalid UTF-8 becomes U+FFFD.
inline void append_json_string(std::string& out, const std::string& s) {
    std::string quoted = Value(s).dump(-1, ' ', false, Value::error_handler_t::replace);
    for (std::size_t i = 0; i < quoted.size(); ++i) {
        char c = quoted[i];
        if (c == '<') {
            out += "\\u003c";
        } else if (c == '>') {
            out += "\\u003e";
        } else if (c == '&') {
            out += "\\u0026";
        } else if (c == '\xE2' && i + 2 < quoted.size() && quoted[i + 1] == '\x80'
                   && (quoted[i + 2] == '\xA8' || quoted[i + 2] == '\xA9')) {
            out += quoted[i + 2] == '\xA8' ? "\\u2028" : "\\u2029";
            i += 2;
        } else {
            out += c;
        }
    }
}

inline void write_json(std::string& out, const Value& v) {
    switch (v.type()) {
        case Value::value_t::number_float:
            out += format_json_float(v.get<double>());
            break;
        case Value::value_t::string:
            append_json_string(out, v.get_ref<const std::string&>());
            break;
        case Value::value_t::array: {
            out += '[';
            bool first = true;
            for (const auto& elem : v) {
                if (!first) out += ',';
                write_json(out, elem);
                first = false;
            }
            out += ']';
            break;
        }
        case Value::value_t::object: {
            out += '{';
            bool first = true;
            for (const auto& item : v.items()) {
                if (!first) out += ',';
                append_json_string(out, item.key());
                out += ':';
                write_json(out, item.value());
                first = false;
            }
            out += '}';
            break;
        }
        default:
            out += v.dump();
            break;
    }
}

// Turn every integer node into a double, recursively.
inline void float_numbers(Value& v) {
    if (v.is_number_integer()) {
        v = v.get<double>();
    } else if (v.is_structured()) {
        for (auto& elem : v) {
            float_numbers(elem);
        }
    }
}

} // namespace detail

/**
 * Serialize a value to compact JSON text. Object keys come out sorted, so
 * equal documents always serialize to equal text, and integral floating
 * point values carry no fraction ("1", not "1.0").
 */
inline std::string to_json_text(const Value& v) {
    std::string out;
    detail::write_json(out, v);
    return out;
}

inline Bytes to_json_bytes(const Value& v) {
    std::string text = to_json_text(v);
    return Bytes(text.begin(), text.end());
}

/**
 * Decode JSON text. Every number comes back as a double.
 *
 * @throws Error(decode_failed) if the text is not valid JSON.
 */
inline Value from_json_text(const std::string& text) {
    try {
        Value v = Value::parse(text);
        detail::float_numbers(v);
        return v;
    } catch (const nlohmann::json::exception& e) {
        throw Error(error_kind::decode_failed, std::string("JSON decode failed: ") + e.what());
    }
}

inline Value from_json_bytes(const Bytes& bytes) {
    return from_json_text(std::string(bytes.begin(), bytes.end()));
}

/**
 * Read the whole stream and decode it as JSON.
 *
 * @throws Error(decode_failed) if the stream fails or holds invalid JSON.
 */
inline Value read_json(std::istream& in) {
    if (!in) {
        throw Error(error_kind::decode_failed, "JSON decode failed: stream is not readable");
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw Error(error_kind::decode_failed, "JSON decode failed: error while reading stream");
    }
    return from_json_text(text);
}

namespace detail {

inline bool parse_yaml_int(const std::string& s, std::int64_t& out) {
    if (s.empty()) return false;
    const char* first = s.data();
    const char* last  = s.data() + s.size();
    bool negative = false;
    if (*first == '+' || *first == '-') {
        negative = *first == '-';
        ++first;
    }
    int base = 10;
    if (last - first > 2 && first[0] == '0' && (first[1] == 'x' || first[1] == 'X')) {
        base = 16;
        first += 2;
    }
    if (first == last) return false;
    std::uint64_t mag = 0;
    auto res = std::from_chars(first, last, mag, base);
    if (res.ec != std::errc() || res.ptr != last) return false;
    if (negative) {
        if (mag > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1) return false;
        out = static_cast<std::int64_t>(0 - mag);
    } else {
        if (mag > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return false;
        out = static_cast<std::int64_t>(mag);
    }
    return true;
}

inline bool parse_yaml_float(const std::string& s, double& out) {
    if (s == ".inf" || s == ".Inf" || s == ".INF" || s == "+.inf" || s == "+.Inf" || s == "+.INF") {
        out = std::numeric_limits<double>::infinity();
        return true;
    }
    if (s == "-.inf" || s == "-.Inf" || s == "-.INF") {
        out = -std::numeric_limits<double>::infinity();
        return true;
    }
    if (s == ".nan" || s == ".NaN" || s == ".NAN") {
        out = std::numeric_limits<double>::quiet_NaN();
        return true;
    }
    bool has_digit = false;
    for (char c : s) {
        if (c >= '0' && c <= '9') has_digit = true;
        else if (c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E') return false;
    }
    if (!has_digit) return false;
    char* end = nullptr;
    out = std::strtod(s.c_str(), &end);
    return end == s.c_str() + s.size();
}

// Resolve a plain scalar the way a YAML 1.1 loader does: null, bool, int,
// float, otherwise string. Quoted or !!str-tagged scalars stay strings.
inline Value yaml_scalar(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() == "!" || node.Tag() == "tag:yaml.org,2002:str") {
        return text;
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) {
        return b;
    }
    std::int64_t i = 0;
    if (parse_yaml_int(text, i)) {
        return i;
    }
    double d = 0.0;
    if (parse_yaml_float(text, d)) {
        return d;
    }
    return text;
}

// A string that a plain scalar would turn into something else must be quoted
// on output, or it comes back as a number, a boolean or null.
inline bool yaml_needs_quotes(const std::string& s) {
    if (s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL") return true;
    bool b = false;
    std::int64_t i = 0;
    double d = 0.0;
    return YAML::convert<bool>::decode(YAML::Node(s), b) || parse_yaml_int(s, i) || parse_yaml_float(s, d);
}

inline std::string yaml_key(const YAML::Node& key) {
    if (key.IsScalar()) return key.Scalar();
    if (key.IsNull()) return "<nil>";
    return YAML::Dump(key);
}

inline Value from_yaml_node(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            return yaml_scalar(node);
        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& elem : node) {
                arr.push_back(from_yaml_node(elem));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& item : node) {
                obj[yaml_key(item.first)] = from_yaml_node(item.second);
            }
            return obj;
        }
    }
    return nullptr;
}

inline void emit_yaml(YAML::Emitter& out, const Value& v) {
    switch (v.type()) {
        case Value::value_t::null:
        case Value::value_t::discarded:
            out << YAML::Null;
            break;
        case Value::value_t::boolean:
            out << v.get<bool>();
            break;
        case Value::value_t::number_integer:
            out << v.get<std::int64_t>();
            break;
        case Value::value_t::number_unsigned:
            out << v.get<std::uint64_t>();
            break;
        case Value::value_t::number_float:
            out << v.get<double>();
            break;
        case Value::value_t::string: {
            const auto& s = v.get_ref<const std::string&>();
            if (yaml_needs_quotes(s)) out << YAML::DoubleQuoted;
            out << s;
            break;
        }
        case Value::value_t::binary:
            out << YAML::Binary(v.get_binary().data(), v.get_binary().size());
            break;
        case Value::value_t::array:
            out << YAML::BeginSeq;
            for (const auto& elem : v) {
                emit_yaml(out, elem);
            }
            out << YAML::EndSeq;
            break;
        case Value::value_t::object:
            out << YAML::BeginMap;
            for (const auto& item : v.items()) {
                out << YAML::Key << item.key() << YAML::Value;
                emit_yaml(out, item.value());
            }
            out << YAML::EndMap;
            break;
    }
}

} // namespace detail

/**
 * Decode YAML text into a Value. Map keys of any kind become strings and
 * numbers come back as doubles, as with JSON.
 *
 * @throws Error(decode_failed) if yaml-cpp rejects the text.
 */
inline Value from_yaml_text(const std::string& text) {
    try {
        Value v = detail::from_yaml_node(YAML::Load(text));
        detail::float_numbers(v);
        return v;
    } catch (const YAML::Exception& e) {
        throw Error(error_kind::decode_failed, std::string("YAML decode failed: ") + e.what());
    }
}

inline Value from_yaml_bytes(const Bytes& bytes) {
    return from_yaml_text(std::string(bytes.begin(), bytes.end()));
}

/** Serialize a value as block-style YAML. */
inline Bytes to_yaml_bytes(const Value& v) {
    YAML::Emitter out;
    detail::emit_yaml(out, v);
    if (!out.good()) {
        throw Error(error_kind::decode_failed, "YAML encode failed: " + out.GetLastError());
    }
    std::string text = out.c_str();
    text += '\n';
    return Bytes(text.begin(), text.end());
}

} // namespace jdoc
