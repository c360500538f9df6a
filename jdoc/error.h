#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace jdoc {

/**
 * Classification of every failure the library reports.
 *
 * The kind is the identity of an error; the message carried by jdoc::Error
 * is only its presentation.
 */
enum class error_kind
{
    path_not_found,    // a key is absent or an array index is out of range
    malformed_path,    // the pointer string cannot be parsed
    not_container,     // a pointer segment addresses into a scalar
    type_mismatch,     // the value exists but has another type
    key_not_found,     // a top-level key is absent
    not_iterable,      // the value is not an array
    unsupported_type,  // the value cannot be turned into a Document
    unexpected_key,    // a row carries a leaf the table header lacks
    empty_input,       // a table was requested for zero documents
    decode_failed,     // JSON/YAML text or a stream could not be decoded
    invalid_value,     // a field has the right type but an unusable value
    schema_violation,  // a schema validator reported violations
};

inline const char* to_string(error_kind kind) noexcept {
    switch (kind) {
        case error_kind::path_not_found:   return "path_not_found";
        case error_kind::malformed_path:   return "malformed_path";
        case error_kind::not_container:    return "not_container";
        case error_kind::type_mismatch:    return "type_mismatch";
        case error_kind::key_not_found:    return "key_not_found";
        case error_kind::not_iterable:     return "not_iterable";
        case error_kind::unsupported_type: return "unsupported_type";
        case error_kind::unexpected_key:   return "unexpected_key";
        case error_kind::empty_input:      return "empty_input";
        case error_kind::decode_failed:    return "decode_failed";
        case error_kind::invalid_value:    return "invalid_value";
        case error_kind::schema_violation: return "schema_violation";
    }
    return "unknown";
}

/**
 * The single exception type thrown by jdoc.
 *
 * Besides the formatted message it keeps the structured context that
 * produced it, so callers can branch on kind() and inspect the offending
 * key/path, the expected and actual type names and a compact JSON snapshot
 * of the containing document without parsing what().
 */
class Error : public std::runtime_error {
public:
    Error(error_kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    Error(error_kind kind,
          const std::string& message,
          std::string path,
          std::string expected = {},
          std::string actual = {},
          std::string snapshot = {})
        : std::runtime_error(message)
        , kind_(kind)
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
        , snapshot_(std::move(snapshot))
    {
    }

    error_kind kind() const noexcept { return kind_; }

    /** Key or pointer the failing operation addressed (may be empty). */
    const std::string& path() const noexcept { return path_; }

    /** Type name the caller asked for (type_mismatch only). */
    const std::string& expected() const noexcept { return expected_; }

    /** Type name actually found (type_mismatch, unsupported_type, not_iterable). */
    const std::string& actual() const noexcept { return actual_; }

    /** Compact JSON of the containing document, when one was involved. */
    const std::string& snapshot() const noexcept { return snapshot_; }

private:
    error_kind  kind_;
    std::string path_;
    std::string expected_;
    std::string actual_;
    std::string snapshot_;
};

} // namespace jdoc
