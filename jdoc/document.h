#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec.h"
#include "error.h"
#include "hash.h"
#include "log.h"
#include "merge_patch.h"
#include "path.h"
#include "typed.h"
#include "value.h"

namespace jdoc {

namespace detail {

enum class lookup_status
{
    found,
    key_absent,          // object has no such key
    index_out_of_range,  // array index >= size, or "-"
    bad_index,           // token applied to an array is not an index
    not_container,       // token applied to a scalar
};

/**
 * Parse an array index token: "0" or a digit string without leading zeros.
 * "-" (one past the end) is handled by the callers.
 */
inline bool parse_index(const std::string& token, std::size_t& out) {
    if (token.empty() || (token.size() > 1 && token[0] == '0')) return false;
    out = 0;
    for (char c : token) {
        if (c < '0' || c > '9') return false;
        std::size_t next = out * 10 + static_cast<std::size_t>(c - '0');
        if (next / 10 != out) return false;
        out = next;
    }
    return true;
}

/**
 * Walk the first n tokens starting at node. On success node points at the
 * addressed value; otherwise failed_at is the index of the offending token
 * and node points at the container it was applied to.
 */
template <typename J>
lookup_status walk(J*& node, const std::vector<std::string>& tokens, std::size_t n, std::size_t& failed_at) {
    for (std::size_t i = 0; i < n; ++i) {
        const std::string& token = tokens[i];
        failed_at = i;
        if (node->is_object()) {
            auto it = node->find(token);
            if (it == node->end()) return lookup_status::key_absent;
            node = &*it;
        } else if (node->is_array()) {
            if (token == "-") return lookup_status::index_out_of_range;
            std::size_t index = 0;
            if (!parse_index(token, index)) return lookup_status::bad_index;
            if (index >= node->size()) return lookup_status::index_out_of_range;
            node = &(*node)[index];
        } else {
            return lookup_status::not_container;
        }
    }
    return lookup_status::found;
}

} // namespace detail

class Document;

/** Build a Document from an object Value, or from a binary Value holding JSON bytes. */
inline Document normalize(const Value& value);

/**
 * A schema-less JSON document: an object at the root, owning its whole tree.
 *
 * Ownership: a Document holds its values by value. Nothing handed out by a
 * Document aliases its storage; sub-documents returned from get_as<Document>
 * or resolve_as<Document> are independent copies, and storing a Document
 * into another copies it. Mutation of a nested level is done through the
 * owning Document with set(), set_recursive() or erase().
 *
 * All fallible operations throw jdoc::Error; wrap a call in jdoc::must() to
 * abort instead.
 */
class Document {
public:
    Document() : root_(Value::object()) {}

    // ---- construction ----

    /** @throws Error(unsupported_type) if value is not an object. */
    static Document from_value(Value value) {
        if (!value.is_object()) {
            throw Error(error_kind::unsupported_type,
                        std::string("unable to create Document from value, type is: ") + value.type_name(),
                        {}, "object", value.type_name());
        }
        Document doc;
        doc.root_ = std::move(value);
        return doc;
    }

    /** Decode JSON bytes; the top level must be an object. */
    static Document from_bytes(const Bytes& bytes) {
        return from_value(from_json_bytes(bytes));
    }

    static Document from_json(const std::string& text) {
        return from_value(from_json_text(text));
    }

    /** Decode YAML; map keys of any kind become strings. */
    static Document from_yaml(const Bytes& bytes) {
        return from_value(from_yaml_bytes(bytes));
    }

    static Document from_yaml(const std::string& text) {
        return from_value(from_yaml_text(text));
    }

    static Document from_stream(std::istream& in) {
        return from_value(read_json(in));
    }

    /**
     * Build a key set: every string becomes a key holding null. Such a
     * document is meant for set operations (has, has_all, keys).
     */
    static Document from_keys(const std::vector<std::string>& keys) {
        Document doc;
        for (const auto& key : keys) {
            doc.root_[key] = nullptr;
        }
        return doc;
    }

    /** Like from_keys, for an untyped array. Every element must be a string. */
    static Document from_key_values(const Array& keys) {
        Document doc;
        for (std::size_t i = 0; i < keys.size(); ++i) {
            if (!keys[i].is_string()) {
                throw Error(error_kind::unsupported_type,
                            "input slice key with index: " + std::to_string(i) +
                                " is not a STRING but: " + keys[i].type_name(),
                            std::to_string(i), "STRING", keys[i].type_name());
            }
            doc.root_[keys[i].get<std::string>()] = nullptr;
        }
        return doc;
    }

    // ---- serialization ----

    Bytes bytes() const { return to_json_bytes(root_); }

    std::string str() const { return to_json_text(root_); }

    Bytes yaml() const { return to_yaml_bytes(root_); }

    /** BLAKE2b-256 of bytes(). */
    ContentId hash() const { return hash_bytes(bytes()); }

    /** JSON bytes of {"result": <this document>}. */
    Bytes wrapped_result_bytes() const {
        Value wrapper = Value::object();
        wrapper["result"] = root_;
        return to_json_bytes(wrapper);
    }

    /**
     * Independent deep copy made by serializing and decoding again, so the
     * copy only ever holds what survives the JSON round trip.
     */
    Document copy() const { return from_bytes(bytes()); }

    // ---- inspection ----

    const Value& value() const noexcept { return root_; }

    bool empty() const noexcept { return root_.empty(); }
    std::size_t size() const noexcept { return root_.size(); }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(root_.size());
        for (const auto& item : root_.items()) {
            out.push_back(item.key());
        }
        return out;
    }

    bool has(const std::string& key) const { return root_.contains(key); }

    bool has_all(const std::vector<std::string>& keys) const {
        for (const auto& key : keys) {
            if (!has(key)) return false;
        }
        return true;
    }

    bool operator==(const Document& other) const { return root_ == other.root_; }
    bool operator!=(const Document& other) const { return root_ != other.root_; }

    // ---- top-level access ----

    /** @throws Error(key_not_found) if key is absent. */
    const Value& get(const std::string& key) const {
        auto it = root_.find(key);
        if (it == root_.end()) {
            throw Error(error_kind::key_not_found,
                        "key: " + key + " does not exist in object: " + str(),
                        key, {}, {}, str());
        }
        return *it;
    }

    /**
     * Top-level typed access.
     * @throws Error(key_not_found), Error(type_mismatch) or Error(invalid_value).
     */
    template <typename T>
    T get_as(const std::string& key) const {
        return extract<T>(get(key), "key: " + key, key);
    }

    // ---- pointer navigation ----

    /**
     * Return the value at path.
     *
     * @throws Error(path_not_found) if a key is absent or an index is out of
     *         range, Error(not_container) if a segment addresses into a
     *         scalar, Error(malformed_path) if a segment applied to an array
     *         is not an index.
     */
    const Value& resolve(const Path& path) const {
        const Value* node = &root_;
        std::size_t failed_at = 0;
        auto status = detail::walk(node, path.tokens(), path.size(), failed_at);
        if (status != detail::lookup_status::found) {
            fail_lookup(status, path, failed_at);
        }
        return *node;
    }

    template <typename T>
    T resolve_as(const Path& path) const {
        return extract<T>(resolve(path), "JSONPointer: " + path.str(), path.str());
    }

    /**
     * Whether path addresses a value. Only an absent key or an out-of-range
     * index answers false; a malformed path or a traversal through a scalar
     * still throws.
     */
    bool exists_path(const Path& path) const {
        const Value* node = &root_;
        std::size_t failed_at = 0;
        auto status = detail::walk(node, path.tokens(), path.size(), failed_at);
        switch (status) {
            case detail::lookup_status::found:
                return true;
            case detail::lookup_status::key_absent:
            case detail::lookup_status::index_out_of_range:
                return false;
            default:
                fail_lookup(status, path, failed_at);
        }
    }

    /**
     * Store value at path. Every segment but the last must already resolve
     * to a container. The last segment adds or replaces an object key; on an
     * array it replaces an existing element, or appends when it is "-".
     * Setting the root replaces the whole document and requires an object.
     */
    void set(const Path& path, Value value) {
        if (path.empty()) {
            root_ = from_value(std::move(value)).root_;
            return;
        }
        Value* parent = &root_;
        std::size_t failed_at = 0;
        auto status = detail::walk(parent, path.tokens(), path.size() - 1, failed_at);
        if (status != detail::lookup_status::found) {
            fail_lookup(status, path, failed_at);
        }

        const std::string& last = path.back();
        if (parent->is_object()) {
            (*parent)[last] = std::move(value);
        } else if (parent->is_array()) {
            if (last == "-") {
                parent->push_back(std::move(value));
                return;
            }
            std::size_t index = 0;
            if (!detail::parse_index(last, index)) {
                fail_lookup(detail::lookup_status::bad_index, path, path.size() - 1);
            }
            if (index >= parent->size()) {
                fail_lookup(detail::lookup_status::index_out_of_range, path, path.size() - 1);
            }
            (*parent)[index] = std::move(value);
        } else {
            fail_lookup(detail::lookup_status::not_container, path, path.size() - 1);
        }
    }

    /** Store a copy of doc's tree at path. */
    void set(const Path& path, const Document& doc) {
        set(path, doc.root_);
    }

    /**
     * Like set(), but first creates an empty object at every proper prefix
     * of path whose last key is absent. Any other failure on the way (an
     * index out of range, a scalar in the way, a malformed segment) is
     * thrown unchanged.
     */
    void set_recursive(const Path& path, Value value) {
        for (std::size_t n = 1; n < path.size(); ++n) {
            const Value* node = &root_;
            std::size_t failed_at = 0;
            auto status = detail::walk(node, path.tokens(), n, failed_at);
            if (status == detail::lookup_status::found) {
                continue;
            }
            if (status != detail::lookup_status::key_absent) {
                fail_lookup(status, path, failed_at);
            }
            Path prefix = path.prefix(n);
            logger()->debug("set_recursive: creating empty object at {}", prefix.str());
            set(prefix, Value::object());
        }
        set(path, std::move(value));
    }

    /** @throws Error(path_not_found) if nothing is stored at path. */
    void erase(const Path& path) {
        if (path.empty()) {
            throw Error(error_kind::malformed_path,
                        "JSONPointer: cannot delete the document root", path.str());
        }
        Value* parent = &root_;
        std::size_t failed_at = 0;
        auto status = detail::walk(parent, path.tokens(), path.size() - 1, failed_at);
        if (status != detail::lookup_status::found) {
            fail_lookup(status, path, failed_at);
        }

        const std::string& last = path.back();
        if (parent->is_object()) {
            if (parent->erase(last) == 0) {
                fail_lookup(detail::lookup_status::key_absent, path, path.size() - 1);
            }
        } else if (parent->is_array()) {
            std::size_t index = 0;
            if (last == "-") {
                fail_lookup(detail::lookup_status::index_out_of_range, path, path.size() - 1);
            }
            if (!detail::parse_index(last, index)) {
                fail_lookup(detail::lookup_status::bad_index, path, path.size() - 1);
            }
            if (index >= parent->size()) {
                fail_lookup(detail::lookup_status::index_out_of_range, path, path.size() - 1);
            }
            parent->erase(index);
        } else {
            fail_lookup(detail::lookup_status::not_container, path, path.size() - 1);
        }
    }

    // ---- membership ----

    /** Whether the array at top-level key holds an element equal to needle. */
    bool contains(const std::string& key, const Value& needle) const {
        return array_contains(iterable(get(key), "key: " + key, key), needle);
    }

    /** Whether the array at path holds an element equal to needle. */
    bool contains_path(const Path& path, const Value& needle) const {
        return array_contains(iterable(resolve(path), "JSONPointer: " + path.str(), path.str()), needle);
    }

    /**
     * The value at path must be an array of objects. Returns true when at
     * least one of them has a string at key_path equal to value.
     */
    bool contains_kv(const Path& path, const Path& key_path, const std::string& value) const {
        for (const auto& elem : iterable(resolve(path), "JSONPointer: " + path.str(), path.str())) {
            Document obj = normalize(elem);
            if (obj.exists_path(key_path) && obj.resolve_as<std::string>(key_path) == value) {
                return true;
            }
        }
        return false;
    }

    /**
     * Copy every top-level entry of value under path, overwriting what is
     * there. The target object is created when absent (one level only).
     */
    void inject(const Path& path, const Document& value) {
        if (!exists_path(path)) {
            set(path, Value::object());
        }
        for (const auto& item : value.root_.items()) {
            set(path / item.key(), item.value());
        }
    }

    // ---- merge patch (RFC 7396) ----

    void apply_merge_patch(const Document& patch) {
        root_.merge_patch(patch.root_);
    }

    /** @throws Error(decode_failed) if patch is not valid JSON. */
    void apply_merge_patch_bytes(const Bytes& patch) {
        Value patched = root_;
        patched.merge_patch(from_json_bytes(patch));
        root_ = from_value(std::move(patched)).root_;
    }

    /** Merge patch that turns this document into changed. */
    Bytes create_merge_patch(const Document& changed) const {
        return to_json_bytes(jdoc::create_merge_patch(root_, changed.root_));
    }

private:
    Value root_;

    template <typename T>
    T extract(const Value& v, const std::string& subject, const std::string& path) const {
        if (!value_traits<T>::matches(v)) {
            throw Error(error_kind::type_mismatch,
                        subject + " is not of type: " + value_traits<T>::name +
                            " in object: " + str() + ", but: " + v.type_name(),
                        path, value_traits<T>::name, v.type_name(), str());
        }
        auto converted = value_traits<T>::convert(v);
        if (!converted) {
            throw Error(error_kind::invalid_value,
                        subject + " holds " + to_json_text(v) + " which is not a valid " +
                            value_traits<T>::name + " in object: " + str(),
                        path, value_traits<T>::name, v.type_name(), str());
        }
        return std::move(*converted);
    }

    const Array& iterable(const Value& v, const std::string& subject, const std::string& path) const {
        if (!v.is_array()) {
            throw Error(error_kind::not_iterable,
                        subject + " is not of type: ARRAY in object: " + str() + ", but: " + v.type_name(),
                        path, "ARRAY", v.type_name(), str());
        }
        return to_iterable(v);
    }

    static bool array_contains(const Array& haystack, const Value& needle) {
        for (const auto& elem : haystack) {
            if (elem == needle) return true;
        }
        return false;
    }

    [[noreturn]] void fail_lookup(detail::lookup_status status, const Path& path, std::size_t failed_at) const {
        const std::string& token = path.tokens()[failed_at];
        std::string where = "JSONPointer: " + path.str();
        switch (status) {
            case detail::lookup_status::key_absent:
                throw Error(error_kind::path_not_found,
                            where + " not found, object has no key: " + token + " in object: " + str(),
                            path.str(), {}, {}, str());
            case detail::lookup_status::index_out_of_range:
                throw Error(error_kind::path_not_found,
                            where + " not found, array index: " + token + " is out of range in object: " + str(),
                            path.str(), {}, {}, str());
            case detail::lookup_status::bad_index:
                throw Error(error_kind::malformed_path,
                            where + " is malformed, token: " + token + " is not an array index",
                            path.str(), {}, {}, str());
            case detail::lookup_status::not_container:
            default:
                throw Error(error_kind::not_container,
                            where + " addresses into a scalar at token: " + token + " in object: " + str(),
                            path.str(), {}, {}, str());
        }
    }
};

template <>
struct value_traits<Document> {
    static constexpr const char* name = "OBJECT";
    static bool matches(const Value& v) { return v.is_object(); }
    static std::optional<Document> convert(const Value& v) { return Document::from_value(v); }
};

inline Document normalize(const Value& value) {
    if (value.is_object()) {
        return Document::from_value(value);
    }
    if (value.is_binary()) {
        const auto& raw = value.get_binary();
        return Document::from_bytes(Bytes(raw.begin(), raw.end()));
    }
    throw Error(error_kind::unsupported_type,
                std::string("unable to create Document from value, type is: ") + value.type_name(),
                {}, "object", value.type_name());
}

inline Document normalize(const Document& doc) {
    return doc;
}

} // namespace jdoc
