#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "error.h"

namespace jdoc {

/**
 * Escape one reference token for use inside a pointer string
 * ("~" becomes "~0", "/" becomes "~1").
 */
inline std::string escape_token(const std::string& token) {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '~')      out += "~0";
        else if (c == '/') out += "~1";
        else               out += c;
    }
    return out;
}

/**
 * A parsed RFC 6901 pointer: the ordered list of unescaped reference tokens.
 *
 * "" addresses the document root, "/a/0/b" addresses key "b" of element 0 of
 * the array at key "a". Whether a token is a key or an array index is only
 * decided during navigation, by the container it is applied to.
 *
 * Construction from a string throws Error(malformed_path) when the string
 * is not a valid pointer.
 */
class Path {
public:
    Path() = default;

    Path(const std::string& pointer) : text_(pointer) {
        nlohmann::json::json_pointer ptr;
        try {
            ptr = nlohmann::json::json_pointer(pointer);
        } catch (const nlohmann::json::exception& e) {
            throw Error(error_kind::malformed_path,
                        "JSONPointer: " + pointer + " is malformed: " + e.what(),
                        pointer);
        }
        // json_pointer keeps its tokens private; peel them off from the back.
        while (!ptr.empty()) {
            tokens_.push_back(ptr.back());
            ptr.pop_back();
        }
        std::reverse(tokens_.begin(), tokens_.end());
    }

    Path(const char* pointer) : Path(std::string(pointer)) {}

    static Path from_tokens(std::vector<std::string> tokens) {
        Path p;
        p.tokens_ = std::move(tokens);
        for (const auto& t : p.tokens_) {
            p.text_ += "/" + escape_token(t);
        }
        return p;
    }

    const std::vector<std::string>& tokens() const noexcept { return tokens_; }
    std::size_t size() const noexcept { return tokens_.size(); }
    bool empty() const noexcept { return tokens_.empty(); }

    /** Last token. Must not be called on the root path. */
    const std::string& back() const { return tokens_.back(); }

    /** Path made of the first n tokens. */
    Path prefix(std::size_t n) const {
        n = std::min(n, tokens_.size());
        return from_tokens(std::vector<std::string>(tokens_.begin(), tokens_.begin() + n));
    }

    Path parent() const { return prefix(tokens_.empty() ? 0 : tokens_.size() - 1); }

    /** Append one raw (unescaped) token. */
    Path operator/(const std::string& token) const {
        std::vector<std::string> tokens = tokens_;
        tokens.push_back(token);
        return from_tokens(std::move(tokens));
    }

    /** The pointer string, escaped. */
    const std::string& str() const noexcept { return text_; }

    bool operator==(const Path& other) const { return tokens_ == other.tokens_; }
    bool operator!=(const Path& other) const { return tokens_ != other.tokens_; }

private:
    std::string              text_;
    std::vector<std::string> tokens_;
};

} // namespace jdoc
