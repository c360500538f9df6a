#pragma once

#include <set>
#include <string>
#include <vector>

#include "document.h"
#include "value.h"

namespace jdoc {

namespace detail {

inline std::string join_path(const std::vector<std::string>& path) {
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) out += '.';
        out += path[i];
    }
    return out;
}

inline void collect_keys(const Value& object, std::vector<std::string>& path, std::set<std::string>& keys) {
    for (const auto& item : object.items()) {
        path.push_back(item.key());
        if (item.value().is_object()) {
            collect_keys(item.value(), path, keys);
        } else {
            keys.insert(join_path(path));
        }
        path.pop_back();
    }
}

} // namespace detail

/**
 * Every leaf of doc as a dotted path ("a.b.c"). Objects are descended into;
 * anything else, arrays included, is a leaf. An empty nested object
 * contributes no key.
 */
inline std::set<std::string> collect_keys(const Document& doc) {
    std::set<std::string> keys;
    std::vector<std::string> path;
    detail::collect_keys(doc.value(), path, keys);
    return keys;
}

} // namespace jdoc
