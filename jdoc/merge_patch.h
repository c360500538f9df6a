#pragma once

#include <utility>

#include "value.h"

namespace jdoc {

/**
 * Compute the RFC 7396 merge patch that turns original into changed.
 *
 * Keys missing from changed map to null, added or modified keys carry the
 * new value, objects present on both sides are diffed recursively (and left
 * out when equal), and any other value (arrays included) is replaced whole.
 * When either side is not an object the patch is changed itself.
 *
 * nlohmann::json::merge_patch() applies the result.
 */
inline Value create_merge_patch(const Value& original, const Value& changed) {
    if (!original.is_object() || !changed.is_object()) {
        return changed;
    }

    Value patch = Value::object();
    for (const auto& item : original.items()) {
        if (!changed.contains(item.key())) {
            patch[item.key()] = nullptr;
        }
    }
    for (const auto& item : changed.items()) {
        auto it = original.find(item.key());
        if (it == original.end()) {
            patch[item.key()] = item.value();
        } else if (it->is_object() && item.value().is_object()) {
            Value nested = create_merge_patch(*it, item.value());
            if (!nested.empty()) {
                patch[item.key()] = std::move(nested);
            }
        } else if (*it != item.value()) {
            patch[item.key()] = item.value();
        }
    }
    return patch;
}

} // namespace jdoc
