#pragma once

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "collector.h"
#include "document.h"
#include "error.h"
#include "log.h"
#include "value.h"

namespace jdoc {

namespace detail {

// One table row keyed by dotted leaf path. A cell that has not been filled
// holds an empty object and is written as "map[]".
using csv_row = std::map<std::string, Value>;

inline std::string strip_char(std::string s, char c) {
    s.erase(std::remove(s.begin(), s.end(), c), s.end());
    return s;
}

inline void fill_row(const Value& object, std::vector<std::string>& path, csv_row& row) {
    for (const auto& item : object.items()) {
        path.push_back(item.key());
        const Value& v = item.value();
        if (v.is_object()) {
            fill_row(v, path, row);
        } else {
            std::string key = join_path(path);
            auto cell = row.find(key);
            if (cell == row.end()) {
                throw Error(error_kind::unexpected_key,
                            "unexpected key: " + key + ", not found in header", key);
            }
            if (v.is_string()) {
                cell->second = strip_char(v.get<std::string>(), '\n');
            } else if (v.is_number()) {
                cell->second = v;
            } else {
                cell->second = format_value(v);
            }
        }
        path.pop_back();
    }
}

inline std::string format_cell(const Value& cell, const std::string& separator) {
    if (!cell.is_string()) {
        return format_value(cell);
    }
    const auto& s = cell.get_ref<const std::string&>();
    if (s.find(separator) == std::string::npos) {
        return s;
    }
    // Quotes inside a quoted cell are dropped, not escaped.
    return "\"" + strip_char(s, '"') + "\"";
}

} // namespace detail

/**
 * Project documents onto one delimited table.
 *
 * The header is the sorted set of dotted leaf paths of the FIRST document
 * only. A later document carrying a leaf the first one lacks fails the whole
 * projection with Error(unexpected_key): callers must put a representative
 * document first.
 *
 * Strings lose their newlines; a string containing the separator is wrapped
 * in double quotes after its own double quotes are removed. Numbers keep
 * their numeric text, other leaves use their generic text form.
 * Cells a row does not fill are written as "map[]".
 *
 * @throws Error(empty_input) if docs is empty.
 * @throws Error(unexpected_key) as described above.
 */
inline Bytes to_csv(const std::vector<Document>& docs, const std::string& separator) {
    if (docs.empty()) {
        throw Error(error_kind::empty_input, "to_csv: at least one document is required to build the header");
    }

    const std::set<std::string> header = collect_keys(docs.front());
    logger()->debug("to_csv: {} rows, {} columns", docs.size(), header.size());

    std::string out;
    bool first = true;
    for (const auto& key : header) {
        if (!first) out += separator;
        out += key;
        first = false;
    }
    out += '\n';

    for (const auto& doc : docs) {
        detail::csv_row row;
        for (const auto& key : header) {
            row.emplace(key, Value::object());
        }

        std::vector<std::string> path;
        detail::fill_row(doc.value(), path, row);

        first = true;
        for (const auto& key : header) {
            if (!first) out += separator;
            out += detail::format_cell(row.at(key), separator);
            first = false;
        }
        out += '\n';
    }

    return Bytes(out.begin(), out.end());
}

} // namespace jdoc
