#pragma once

#include <algorithm>
#include <cctype>
#include <string>

#include "document.h"

namespace jdoc {

// =============================================================================
// Asset helpers.
//
// A document stored as a ledger asset carries service keys next to its own
// data: a version counter, a document type and a primary key. Identities are
// the exception: they are keyed by certificate fingerprint instead of uuid.
// =============================================================================

constexpr const char* version_key     = "xxx_version";
constexpr const char* id_key_name     = "uuid";
constexpr const char* doc_type_key    = "docType";
constexpr const char* fingerprint_key = "fingerprint";
constexpr const char* identity_type   = "identity";

namespace detail {

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace detail

inline int version(const Document& doc) {
    return doc.get_as<int>(version_key);
}

inline void set_version(Document& doc, int version) {
    doc.set(Path::from_tokens({version_key}), version);
}

/** Document type, lower-cased. */
inline std::string doc_type(const Document& doc) {
    return detail::to_lower(doc.get_as<std::string>(doc_type_key));
}

/** Name of the key holding the primary key: "fingerprint" for identities, "uuid" otherwise. */
inline std::string id_key(const Document& doc) {
    return doc_type(doc) == identity_type ? fingerprint_key : id_key_name;
}

/** Primary key, lower-cased. */
inline std::string id(const Document& doc) {
    return detail::to_lower(doc.get_as<std::string>(id_key(doc)));
}

/** Authorization object name: "/<doctype>/<id>". */
inline std::string casbin_object(const Document& doc) {
    return detail::to_lower("/" + doc_type(doc) + "/" + id(doc));
}

/** Key of the asset in the transaction state: "<doctype>:<id>". */
inline std::string txs_key(const Document& doc) {
    return detail::to_lower(doc_type(doc) + ":" + id(doc));
}

inline bool has_service_key(const Document& doc) {
    return doc.has(doc_type_key) || doc.has(version_key) || doc.has(id_key_name) || doc.has(fingerprint_key);
}

/**
 * An asset has a document type plus the service keys that type requires:
 * xxx_version, uuid and docType in general, fingerprint instead of uuid for
 * identities. Without docType a document is never an asset.
 */
inline bool is_asset(const Document& doc) {
    if (!doc.has(doc_type_key)) {
        return false;
    }
    if (doc_type(doc) == identity_type) {
        return doc.has_all({fingerprint_key, version_key, doc_type_key});
    }
    return doc.has_all({version_key, id_key_name, doc_type_key});
}

} // namespace jdoc
