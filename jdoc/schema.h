#pragma once

#include <string>
#include <vector>

#include "codec.h"
#include "document.h"
#include "error.h"
#include "value.h"

namespace jdoc {

/** One rule a document broke, as reported by a schema engine. */
struct SchemaViolation {
    Value       invalid_value;
    std::string property_path;
    std::string rule_path;
    std::string message;
};

/**
 * Narrow interface to a JSON-Schema engine. jdoc ships no engine; an
 * application adapts the one it uses.
 */
class SchemaValidator {
public:
    virtual ~SchemaValidator() = default;

    /** Return every violation of schema by instance; empty when valid. */
    virtual std::vector<SchemaViolation> validate(const Value& schema, const Value& instance) const = 0;
};

/**
 * Validate doc against a JSON schema given as bytes.
 *
 * @throws Error(decode_failed) if the schema is not valid JSON.
 * @throws Error(schema_violation) listing every violation, one per line.
 */
inline void validate_schema(const Document& doc, const Bytes& schema, const SchemaValidator& validator) {
    Value parsed = from_json_bytes(schema);
    auto violations = validator.validate(parsed, doc.value());
    if (violations.empty()) {
        return;
    }

    std::string message;
    for (const auto& v : violations) {
        if (!message.empty()) message += '\n';
        message += "InvalidValue: " + format_value(v.invalid_value) +
                   ", PropertyPath: " + v.property_path +
                   ", RulePath: " + v.rule_path +
                   ", Message: " + v.message;
    }
    throw Error(error_kind::schema_violation, message, {}, {}, {}, doc.str());
}

} // namespace jdoc
