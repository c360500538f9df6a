#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include "helpers.h"
#include "jdoc/schema.h"

using jdoc::Document;
using jdoc::Value;

namespace {

// Checks the "required" keyword only; enough to drive validate_schema.
class RequiredOnlyValidator : public jdoc::SchemaValidator {
public:
    std::vector<jdoc::SchemaViolation> validate(const Value& schema, const Value& instance) const override {
        std::vector<jdoc::SchemaViolation> out;
        auto it = schema.find("required");
        if (it == schema.end()) return out;
        for (std::size_t i = 0; i < it->size(); ++i) {
            const auto& key = (*it)[i].get_ref<const std::string&>();
            if (!instance.contains(key)) {
                out.push_back({instance, "/", "/required/" + std::to_string(i), key + " is required"});
            }
        }
        return out;
    }
};

jdoc::Bytes bytes_of(const std::string& s) {
    return jdoc::Bytes(s.begin(), s.end());
}

} // namespace

// -----------------------------------------------------------------------
// Tests for schema validation through an adapter (jdoc/schema.h)
// -----------------------------------------------------------------------

TEST_CASE("Schema: a valid document passes", "[schema]")
{
    RequiredOnlyValidator validator;
    auto doc = Document::from_json(R"({"docType": "t", "xxx_version": 1})");
    REQUIRE_NOTHROW(jdoc::validate_schema(doc, bytes_of(R"({"required": ["docType", "xxx_version"]})"), validator));
}

TEST_CASE("Schema: every violation is reported on its own line", "[schema]")
{
    RequiredOnlyValidator validator;
    auto doc = Document::from_json(R"({"x": 1})");
    try {
        jdoc::validate_schema(doc, bytes_of(R"({"required": ["a", "b"]})"), validator);
        FAIL("expected schema_violation");
    } catch (const jdoc::Error& e) {
        CHECK(e.kind() == jdoc::error_kind::schema_violation);
        CHECK(std::string(e.what()) ==
              "InvalidValue: map[x:1], PropertyPath: /, RulePath: /required/0, Message: a is required\n"
              "InvalidValue: map[x:1], PropertyPath: /, RulePath: /required/1, Message: b is required");
        CHECK(e.snapshot() == R"({"x":1})");
    }
}

TEST_CASE("Schema: schema bytes must be JSON", "[schema]")
{
    RequiredOnlyValidator validator;
    CHECK(thrown_kind([&] { jdoc::validate_schema(Document(), bytes_of("not json"), validator); }) ==
          jdoc::error_kind::decode_failed);
}
