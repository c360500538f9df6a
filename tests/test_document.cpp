#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

#include "helpers.h"
#include "jdoc/document.h"

using jdoc::Document;
using jdoc::Value;

// -----------------------------------------------------------------------
// Tests for Document construction, serialization and ownership
// (jdoc/document.h)
// -----------------------------------------------------------------------

static std::string as_text(const jdoc::Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

TEST_CASE("Document: default document is an empty object", "[document]")
{
    Document doc;
    REQUIRE(doc.empty());
    REQUIRE(doc.size() == 0u);
    REQUIRE(doc.str() == "{}");
}

TEST_CASE("Document: from_json and from_bytes", "[document]")
{
    auto doc = Document::from_json(R"({"name": "Alice", "age": 30})");
    REQUIRE(doc.size() == 2u);
    REQUIRE(doc.get("name") == "Alice");

    std::string text = R"({"k": "v"})";
    auto doc2 = Document::from_bytes(jdoc::Bytes(text.begin(), text.end()));
    REQUIRE(doc2.get("k") == "v");
}

TEST_CASE("Document: top level must be an object", "[document]")
{
    CHECK(thrown_kind([] { Document::from_json("[1, 2]"); }) == jdoc::error_kind::unsupported_type);
    CHECK(thrown_kind([] { Document::from_json("\"text\""); }) == jdoc::error_kind::unsupported_type);
    CHECK(thrown_kind([] { Document::from_value(Value(3)); }) == jdoc::error_kind::unsupported_type);
    CHECK(thrown_kind([] { Document::from_json("{"); }) == jdoc::error_kind::decode_failed);
}

TEST_CASE("Document: from_yaml", "[document]")
{
    auto doc = Document::from_yaml(std::string("docType: ticket\nxxx_version: 2\ntags:\n  - a\n  - b\n"));
    REQUIRE(doc.get("docType") == "ticket");
    REQUIRE(doc.get("xxx_version") == 2);
    REQUIRE(doc.get("tags").size() == 2u);

    CHECK(thrown_kind([] { Document::from_yaml(std::string("- just\n- a list\n")); }) ==
          jdoc::error_kind::unsupported_type);
}

TEST_CASE("Document: from_stream", "[document]")
{
    std::istringstream in(R"({"a": [1, 2, 3]})");
    auto doc = Document::from_stream(in);
    REQUIRE(doc.get("a").size() == 3u);
}

TEST_CASE("Document: from_keys builds a key set", "[document]")
{
    auto set = Document::from_keys({"read", "write", "read"});
    REQUIRE(set.size() == 2u);
    REQUIRE(set.has("read"));
    REQUIRE(set.has_all({"read", "write"}));
    REQUIRE_FALSE(set.has_all({"read", "delete"}));
    REQUIRE(set.get("write").is_null());
}

TEST_CASE("Document: from_key_values requires strings", "[document]")
{
    auto set = Document::from_key_values(Value::parse(R"(["a", "b"])").get<jdoc::Array>());
    REQUIRE(set.keys() == std::vector<std::string>{"a", "b"});

    try {
        Document::from_key_values(Value::parse(R"(["a", 1])").get<jdoc::Array>());
        FAIL("expected unsupported_type");
    } catch (const jdoc::Error& e) {
        CHECK(e.kind() == jdoc::error_kind::unsupported_type);
        CHECK(e.path() == "1");
        CHECK(std::string(e.what()) == "input slice key with index: 1 is not a STRING but: number");
    }
}

TEST_CASE("Document: normalize accepts objects and JSON bytes only", "[document]")
{
    Document from_object = jdoc::normalize(Value::parse(R"({"a": 1})"));
    REQUIRE(from_object.get("a") == 1);

    std::string text = R"({"b": 2})";
    Document from_binary = jdoc::normalize(Value::binary(std::vector<std::uint8_t>(text.begin(), text.end())));
    REQUIRE(from_binary.get("b") == 2);

    Document same = jdoc::normalize(from_object);
    REQUIRE(same == from_object);

    try {
        jdoc::normalize(Value::parse("[1]"));
        FAIL("expected unsupported_type");
    } catch (const jdoc::Error& e) {
        CHECK(e.kind() == jdoc::error_kind::unsupported_type);
        CHECK(e.actual() == "array");
    }
}

TEST_CASE("Document: bytes, str and wrapped_result_bytes", "[document]")
{
    auto doc = Document::from_json(R"({"z": 1, "a": {"n": null}})");
    CHECK(as_text(doc.bytes()) == R"({"a":{"n":null},"z":1})");
    CHECK(doc.str() == R"({"a":{"n":null},"z":1})");
    CHECK(as_text(doc.wrapped_result_bytes()) == R"({"result":{"a":{"n":null},"z":1}})");
}

TEST_CASE("Document: yaml output decodes back to an equal document", "[document]")
{
    auto doc = Document::from_json(R"({"name": "x", "list": [1, 2], "nested": {"ok": true}})");
    REQUIRE(Document::from_yaml(doc.yaml()) == doc);
}

TEST_CASE("Document: keys lists the top level", "[document]")
{
    auto doc = Document::from_json(R"({"b": 1, "a": {"c": 2}})");
    REQUIRE(doc.keys() == std::vector<std::string>{"a", "b"});
    REQUIRE(doc.has("a"));
    REQUIRE_FALSE(doc.has("c"));
}

TEST_CASE("Document: copy is equal but independent", "[document]")
{
    auto original = Document::from_json(R"({"a": {"b": 1}, "list": [1, 2.5, "x"]})");
    Document copy = original.copy();
    REQUIRE(copy == original);

    copy.set("/a/b", 2);
    copy.set("/list/0", "changed");
    copy.erase("/list/2");

    CHECK(original.resolve("/a/b") == 1);
    CHECK(original.resolve("/list/0") == 1);
    CHECK(original.resolve("/list").size() == 3u);
    CHECK(copy != original);
}

TEST_CASE("Document: sub-documents handed out are copies", "[document]")
{
    auto doc = Document::from_json(R"({"nested": {"v": "x"}})");
    Document nested = doc.get_as<Document>("nested");
    nested.set("/v", "y");

    CHECK(doc.resolve("/nested/v") == "x");
    CHECK(nested.get("v") == "y");
}

TEST_CASE("Document: storing a document copies it", "[document]")
{
    Document child = Document::from_json(R"({"v": 1})");
    Document parent;
    parent.set("/child", child);
    child.set("/v", 2);

    CHECK(parent.resolve("/child/v") == 1);
}
