#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "daxmcp/json/fast_json.hpp"

using namespace daxmcp;
using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Value conversion
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("fast_parse handles all JSON types", "[json][simdjson]") {
    auto result = fast_parse(R"({
        "string": "hello",
        "integer": 42,
        "negative": -17,
        "float": 3.14159,
        "bool_true": true,
        "bool_false": false,
        "null_value": null,
        "array": [1, "two", null],
        "object": {"nested": "value"}
    })");

    REQUIRE(result.has_value());

    const auto& j = *result;
    REQUIRE(j["string"] == "hello");
    REQUIRE(j["integer"] == 42);
    REQUIRE(j["integer"].is_number_integer());
    REQUIRE(j["negative"] == -17);
    REQUIRE_THAT(j["float"].get<double>(), Catch::Matchers::WithinRel(3.14159, 0.00001));
    REQUIRE(j["bool_true"] == true);
    REQUIRE(j["bool_false"] == false);
    REQUIRE(j["null_value"].is_null());
    REQUIRE(j["array"].size() == 3);
    REQUIRE(j["array"][2].is_null());
    REQUIRE(j["object"]["nested"] == "value");
}

TEST_CASE("fast_parse keeps integer range", "[json][simdjson]") {
    auto result = fast_parse(R"({"big": 9223372036854775807, "unsigned": 18446744073709551615})");

    REQUIRE(result.has_value());
    REQUIRE((*result)["big"].get<std::int64_t>() == 9223372036854775807LL);
    REQUIRE((*result)["unsigned"].get<std::uint64_t>() == 18446744073709551615ULL);
}

TEST_CASE("fast_parse decodes escapes and unicode", "[json][simdjson]") {
    auto result = fast_parse(R"({"dax": "EVALUATE\n\tVALUES ( 'Date'[Year] )", "unicode": "Hello 世界"})");

    REQUIRE(result.has_value());
    REQUIRE((*result)["dax"] == "EVALUATE\n\tVALUES ( 'Date'[Year] )");
    REQUIRE((*result)["unicode"] == "Hello 世界");
}

TEST_CASE("fast_parse handles empty containers", "[json][simdjson]") {
    auto object = fast_parse("{}");
    REQUIRE(object.has_value());
    REQUIRE(object->is_object());
    REQUIRE(object->empty());

    auto array = fast_parse("[]");
    REQUIRE(array.has_value());
    REQUIRE(array->is_array());
    REQUIRE(array->empty());
}

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("fast_parse rejects malformed input", "[json][simdjson]") {
    SECTION("missing closing brace") {
        auto result = fast_parse(R"({"jsonrpc": "2.0", "id": 1)");
        REQUIRE(result.has_value() == false);
        REQUIRE(result.error().message.empty() == false);
    }

    SECTION("truncated string") {
        REQUIRE(fast_parse(R"({"key": "val)").has_value() == false);
    }

    SECTION("empty input") {
        REQUIRE(fast_parse("").has_value() == false);
    }

    SECTION("whitespace only") {
        REQUIRE(fast_parse("   \t  ").has_value() == false);
    }
}

TEST_CASE("fast_parse rejects a second document on the same line", "[json][simdjson]") {
    auto result = fast_parse(R"({"a": 1} {"b": 2})");

    REQUIRE(result.has_value() == false);
    REQUIRE(result.error().message == "Trailing content after JSON document");
}

TEST_CASE("FastJsonParser enforces the nesting limit", "[json][simdjson]") {
    FastJsonParser parser(FastJsonConfig{2});

    REQUIRE(parser.parse(R"({"a": {"b": 1}})").has_value());

    auto too_deep = parser.parse(R"({"a": {"b": {"c": 1}}})");
    REQUIRE(too_deep.has_value() == false);
    REQUIRE(too_deep.error().message.find("nesting depth") != std::string::npos);
}

// ─────────────────────────────────────────────────────────────────────────────
// Real-world payloads
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("fast_parse handles a tools/call request line", "[json][simdjson][jsonrpc]") {
    auto result = fast_parse(
        R"({"jsonrpc":"2.0","id":"a1","method":"tools/call","params":{"name":"format_dax","arguments":{"dax":"SUM(Sales[Amount])","options":{"maxLineLength":"ShortLine"}}}})");

    REQUIRE(result.has_value());

    const auto& j = *result;
    REQUIRE(j["id"] == "a1");
    REQUIRE(j["params"]["arguments"]["dax"] == "SUM(Sales[Amount])");
    REQUIRE(j["params"]["arguments"]["options"]["maxLineLength"] == "ShortLine");
}

TEST_CASE("fast_parse handles a formatter service reply", "[json][simdjson][formatter]") {
    auto result = fast_parse(R"([
        {"formatted": "SUM ( Sales[Amount] )", "errors": []},
        {"formatted": "", "errors": [{"line": 0, "column": 4, "message": "Syntax error"}]}
    ])");

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);
    REQUIRE((*result)[1]["errors"][0]["column"] == 4);
}

TEST_CASE("FastJsonParser can be reused", "[json][simdjson]") {
    FastJsonParser parser;

    auto first = parser.parse(R"({"first": 1})");
    REQUIRE(first.has_value());
    REQUIRE((*first)["first"] == 1);

    REQUIRE(parser.parse("{").has_value() == false);

    auto third = parser.parse(R"({"third": 3})");
    REQUIRE(third.has_value());
    REQUIRE((*third)["third"] == 3);
}
