//! # JSON Round Trip Tests
//!
//! Chains the parser and the generator: parse-after-stringify identity,
//! idempotent minification, deterministic key order and escape round trips.

#include "common.hpp"

#include "json/json.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace jcodec;
using namespace jcodec::json;

namespace {

/// A document touching every variant, nested containers and escapes.
auto sample_document() -> JsonValue {
    auto tags = json_array();
    tags.push(JsonValue("fast"));
    tags.push(JsonValue("line\nbreak"));
    tags.push(JsonValue("clef \xF0\x9D\x84\x9E"));

    auto limits = json_object();
    limits.set("max", JsonValue(1000));
    limits.set("ratio", JsonValue(0.25));
    limits.set("offset", JsonValue(-12300));

    auto doc = json_object();
    doc.set("name", JsonValue("codec \"quoted\" \\ path"));
    doc.set("enabled", JsonValue(true));
    doc.set("missing", json_null());
    doc.set("tags", std::move(tags));
    doc.set("limits", std::move(limits));
    doc.set("empty_list", json_array());
    doc.set("empty_map", json_object());
    return doc;
}

auto parse_ok(std::string_view text) -> JsonValue {
    auto result = parse_json(text);
    EXPECT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    if (is_err(result)) {
        return JsonValue();
    }
    return std::move(unwrap(result));
}

} // namespace

// ============================================================================
// Round Trip
// ============================================================================

TEST(JsonRoundTripTest, ParseOfStringifyIsIdentity) {
    auto doc = sample_document();
    EXPECT_EQ(parse_ok(stringify(doc)), doc);
}

TEST(JsonRoundTripTest, ParseOfPrettyIsIdentity) {
    auto doc = sample_document();
    EXPECT_EQ(parse_ok(stringify_pretty(doc)), doc);
    EXPECT_EQ(parse_ok(stringify_pretty(doc, 2)), doc);
}

TEST(JsonRoundTripTest, ScalarsRoundTrip) {
    std::vector<JsonValue> values;
    values.push_back(json_null());
    values.push_back(JsonValue(false));
    values.push_back(JsonValue(0.1));
    values.push_back(JsonValue(-1e-7));
    values.push_back(JsonValue(123456789012.0));
    values.push_back(JsonValue(""));

    for (const auto& v : values) {
        EXPECT_EQ(parse_ok(stringify(v)), v) << stringify(v);
    }
}

TEST(JsonRoundTripTest, MinificationIsIdempotent) {
    const char* inputs[] = {
        R"({ "b" : [1, 2.5, {"z": null, "a": true}], "a": "x" })",
        "[ ]",
        R"("\u00e9\t")",
        "  -0.5e1 ",
    };
    for (const char* input : inputs) {
        std::string once = stringify(parse_ok(input));
        std::string twice = stringify(parse_ok(once));
        EXPECT_EQ(once, twice) << input;
    }
}

TEST(JsonRoundTripTest, EscapesRoundTrip) {
    std::string raw = "\r\n\t\b\f\\\"";
    ASSERT_EQ(raw.size(), 7u);

    std::string text = stringify(JsonValue(raw));
    EXPECT_EQ(text, R"("\r\n\t\b\f\\\"")");
    EXPECT_EQ(parse_ok(text).as_string(), raw);
}

TEST(JsonRoundTripTest, SurrogateEscapeRoundTripsAsUtf8) {
    auto value = parse_ok(R"("\uD834\uDD1E")");
    EXPECT_EQ(stringify(value), "\"\xF0\x9D\x84\x9E\"");
    EXPECT_EQ(parse_ok(stringify(value)), value);
}

// ============================================================================
// Determinism
// ============================================================================

TEST(JsonRoundTripTest, InsertionOrderDoesNotMatter) {
    auto a = json_object();
    a.set("one", JsonValue(1));
    a.set("two", JsonValue(2));
    a.set("three", JsonValue(3));

    auto b = json_object();
    b.set("three", JsonValue(3));
    b.set("one", JsonValue(1));
    b.set("two", JsonValue(2));

    EXPECT_EQ(stringify(a), stringify(b));
    EXPECT_EQ(stringify(a), R"({"one":1,"three":3,"two":2})");
}

TEST(JsonRoundTripTest, SortedDocumentIsByteIdentical) {
    const std::string input = R"({"code":200,"payload":{"features":["a","b"]},"success":true})";
    EXPECT_EQ(stringify(parse_ok(input)), input);
}

TEST(JsonRoundTripTest, UnsortedInputComesBackSorted) {
    auto value = parse_ok(R"({"code":200,"success":true,"payload":{"features":["a","b"]}})");
    EXPECT_EQ(stringify(value), R"({"code":200,"payload":{"features":["a","b"]},"success":true})");
}
