//! # JSON Generator Tests
//!
//! Tests for `JsonGenerator`, `stringify` and `stringify_pretty`: scalar
//! text, string escaping, number formatting, compact and indented layout.

#include "common.hpp"

#include "json/json.hpp"
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <sstream>

using namespace jcodec;
using namespace jcodec::json;

namespace {

/// Builds `{"a":"abc","b":123,"more":{"phone":null}}`.
auto contact() -> JsonValue {
    auto more = json_object();
    more.set("phone", json_null());

    auto obj = json_object();
    obj.set("a", JsonValue("abc"));
    obj.set("b", JsonValue(123));
    obj.set("more", std::move(more));
    return obj;
}

} // namespace

// ============================================================================
// Scalars
// ============================================================================

TEST(JsonGeneratorTest, Literals) {
    EXPECT_EQ(stringify(json_null()), "null");
    EXPECT_EQ(stringify(JsonValue(true)), "true");
    EXPECT_EQ(stringify(JsonValue(false)), "false");
}

TEST(JsonGeneratorTest, IntegralNumbersHaveNoFraction) {
    EXPECT_EQ(stringify(JsonValue(200)), "200");
    EXPECT_EQ(stringify(JsonValue(0)), "0");
    EXPECT_EQ(stringify(JsonValue(-12300.0)), "-12300");
}

TEST(JsonGeneratorTest, FractionalNumbersUseShortestFixedText) {
    EXPECT_EQ(stringify(JsonValue(0.000123)), "0.000123");
    EXPECT_EQ(stringify(JsonValue(0.1)), "0.1");
    EXPECT_EQ(stringify(JsonValue(-2.5)), "-2.5");
    EXPECT_EQ(stringify(JsonValue(1e21)), "1000000000000000000000");
}

TEST(JsonGeneratorTest, NonFiniteNumbersBecomeNull) {
    EXPECT_EQ(stringify(JsonValue(std::numeric_limits<double>::quiet_NaN())), "null");
    EXPECT_EQ(stringify(JsonValue(std::numeric_limits<double>::infinity())), "null");
    EXPECT_EQ(stringify(JsonValue(-std::numeric_limits<double>::infinity())), "null");
}

TEST(JsonGeneratorTest, FormatNumberMatchesWrittenText) {
    EXPECT_EQ(format_number(42.0), "42");
    EXPECT_EQ(format_number(3.25), "3.25");
}

// ============================================================================
// String Escaping
// ============================================================================

TEST(JsonGeneratorTest, ShortEscapes) {
    EXPECT_EQ(stringify(JsonValue("\r\n\t\b\f\\\"")), R"("\r\n\t\b\f\\\"")");
}

TEST(JsonGeneratorTest, SlashIsNotEscaped) {
    EXPECT_EQ(stringify(JsonValue("a/b")), R"("a/b")");
}

TEST(JsonGeneratorTest, NonAsciiEmittedVerbatim) {
    EXPECT_EQ(stringify(JsonValue("caf\xC3\xA9 \xF0\x9D\x84\x9E")),
              "\"caf\xC3\xA9 \xF0\x9D\x84\x9E\"");
}

TEST(JsonGeneratorTest, OtherControlBytesEmittedVerbatim) {
    EXPECT_EQ(stringify(JsonValue("\x01")), "\"\x01\"");
}

TEST(JsonGeneratorTest, KeysAreEscaped) {
    auto obj = json_object();
    obj.set("a\"b", JsonValue(1));
    EXPECT_EQ(stringify(obj), R"({"a\"b":1})");
}

// ============================================================================
// Compact Layout
// ============================================================================

TEST(JsonGeneratorTest, CompactArray) {
    auto arr = json_array();
    arr.push(JsonValue(1));
    arr.push(JsonValue("x"));
    arr.push(json_null());
    EXPECT_EQ(stringify(arr), R"([1,"x",null])");
}

TEST(JsonGeneratorTest, CompactObjectSortsKeys) {
    auto obj = json_object();
    obj.set("success", JsonValue(true));
    obj.set("code", JsonValue(200));

    auto payload = json_object();
    auto features = json_array();
    features.push(JsonValue("awesfome   fasfaf  "));
    features.push(JsonValue("easyAPI  "));
    features.push(JsonValue("lowLearningCurve"));
    payload.set("features", std::move(features));
    obj.set("payload", std::move(payload));

    EXPECT_EQ(stringify(obj), R"({"code":200,"payload":{"features":["awesfome   fasfaf  ",)"
                              R"("easyAPI  ","lowLearningCurve"]},"success":true})");
}

TEST(JsonGeneratorTest, EmptyContainers) {
    EXPECT_EQ(stringify(json_array()), "[]");
    EXPECT_EQ(stringify(json_object()), "{}");
    EXPECT_EQ(stringify_pretty(json_array()), "[]");
    EXPECT_EQ(stringify_pretty(json_object()), "{}");

    auto nested = json_object();
    nested.set("empty", json_array());
    EXPECT_EQ(stringify_pretty(nested), "{\n    \"empty\": []\n}");
}

// ============================================================================
// Pretty Layout
// ============================================================================

TEST(JsonGeneratorTest, PrettyObject) {
    EXPECT_EQ(stringify_pretty(contact()), "{\n"
                                           "    \"a\": \"abc\",\n"
                                           "    \"b\": 123,\n"
                                           "    \"more\": {\n"
                                           "        \"phone\": null\n"
                                           "    }\n"
                                           "}");
}

TEST(JsonGeneratorTest, PrettyArrayKeepsSpaceAfterComma) {
    auto arr = json_array();
    arr.push(JsonValue(1));
    arr.push(JsonValue(2));
    EXPECT_EQ(stringify_pretty(arr), "[\n    1, \n    2\n]");
}

TEST(JsonGeneratorTest, PrettyIndentWidth) {
    auto arr = json_array();
    auto inner = json_array();
    inner.push(JsonValue(true));
    arr.push(std::move(inner));
    EXPECT_EQ(stringify_pretty(arr, 2), "[\n  [\n    true\n  ]\n]");
}

TEST(JsonGeneratorTest, PrettyZeroIndentStillBreaksLines) {
    auto arr = json_array();
    arr.push(JsonValue(1));
    EXPECT_EQ(stringify_pretty(arr, 0), "[\n1\n]");
}

TEST(JsonGeneratorTest, DumpMethodsDelegate) {
    auto obj = contact();
    EXPECT_EQ(obj.dump(), stringify(obj));
    EXPECT_EQ(obj.dump_pretty(2), stringify_pretty(obj, 2));
}

// ============================================================================
// Generator Instance and Streams
// ============================================================================

TEST(JsonGeneratorTest, GeneratorAccumulatesAndTakes) {
    JsonGenerator gen;
    gen.write(JsonValue(1));
    gen.write(JsonValue(2));
    EXPECT_EQ(gen.value(), "12");

    std::string taken = gen.take();
    EXPECT_EQ(taken, "12");
    EXPECT_TRUE(gen.value().empty());
}

TEST(JsonGeneratorTest, WriteJsonToStream) {
    std::ostringstream compact;
    write_json(compact, contact());
    EXPECT_EQ(compact.str(), R"({"a":"abc","b":123,"more":{"phone":null}})");

    std::ostringstream pretty;
    write_json(pretty, contact(), GeneratorOptions{false, 4});
    EXPECT_EQ(pretty.str(), stringify_pretty(contact()));
}
