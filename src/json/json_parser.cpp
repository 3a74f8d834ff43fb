//! # JSON Parser Implementation
//!
//! The parser reads one token, dispatches on its kind, and recurses into
//! `parse_object` / `parse_array` for containers. It never looks ahead: each
//! decision is made on the token just read.
//!
//! ## Grammar
//!
//! ```text
//! value  = object | array | String | Number | Boolean | Null
//! object = '{' '}' | '{' String ':' value (',' String ':' value)* '}'
//! array  = '[' ']' | '[' value (',' value)* ']'
//! ```
//!
//! A trailing comma (`[1,]`, `{"a":1,}`) fails with `UnexpectedToken`
//! because the token after the comma is not a value or a key.

#include "json/json_parser.hpp"

#include "log/log.hpp"

namespace jcodec::json {

namespace {

auto reject(JsonError error) -> JsonError {
    JCODEC_LOG_DEBUG("json.parser", error.to_string());
    return error;
}

} // namespace

// ============================================================================
// JsonParser Implementation
// ============================================================================

JsonParser::JsonParser(std::string_view input, ParseOptions options)
    : tokenizer_(input), options_(options) {}

auto JsonParser::unexpected(const JsonToken& token) const -> JsonError {
    return reject(
        JsonError::unexpected_token(describe(token), token.line, token.column, token.offset));
}

/// Parses the top-level value and, in strict mode, checks that only
/// whitespace follows it.
auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto first = tokenizer_.next_token();
    if (is_err(first)) {
        return unwrap_err(first);
    }

    auto result = parse_value(std::move(unwrap(first)));
    if (is_err(result) || options_.allow_trailing) {
        return result;
    }

    if (!tokenizer_.at_end()) {
        auto extra = tokenizer_.next_token();
        if (is_err(extra)) {
            return unwrap_err(extra);
        }
        return unexpected(unwrap(extra));
    }

    return result;
}

auto JsonParser::parse_value(JsonToken token) -> Result<JsonValue, JsonError> {
    switch (token.kind) {
    case JsonTokenKind::Null:
        return JsonValue();

    case JsonTokenKind::Boolean:
        return JsonValue(token.boolean);

    case JsonTokenKind::Number:
        return JsonValue(token.number);

    case JsonTokenKind::String:
        return JsonValue(std::move(token.text));

    case JsonTokenKind::LBrace:
    case JsonTokenKind::LBracket: {
        if (depth_ >= options_.max_depth) {
            return reject(JsonError::parsing_failed("maximum nesting depth exceeded", token.line,
                                                    token.column, token.offset));
        }
        ++depth_;
        auto result =
            token.kind == JsonTokenKind::LBrace ? parse_object() : parse_array();
        --depth_;
        return result;
    }

    default:
        return unexpected(token);
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    JsonObject obj;

    auto next = tokenizer_.next_token();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    if (unwrap(next).kind == JsonTokenKind::RBrace) {
        return JsonValue(std::move(obj));
    }

    while (true) {
        // Expect string key
        JsonToken& key_token = unwrap(next);
        if (key_token.kind != JsonTokenKind::String) {
            return unexpected(key_token);
        }
        std::string key = std::move(key_token.text);

        // Expect colon
        auto colon = tokenizer_.next_token();
        if (is_err(colon)) {
            return unwrap_err(colon);
        }
        if (unwrap(colon).kind != JsonTokenKind::Colon) {
            return unexpected(unwrap(colon));
        }

        // Parse value
        auto value_token = tokenizer_.next_token();
        if (is_err(value_token)) {
            return unwrap_err(value_token);
        }
        auto value_result = parse_value(std::move(unwrap(value_token)));
        if (is_err(value_result)) {
            return value_result;
        }

        auto [it, inserted] = obj.try_emplace(key);
        if (!inserted) {
            JCODEC_LOG_TRACE("json.parser", "duplicate key '" << key << "' overwritten");
        }
        it->second = std::move(unwrap(value_result));

        // Check for comma or end
        auto separator = tokenizer_.next_token();
        if (is_err(separator)) {
            return unwrap_err(separator);
        }
        const JsonToken& sep = unwrap(separator);
        if (sep.kind == JsonTokenKind::RBrace) {
            return JsonValue(std::move(obj));
        }
        if (sep.kind != JsonTokenKind::Comma) {
            return unexpected(sep);
        }

        next = tokenizer_.next_token();
        if (is_err(next)) {
            return unwrap_err(next);
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    JsonArray arr;

    auto next = tokenizer_.next_token();
    if (is_err(next)) {
        return unwrap_err(next);
    }
    if (unwrap(next).kind == JsonTokenKind::RBracket) {
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value_result = parse_value(std::move(unwrap(next)));
        if (is_err(value_result)) {
            return value_result;
        }
        arr.push_back(std::move(unwrap(value_result)));

        // Check for comma or end
        auto separator = tokenizer_.next_token();
        if (is_err(separator)) {
            return unwrap_err(separator);
        }
        const JsonToken& sep = unwrap(separator);
        if (sep.kind == JsonTokenKind::RBracket) {
            return JsonValue(std::move(arr));
        }
        if (sep.kind != JsonTokenKind::Comma) {
            return unexpected(sep);
        }

        next = tokenizer_.next_token();
        if (is_err(next)) {
            return unwrap_err(next);
        }
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    return parse_json(input, ParseOptions{});
}

auto parse_json(std::string_view input, const ParseOptions& options)
    -> Result<JsonValue, JsonError> {
    JsonParser parser(input, options);
    return parser.parse();
}

} // namespace jcodec::json
