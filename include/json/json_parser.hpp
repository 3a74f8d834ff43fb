//! # JSON Parser
//!
//! This module provides the recursive descent parser that builds a
//! `JsonValue` tree from the tokens of a `JsonTokenizer`.
//!
//! ## Features
//!
//! - **Fail-fast**: The first error aborts the parse; no partial value is
//!   returned
//! - **Strict by default**: Non-whitespace after the top-level value is an
//!   error unless `ParseOptions::allow_trailing` is set
//! - **Depth limiting**: Nesting beyond `ParseOptions::max_depth` is rejected
//! - **Duplicate keys**: The last occurrence of a key wins
//!
//! ## Example
//!
//! ```cpp
//! #include "json/json_parser.hpp"
//! using namespace jcodec::json;
//!
//! auto result = parse_json(R"({"name": "Alice", "age": 30})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     std::cout << json.get("name")->as_string() << std::endl;
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_tokenizer.hpp"
#include "json/json_value.hpp"

#include <cstddef>
#include <string_view>

namespace jcodec::json {

/// Options controlling how much input the parser accepts.
struct ParseOptions {
    /// Return after the first complete value, ignoring what follows it.
    bool allow_trailing = false;

    /// Maximum number of nested arrays and objects.
    size_t max_depth = 1000;
};

/// Recursive descent JSON parser.
///
/// Each parser owns its tokenizer; a parser is used for one input.
class JsonParser {
public:
    /// Creates a parser for the given input.
    ///
    /// # Arguments
    ///
    /// * `input` - The JSON text; it must outlive the parser
    /// * `options` - Trailing-content and depth limits
    explicit JsonParser(std::string_view input, ParseOptions options = {});

    /// Parses one JSON value.
    ///
    /// # Errors
    ///
    /// - `UnexpectedToken` for a token that is invalid at its position, or
    ///   trailing content in strict mode
    /// - `ParsingFailed` when the nesting limit is exceeded
    /// - Any tokenizer error
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    JsonTokenizer tokenizer_;
    ParseOptions options_;
    size_t depth_ = 0;

    /// Builds a value starting with the already-read `token`.
    auto parse_value(JsonToken token) -> Result<JsonValue, JsonError>;

    /// Parses the members of an object whose `{` was consumed.
    auto parse_object() -> Result<JsonValue, JsonError>;

    /// Parses the elements of an array whose `[` was consumed.
    auto parse_array() -> Result<JsonValue, JsonError>;

    /// Creates an `UnexpectedToken` error for `token`.
    [[nodiscard]] auto unexpected(const JsonToken& token) const -> JsonError;
};

/// Parses a JSON string and returns a `JsonValue`.
///
/// # Example
///
/// ```cpp
/// auto result = parse_json("[1, 2, 3]");
/// assert(is_ok(result));
/// assert(unwrap(result).size() == 3);
/// ```
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

/// Parses a JSON string with explicit options.
[[nodiscard]] auto parse_json(std::string_view input, const ParseOptions& options)
    -> Result<JsonValue, JsonError>;

} // namespace jcodec::json
