//! # JSON Tokenizer
//!
//! This module provides the lexical scanner of the codec. It reads raw
//! UTF-8 text and yields one token per call, decoding escape sequences and
//! number literals on the way.
//!
//! ## Token Types
//!
//! | Token | Description | Example |
//! |-------|-------------|---------|
//! | `Comma` | Comma | `,` |
//! | `Colon` | Colon | `:` |
//! | `LBracket` | Left bracket | `[` |
//! | `RBracket` | Right bracket | `]` |
//! | `LBrace` | Left brace | `{` |
//! | `RBrace` | Right brace | `}` |
//! | `String` | Quoted string | `"hello"` |
//! | `Number` | Any number | `42`, `-1.5e3` |
//! | `Boolean` | `true` or `false` | `true` |
//! | `Null` | Null value | `null` |
//!
//! ## Example
//!
//! ```cpp
//! JsonTokenizer tokenizer(R"({"key": 42})");
//! while (!tokenizer.at_end()) {
//!     auto token = tokenizer.next_token();
//!     if (is_err(token)) break;
//!     std::cout << describe(unwrap(token)) << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace jcodec::json {

/// Token types for the JSON tokenizer.
enum class JsonTokenKind : uint8_t {
    Comma,    ///< `,` - Element separator
    Colon,    ///< `:` - Key-value separator
    LBracket, ///< `[` - Start of array
    RBracket, ///< `]` - End of array
    LBrace,   ///< `{` - Start of object
    RBrace,   ///< `}` - End of object
    String,   ///< `"..."` - String literal
    Number,   ///< Number literal
    Boolean,  ///< `true` or `false`
    Null      ///< `null`
};

/// A token produced by the JSON tokenizer.
///
/// Only the payload field matching `kind` is meaningful: `text` for
/// `String`, `number` for `Number`, `boolean` for `Boolean`.
struct JsonToken {
    JsonTokenKind kind = JsonTokenKind::Null;

    /// For `String` tokens: the unescaped content.
    std::string text;

    /// For `Number` tokens: the parsed value.
    double number = 0.0;

    /// For `Boolean` tokens: the literal value.
    bool boolean = false;

    /// Line number where this token starts (1-based).
    size_t line = 1;

    /// Column number where this token starts (1-based).
    size_t column = 1;

    /// Byte offset where this token starts.
    size_t offset = 0;
};

/// Renders a token for diagnostics (e.g., `','`, `string "abc"`, `number 12`).
[[nodiscard]] auto describe(const JsonToken& token) -> std::string;

/// Lexical scanner over an in-memory JSON text.
///
/// The tokenizer only looks at the bytes of the lexeme it is reading; it
/// keeps no token lookahead. A scratch buffer is reused across string and
/// number reads.
class JsonTokenizer {
public:
    /// Creates a tokenizer over `input`. The text must outlive the tokenizer.
    explicit JsonTokenizer(std::string_view input);

    /// Returns the next token.
    ///
    /// # Errors
    ///
    /// - `UnexpectedEndOfJson` if input is exhausted before a complete token
    /// - `UnexpectedCharacter` for a byte that cannot begin a token or escape,
    ///   or a non-hex digit inside `\uXXXX`
    /// - `UnexpectedToken` for a malformed `true`/`false`/`null` keyword
    /// - `InvalidNumber` for a malformed number lexeme
    /// - `ParsingFailed` for a lone surrogate or invalid UTF-8 in a string
    [[nodiscard]] auto next_token() -> Result<JsonToken, JsonError>;

    /// Skips whitespace and returns `true` if no input remains.
    [[nodiscard]] auto at_end() -> bool;

    /// Current line (1-based).
    [[nodiscard]] auto line() const -> size_t { return line_; }

    /// Current column (1-based).
    [[nodiscard]] auto column() const -> size_t { return column_; }

    /// Current byte offset.
    [[nodiscard]] auto offset() const -> size_t { return pos_; }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    std::string buffer_;

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto exhausted() const -> bool { return pos_ >= input_.size(); }
    auto advance() -> char;
    void skip_whitespace();

    auto make_token(JsonTokenKind kind, size_t start_pos, size_t start_line,
                    size_t start_col) const -> JsonToken;
    [[nodiscard]] auto end_error() const -> JsonError;
    [[nodiscard]] auto char_error(char c, size_t line, size_t col, size_t pos) const -> JsonError;

    auto read_keyword() -> Result<JsonToken, JsonError>;
    auto read_string() -> Result<JsonToken, JsonError>;
    auto read_number() -> Result<JsonToken, JsonError>;

    /// Decodes the escape whose backslash was just consumed into `buffer_`.
    auto read_escape() -> Result<bool, JsonError>;

    /// Reads exactly four hex digits of a `\uXXXX` escape.
    auto read_hex4() -> Result<uint32_t, JsonError>;
};

} // namespace jcodec::json
