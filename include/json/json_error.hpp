//! # JSON Error Types
//!
//! This module provides the error type returned by every fallible codec
//! operation. Errors are a flat set of kinds with a descriptive payload and,
//! when the tokenizer knows it, the source location of the failure.
//!
//! ## Error Kinds
//!
//! | Kind | Raised when |
//! |------|-------------|
//! | `UnexpectedToken` | A token is grammatically invalid at its position |
//! | `UnexpectedEndOfJson` | Input ran out while a token or value was expected |
//! | `UnexpectedCharacter` | A character cannot begin any token or escape |
//! | `InvalidNumber` | A number lexeme is malformed or cannot be represented |
//! | `ParsingFailed` | Lower-level decoding failed (UTF-8, code points, depth) |
//! | `InvalidType` | A typed projection found a different variant |
//! | `UndefinedField` | A typed projection found no such object member |
//!
//! ## Example
//!
//! ```cpp
//! auto error = JsonError::unexpected_character('x', 3, 7, 21);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "line 3, column 7: UnexpectedCharacter: 'x'"
//! ```

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace jcodec::json {

/// The category of a `JsonError`.
enum class JsonErrorKind : uint8_t {
    UnexpectedToken,
    UnexpectedEndOfJson,
    UnexpectedCharacter,
    InvalidNumber,
    ParsingFailed,
    InvalidType,
    UndefinedField
};

/// Returns the identifier of an error kind (e.g., `"InvalidNumber"`).
[[nodiscard]] inline auto kind_name(JsonErrorKind kind) -> const char* {
    switch (kind) {
    case JsonErrorKind::UnexpectedToken:
        return "UnexpectedToken";
    case JsonErrorKind::UnexpectedEndOfJson:
        return "UnexpectedEndOfJson";
    case JsonErrorKind::UnexpectedCharacter:
        return "UnexpectedCharacter";
    case JsonErrorKind::InvalidNumber:
        return "InvalidNumber";
    case JsonErrorKind::ParsingFailed:
        return "ParsingFailed";
    case JsonErrorKind::InvalidType:
        return "InvalidType";
    case JsonErrorKind::UndefinedField:
        return "UndefinedField";
    }
    return "Unknown";
}

/// An error encountered while parsing JSON or projecting a value.
///
/// `JsonError` contains the error kind, a human-readable description and
/// optional source location information.
///
/// # Fields
///
/// - `kind`: Which failure occurred
/// - `message`: Description payload (token text, field name, ...)
/// - `character`: The offending character for `UnexpectedCharacter`
/// - `line`: 1-based line number (0 if unknown)
/// - `column`: 1-based column number (0 if unknown)
/// - `offset`: Byte offset from start of input (0 if unknown)
struct JsonError {
    /// The error category.
    JsonErrorKind kind = JsonErrorKind::ParsingFailed;

    /// Human-readable error description.
    std::string message;

    /// The offending character (`UnexpectedCharacter` only, `'\0'` otherwise).
    char character = '\0';

    /// Line number where the error occurred (1-based, 0 if unknown).
    size_t line = 0;

    /// Column number where the error occurred (1-based, 0 if unknown).
    size_t column = 0;

    /// Byte offset in input where the error occurred (0 if unknown).
    size_t offset = 0;

    /// Creates an error of any kind with optional location.
    static auto make(JsonErrorKind kind, std::string msg, size_t line = 0, size_t column = 0,
                     size_t offset = 0) -> JsonError {
        JsonError error;
        error.kind = kind;
        error.message = std::move(msg);
        error.line = line;
        error.column = column;
        error.offset = offset;
        return error;
    }

    /// A token was not valid at its position.
    ///
    /// # Arguments
    ///
    /// * `description` - Rendering of the offending token or malformed keyword
    static auto unexpected_token(std::string description, size_t line = 0, size_t column = 0,
                                 size_t offset = 0) -> JsonError {
        return make(JsonErrorKind::UnexpectedToken, std::move(description), line, column, offset);
    }

    /// Input was exhausted while more content was required.
    static auto unexpected_end(size_t line = 0, size_t column = 0, size_t offset = 0)
        -> JsonError {
        return make(JsonErrorKind::UnexpectedEndOfJson, "unexpected end of input", line, column,
                    offset);
    }

    /// A raw character could not start a token or an escape.
    static auto unexpected_character(char c, size_t line = 0, size_t column = 0,
                                     size_t offset = 0) -> JsonError {
        auto error = make(JsonErrorKind::UnexpectedCharacter, quote_char(c), line, column, offset);
        error.character = c;
        return error;
    }

    /// A number lexeme was malformed.
    static auto invalid_number(std::string lexeme, size_t line = 0, size_t column = 0,
                               size_t offset = 0) -> JsonError {
        return make(JsonErrorKind::InvalidNumber, std::move(lexeme), line, column, offset);
    }

    /// Decoding below the token level failed.
    static auto parsing_failed(std::string description, size_t line = 0, size_t column = 0,
                               size_t offset = 0) -> JsonError {
        return make(JsonErrorKind::ParsingFailed, std::move(description), line, column, offset);
    }

    /// A value did not have the variant a consumer required.
    static auto invalid_type(std::string description) -> JsonError {
        return make(JsonErrorKind::InvalidType, std::move(description));
    }

    /// An object had no member with the requested key.
    static auto undefined_field(std::string field) -> JsonError {
        return make(JsonErrorKind::UndefinedField, std::move(field));
    }

    /// Formats the error as a human-readable string.
    ///
    /// The format depends on available location information:
    /// - With line and column: `"line X, column Y: Kind: message"`
    /// - Without location: `"Kind: message"`
    [[nodiscard]] auto to_string() const -> std::string {
        std::string body = std::string(kind_name(kind)) + ": " + message;
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   body;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + body;
        }
        return body;
    }

private:
    static auto quote_char(char c) -> std::string {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte >= 0x7F) {
            static constexpr char hex[] = "0123456789abcdef";
            std::string out = "'\\x";
            out += hex[byte >> 4];
            out += hex[byte & 0xF];
            out += '\'';
            return out;
        }
        return std::string("'") + c + "'";
    }
};

} // namespace jcodec::json
