//! # JSON Tokenizer Implementation
//!
//! The tokenizer walks the input byte by byte. Whitespace is limited to the
//! four characters the JSON grammar allows (space, tab, LF, CR). Strings are
//! accumulated into a reused scratch buffer, decoded from escapes, and
//! checked for well-formed UTF-8 before they become tokens.
//!
//! ## Number Grammar
//!
//! A number lexeme is the longest run of `-`, `+`, digits, at most one `.`
//! and at most one exponent marker. The lexeme must then convert to a
//! `double` in full; `-`, `1+2` and `1.23e` are rejected at that point.

#include "json/json_tokenizer.hpp"

#include "log/log.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace jcodec::json {

namespace {

/// Appends the UTF-8 encoding of a Unicode scalar value.
void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/// Returns `true` if `s` is well-formed UTF-8 (no overlong forms, no
/// surrogates, nothing above U+10FFFF).
auto is_valid_utf8(std::string_view s) -> bool {
    size_t i = 0;
    while (i < s.size()) {
        auto b0 = static_cast<unsigned char>(s[i]);
        if (b0 < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (b0 >= 0xC2 && b0 <= 0xDF) {
            len = 2;
        } else if (b0 >= 0xE0 && b0 <= 0xEF) {
            len = 3;
            if (b0 == 0xE0) {
                lo = 0xA0;
            } else if (b0 == 0xED) {
                hi = 0x9F;
            }
        } else if (b0 >= 0xF0 && b0 <= 0xF4) {
            len = 4;
            if (b0 == 0xF0) {
                lo = 0x90;
            } else if (b0 == 0xF4) {
                hi = 0x8F;
            }
        } else {
            return false;
        }

        if (i + len > s.size()) {
            return false;
        }
        auto b1 = static_cast<unsigned char>(s[i + 1]);
        if (b1 < lo || b1 > hi) {
            return false;
        }
        for (size_t k = 2; k < len; ++k) {
            auto bk = static_cast<unsigned char>(s[i + k]);
            if (bk < 0x80 || bk > 0xBF) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

/// Logs a rejected lexeme and passes the error through.
auto reject(JsonError error) -> JsonError {
    JCODEC_LOG_DEBUG("json.tokenizer", error.to_string());
    return error;
}

} // namespace

// ============================================================================
// Token Description
// ============================================================================

auto describe(const JsonToken& token) -> std::string {
    switch (token.kind) {
    case JsonTokenKind::Comma:
        return "','";
    case JsonTokenKind::Colon:
        return "':'";
    case JsonTokenKind::LBracket:
        return "'['";
    case JsonTokenKind::RBracket:
        return "']'";
    case JsonTokenKind::LBrace:
        return "'{'";
    case JsonTokenKind::RBrace:
        return "'}'";
    case JsonTokenKind::String:
        return "string \"" + token.text + "\"";
    case JsonTokenKind::Number: {
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), token.number);
        if (ec != std::errc{}) {
            return "number";
        }
        return "number " + std::string(buf, ptr);
    }
    case JsonTokenKind::Boolean:
        return token.boolean ? "true" : "false";
    case JsonTokenKind::Null:
        return "null";
    }
    return "token";
}

// ============================================================================
// JsonTokenizer Implementation
// ============================================================================

JsonTokenizer::JsonTokenizer(std::string_view input) : input_(input) {}

auto JsonTokenizer::peek() const -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    return input_[pos_];
}

/// Advances the position and returns the consumed character.
///
/// Updates line and column tracking for newlines.
auto JsonTokenizer::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonTokenizer::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else {
            break;
        }
    }
}

auto JsonTokenizer::at_end() -> bool {
    skip_whitespace();
    return exhausted();
}

auto JsonTokenizer::make_token(JsonTokenKind kind, size_t start_pos, size_t start_line,
                               size_t start_col) const -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.line = start_line;
    tok.column = start_col;
    tok.offset = start_pos;
    return tok;
}

auto JsonTokenizer::end_error() const -> JsonError {
    return reject(JsonError::unexpected_end(line_, column_, pos_));
}

auto JsonTokenizer::char_error(char c, size_t line, size_t col, size_t pos) const -> JsonError {
    return reject(JsonError::unexpected_character(c, line, col, pos));
}

/// Returns the next token from the input.
///
/// Skips whitespace, then dispatches on the first byte of the lexeme.
auto JsonTokenizer::next_token() -> Result<JsonToken, JsonError> {
    skip_whitespace();

    if (exhausted()) {
        return end_error();
    }

    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;
    char c = peek();

    switch (c) {
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma, start_pos, start_line, start_col);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon, start_pos, start_line, start_col);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket, start_pos, start_line, start_col);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket, start_pos, start_line, start_col);
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace, start_pos, start_line, start_col);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace, start_pos, start_line, start_col);
    case '"':
        return read_string();
    case '-':
    case '0':
    case '1':
    case '2':
    case '3':
    case '4':
    case '5':
    case '6':
    case '7':
    case '8':
    case '9':
        return read_number();
    case 't':
    case 'f':
    case 'n':
        return read_keyword();
    default:
        return char_error(c, start_line, start_col, start_pos);
    }
}

/// Reads `true`, `false` or `null`, matching the remaining bytes exactly.
auto JsonTokenizer::read_keyword() -> Result<JsonToken, JsonError> {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    std::string_view word;
    JsonToken tok;
    switch (peek()) {
    case 't':
        word = "true";
        tok = make_token(JsonTokenKind::Boolean, start_pos, start_line, start_col);
        tok.boolean = true;
        break;
    case 'f':
        word = "false";
        tok = make_token(JsonTokenKind::Boolean, start_pos, start_line, start_col);
        tok.boolean = false;
        break;
    default:
        word = "null";
        tok = make_token(JsonTokenKind::Null, start_pos, start_line, start_col);
        break;
    }

    advance();
    for (size_t i = 1; i < word.size(); ++i) {
        if (exhausted()) {
            return end_error();
        }
        char c = advance();
        if (c != word[i]) {
            std::string prefix(word.substr(0, i));
            prefix += c;
            return reject(JsonError::unexpected_token("malformed literal '" + prefix + "'",
                                                      start_line, start_col, start_pos));
        }
    }

    return tok;
}

/// Reads a string literal whose opening quote is the current character.
///
/// Handles the escapes `\"`, `\\`, `\/`, `\b`, `\f`, `\n`, `\r`, `\t` and
/// `\uXXXX`, including UTF-16 surrogate pairs.
auto JsonTokenizer::read_string() -> Result<JsonToken, JsonError> {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    advance(); // Skip opening quote
    buffer_.clear();

    while (true) {
        if (exhausted()) {
            return end_error();
        }

        char c = advance();
        if (c == '"') {
            break;
        }
        if (c == '\\') {
            auto escaped = read_escape();
            if (is_err(escaped)) {
                return unwrap_err(escaped);
            }
        } else {
            buffer_ += c;
        }
    }

    if (!is_valid_utf8(buffer_)) {
        return reject(
            JsonError::parsing_failed("invalid UTF-8 in string", start_line, start_col, start_pos));
    }

    JsonToken tok = make_token(JsonTokenKind::String, start_pos, start_line, start_col);
    tok.text = buffer_;
    return tok;
}

auto JsonTokenizer::read_escape() -> Result<bool, JsonError> {
    if (exhausted()) {
        return end_error();
    }

    size_t esc_pos = pos_;
    size_t esc_line = line_;
    size_t esc_col = column_;
    char c = advance();

    switch (c) {
    case '"':
    case '\\':
    case '/':
        buffer_ += c;
        return true;
    case 'b':
        buffer_ += '\b';
        return true;
    case 'f':
        buffer_ += '\f';
        return true;
    case 'n':
        buffer_ += '\n';
        return true;
    case 'r':
        buffer_ += '\r';
        return true;
    case 't':
        buffer_ += '\t';
        return true;
    case 'u':
        break;
    default:
        return char_error(c, esc_line, esc_col, esc_pos);
    }

    auto first = read_hex4();
    if (is_err(first)) {
        return unwrap_err(first);
    }
    uint32_t cp = unwrap(first);

    if (cp >= 0xDC00 && cp <= 0xDFFF) {
        return reject(JsonError::parsing_failed("unpaired low surrogate in \\u escape", esc_line,
                                                esc_col, esc_pos));
    }

    if (cp >= 0xD800 && cp <= 0xDBFF) {
        // A high surrogate must be followed immediately by \uDC00-\uDFFF.
        for (char expected : {'\\', 'u'}) {
            if (exhausted()) {
                return end_error();
            }
            if (peek() != expected) {
                return reject(JsonError::parsing_failed("unpaired high surrogate in \\u escape",
                                                        esc_line, esc_col, esc_pos));
            }
            advance();
        }

        auto second = read_hex4();
        if (is_err(second)) {
            return unwrap_err(second);
        }
        uint32_t low = unwrap(second);
        if (low < 0xDC00 || low > 0xDFFF) {
            return reject(JsonError::parsing_failed("invalid low surrogate in \\u escape",
                                                    esc_line, esc_col, esc_pos));
        }
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
    }

    append_utf8(buffer_, cp);
    return true;
}

auto JsonTokenizer::read_hex4() -> Result<uint32_t, JsonError> {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        if (exhausted()) {
            return end_error();
        }
        size_t digit_pos = pos_;
        size_t digit_line = line_;
        size_t digit_col = column_;
        char c = advance();
        int digit = hex_value(c);
        if (digit < 0) {
            return char_error(c, digit_line, digit_col, digit_pos);
        }
        value = (value << 4) | static_cast<uint32_t>(digit);
    }
    return value;
}

/// Reads a number literal starting with `-` or a digit.
auto JsonTokenizer::read_number() -> Result<JsonToken, JsonError> {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    buffer_.clear();
    bool seen_dot = false;
    bool seen_exponent = false;

    while (!exhausted()) {
        char c = peek();
        if (c >= '0' && c <= '9') {
            buffer_ += c;
        } else if (c == '.') {
            buffer_ += c;
            if (seen_dot || seen_exponent) {
                return reject(
                    JsonError::invalid_number(buffer_, start_line, start_col, start_pos));
            }
            seen_dot = true;
        } else if (c == 'e' || c == 'E') {
            buffer_ += c;
            if (seen_exponent) {
                return reject(
                    JsonError::invalid_number(buffer_, start_line, start_col, start_pos));
            }
            seen_exponent = true;
        } else if (c == '+' || c == '-') {
            buffer_ += c;
        } else {
            break;
        }
        advance();
    }

    const char* first = buffer_.data();
    const char* last = buffer_.data() + buffer_.size();
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(first, last, value);

    if (ec == std::errc::result_out_of_range) {
        // from_chars reports both overflow and underflow; only overflow is
        // unrepresentable, an underflow reads as zero or a subnormal.
        char* end = nullptr;
        value = std::strtod(buffer_.c_str(), &end);
        if (end != buffer_.c_str() + buffer_.size() || std::isinf(value)) {
            return reject(JsonError::invalid_number(buffer_, start_line, start_col, start_pos));
        }
    } else if (ec != std::errc{} || ptr != last) {
        return reject(JsonError::invalid_number(buffer_, start_line, start_col, start_pos));
    }

    JsonToken tok = make_token(JsonTokenKind::Number, start_pos, start_line, start_col);
    tok.number = value;
    return tok;
}

} // namespace jcodec::json
