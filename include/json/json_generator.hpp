//! # JSON Generator
//!
//! This module turns a `JsonValue` tree back into text. Output is either
//! minified (no whitespace outside strings) or indented with a configurable
//! width per nesting level.
//!
//! ## Output Rules
//!
//! - Object members are written in ascending key order
//! - Numbers use the shortest decimal text that reads back to the same
//!   `double`, without exponent (`200`, `-12300`, `0.000123`)
//! - NaN and infinities are written as `null`
//! - Strings escape `"`, `\`, `\n`, `\r`, `\t`, form feed and backspace;
//!   every other byte is copied verbatim
//!
//! ## Example
//!
//! ```cpp
//! auto obj = json_object();
//! obj.set("a", JsonValue("abc"));
//! obj.set("b", JsonValue(123));
//!
//! JsonGenerator gen(GeneratorOptions{false, 4});
//! gen.write(obj);
//! std::cout << gen.value() << std::endl;
//! // {
//! //     "a": "abc",
//! //     "b": 123
//! // }
//! ```

#pragma once

#include "json/json_value.hpp"

#include <iosfwd>
#include <string>

namespace jcodec::json {

/// Formatting options for `JsonGenerator`.
struct GeneratorOptions {
    /// Omit all newlines and indentation.
    bool minify = true;

    /// Spaces per nesting level when `minify` is false.
    int indent_width = 4;
};

/// Serializer that accumulates JSON text for one or more values.
///
/// A generator owns its output buffer; nothing is shared between instances.
/// Generation cannot fail.
class JsonGenerator {
public:
    explicit JsonGenerator(GeneratorOptions options = {}) : options_(options) {}

    /// Appends the text of `value` to the output buffer.
    void write(const JsonValue& value);

    /// Returns the text written so far.
    [[nodiscard]] auto value() const -> const std::string& { return out_; }

    /// Moves the output buffer out, leaving the generator empty.
    [[nodiscard]] auto take() -> std::string;

private:
    /// Indentation transitions between lines.
    enum class Tab {
        Right, ///< Enter a nested level
        Left,  ///< Leave a nested level
        Stay   ///< Next line at the same level
    };

    GeneratorOptions options_;
    std::string out_;
    int depth_ = 0;

    void new_line(Tab tab);
    void write_string(const std::string& s);
    void write_number(double value);
    void write_array(const JsonArray& arr);
    void write_object(const JsonObject& obj);
};

/// Formats a number the way the generator writes it.
[[nodiscard]] auto format_number(double value) -> std::string;

/// Serializes `value` as minified JSON.
[[nodiscard]] auto stringify(const JsonValue& value) -> std::string;

/// Serializes `value` with newlines and `indent` spaces per level.
[[nodiscard]] auto stringify_pretty(const JsonValue& value, int indent = 4) -> std::string;

/// Writes the text of `value` to `os`.
void write_json(std::ostream& os, const JsonValue& value, GeneratorOptions options = {});

} // namespace jcodec::json
