//! # JSON Generator Implementation
//!
//! Arrays and objects share one line protocol driven by `new_line`:
//!
//! | Position | Output |
//! |----------|--------|
//! | Before the first child | `Right` |
//! | Before each later child | `,` (arrays add a space when pretty), `Stay` |
//! | After the last child | `Left`, closing bracket |
//!
//! Empty containers are written as `[]` and `{}` with no line break.
//! This module does not log: the JSON log format is built on it.

#include "json/json_generator.hpp"

#include <charconv>
#include <cmath>
#include <ostream>

namespace jcodec::json {

// ============================================================================
// Number Formatting
// ============================================================================

auto format_number(double value) -> std::string {
    if (std::isnan(value) || std::isinf(value)) {
        return "null";
    }

    // Fixed notation of the smallest subnormal needs a little over 320 chars.
    char buf[400];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (ec != std::errc{}) {
        return "null";
    }
    return std::string(buf, ptr);
}

// ============================================================================
// JsonGenerator Implementation
// ============================================================================

auto JsonGenerator::take() -> std::string {
    std::string result = std::move(out_);
    out_.clear();
    depth_ = 0;
    return result;
}

void JsonGenerator::new_line(Tab tab) {
    switch (tab) {
    case Tab::Right:
        ++depth_;
        break;
    case Tab::Left:
        if (depth_ > 0) {
            --depth_;
        }
        break;
    case Tab::Stay:
        break;
    }

    if (options_.minify) {
        return;
    }
    out_ += '\n';
    if (options_.indent_width > 0) {
        out_.append(static_cast<size_t>(depth_ * options_.indent_width), ' ');
    }
}

void JsonGenerator::write(const JsonValue& value) {
    switch (value.type()) {
    case JsonType::Null:
        out_ += "null";
        break;
    case JsonType::Boolean:
        out_ += value.as_bool() ? "true" : "false";
        break;
    case JsonType::Number:
        write_number(value.as_number());
        break;
    case JsonType::String:
        write_string(value.as_string());
        break;
    case JsonType::Array:
        write_array(value.as_array());
        break;
    case JsonType::Object:
        write_object(value.as_object());
        break;
    }
}

void JsonGenerator::write_number(double value) {
    out_ += format_number(value);
}

/// Writes a quoted string.
///
/// Only the seven short escapes are produced; other control bytes and all
/// non-ASCII bytes pass through unchanged.
void JsonGenerator::write_string(const std::string& s) {
    out_ += '"';
    for (char c : s) {
        switch (c) {
        case '"':
            out_ += "\\\"";
            break;
        case '\\':
            out_ += "\\\\";
            break;
        case '\n':
            out_ += "\\n";
            break;
        case '\r':
            out_ += "\\r";
            break;
        case '\t':
            out_ += "\\t";
            break;
        case '\f':
            out_ += "\\f";
            break;
        case '\b':
            out_ += "\\b";
            break;
        default:
            out_ += c;
            break;
        }
    }
    out_ += '"';
}

void JsonGenerator::write_array(const JsonArray& arr) {
    if (arr.empty()) {
        out_ += "[]";
        return;
    }

    out_ += '[';
    bool first = true;
    for (const auto& item : arr) {
        if (first) {
            new_line(Tab::Right);
            first = false;
        } else {
            out_ += ',';
            if (!options_.minify) {
                out_ += ' ';
            }
            new_line(Tab::Stay);
        }
        write(item);
    }
    new_line(Tab::Left);
    out_ += ']';
}

void JsonGenerator::write_object(const JsonObject& obj) {
    if (obj.empty()) {
        out_ += "{}";
        return;
    }

    out_ += '{';
    bool first = true;
    for (const auto& [key, item] : obj) {
        if (first) {
            new_line(Tab::Right);
            first = false;
        } else {
            out_ += ',';
            new_line(Tab::Stay);
        }
        write_string(key);
        out_ += ':';
        if (!options_.minify) {
            out_ += ' ';
        }
        write(item);
    }
    new_line(Tab::Left);
    out_ += '}';
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto stringify(const JsonValue& value) -> std::string {
    JsonGenerator gen;
    gen.write(value);
    return gen.take();
}

auto stringify_pretty(const JsonValue& value, int indent) -> std::string {
    JsonGenerator gen(GeneratorOptions{false, indent});
    gen.write(value);
    return gen.take();
}

void write_json(std::ostream& os, const JsonValue& value, GeneratorOptions options) {
    JsonGenerator gen(options);
    gen.write(value);
    os << gen.value();
}

auto JsonValue::dump() const -> std::string {
    return stringify(*this);
}

auto JsonValue::dump_pretty(int indent) const -> std::string {
    return stringify_pretty(*this, indent);
}

} // namespace jcodec::json
