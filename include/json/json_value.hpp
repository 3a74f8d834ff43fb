//! # JSON Value Model
//!
//! `JsonValue` is the in-memory form of a JSON document: the parser builds
//! it, the generator writes it, and both agree on this one contract.
//!
//! ## Model
//!
//! | `JsonType` | Payload | Query | Accessor |
//! |------------|---------|-------|----------|
//! | `Null` | none | `is_null()` | - |
//! | `Boolean` | `bool` | `is_bool()` | `as_bool()` |
//! | `Number` | `double` | `is_number()` | `as_number()` |
//! | `String` | `std::string` (UTF-8) | `is_string()` | `as_string()` |
//! | `Array` | `JsonArray` | `is_array()` | `as_array()`, `operator[]` |
//! | `Object` | `JsonObject` | `is_object()` | `as_object()`, `get()` |
//!
//! - Every number is an IEEE-754 double; integers above 2^53 lose precision
//!   (`9007199254740993` reads back as `9007199254740992`).
//! - Object members are kept sorted by key, so the same members always
//!   serialize in the same order however the object was built.
//! - A value exclusively owns its children. Values move; `clone()` copies.
//!
//! ## Example
//!
//! ```cpp
//! auto obj = json_object();
//! obj.set("success", JsonValue(true));
//! obj.set("code", JsonValue(200));
//! std::cout << obj.dump() << std::endl; // {"code":200,"success":true}
//! ```

#pragma once

#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jcodec::json {

struct JsonValue;

/// Ordered sequence of values.
using JsonArray = std::vector<JsonValue>;

/// Members keyed by string, iterated in ascending byte order of the key.
/// Lookups accept `std::string_view` without building a `std::string`.
using JsonObject = std::map<std::string, JsonValue, std::less<>>;

/// The six kinds of JSON value, in the order of `JsonValue::Storage`.
enum class JsonType : uint8_t { Null, Boolean, Number, String, Array, Object };

/// Names a type as JSON texts call it: `"null"`, `"boolean"`, `"number"`,
/// `"string"`, `"array"` or `"object"`.
[[nodiscard]] auto type_name(JsonType type) -> const char*;

// ============================================================================
// JsonValue
// ============================================================================

/// A JSON value of any type.
///
/// Arrays and objects sit behind a `Box` so the variant can contain
/// itself. Accessors for the wrong type throw `std::bad_variant_access`;
/// `json_access.hpp` has checked variants that return a `JsonError`.
struct JsonValue {
    using Storage = std::variant<std::monostate, bool, double, std::string, Box<JsonArray>,
                                 Box<JsonObject>>;

    Storage data;

    JsonValue() = default;
    explicit JsonValue(std::nullptr_t) {}
    explicit JsonValue(bool value) : data(value) {}

    /// Integers convert to `double`. Narrower types promote to `int`.
    explicit JsonValue(int value) : data(static_cast<double>(value)) {}
    explicit JsonValue(long value) : data(static_cast<double>(value)) {}
    explicit JsonValue(long long value) : data(static_cast<double>(value)) {}
    explicit JsonValue(double value) : data(value) {}

    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}

    explicit JsonValue(JsonArray items) : data(make_box<JsonArray>(std::move(items))) {}
    explicit JsonValue(JsonObject members) : data(make_box<JsonObject>(std::move(members))) {}

    // ------------------------------------------------------------------------
    // Type queries
    // ------------------------------------------------------------------------

    [[nodiscard]] auto type() const -> JsonType { return static_cast<JsonType>(data.index()); }

    [[nodiscard]] auto is_null() const -> bool { return type() == JsonType::Null; }
    [[nodiscard]] auto is_bool() const -> bool { return type() == JsonType::Boolean; }
    [[nodiscard]] auto is_number() const -> bool { return type() == JsonType::Number; }
    [[nodiscard]] auto is_string() const -> bool { return type() == JsonType::String; }
    [[nodiscard]] auto is_array() const -> bool { return type() == JsonType::Array; }
    [[nodiscard]] auto is_object() const -> bool { return type() == JsonType::Object; }

    // ------------------------------------------------------------------------
    // Payload access
    // ------------------------------------------------------------------------

    [[nodiscard]] auto as_bool() const -> bool { return std::get<bool>(data); }
    [[nodiscard]] auto as_number() const -> double { return std::get<double>(data); }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }
    [[nodiscard]] auto as_array_mut() -> JsonArray& { return *std::get<Box<JsonArray>>(data); }
    [[nodiscard]] auto as_object_mut() -> JsonObject& { return *std::get<Box<JsonObject>>(data); }

    /// Returns the member `key`, or `nullptr` when this is not an object or
    /// has no such member.
    [[nodiscard]] auto get(std::string_view key) const -> const JsonValue*;

    /// Returns `true` when this is an object with a member `key`.
    [[nodiscard]] auto contains(std::string_view key) const -> bool { return get(key) != nullptr; }

    /// Returns element `index` of an array.
    ///
    /// # Panics
    ///
    /// Throws `std::bad_variant_access` if this is not an array, and
    /// `std::out_of_range` if `index >= size()`.
    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    /// Number of elements or members; 0 for scalars.
    [[nodiscard]] auto size() const -> size_t;

    /// Appends to an array. Throws `std::bad_variant_access` otherwise.
    void push(JsonValue value) { as_array_mut().push_back(std::move(value)); }

    /// Inserts or replaces a member of an object. Throws
    /// `std::bad_variant_access` otherwise.
    void set(std::string key, JsonValue value) {
        as_object_mut().insert_or_assign(std::move(key), std::move(value));
    }

    // ------------------------------------------------------------------------
    // Text
    // ------------------------------------------------------------------------

    /// Minified JSON text, the same as `stringify(*this)`.
    [[nodiscard]] auto dump() const -> std::string;

    /// Indented JSON text, the same as `stringify_pretty(*this, indent)`.
    [[nodiscard]] auto dump_pretty(int indent = 4) const -> std::string;

    /// Human-readable rendering. Strings appear without quotes or escapes,
    /// numbers and literals as in JSON, containers as their `dump()`.
    [[nodiscard]] auto display() const -> std::string;

    /// Deep copy. Copy construction is unavailable because children are
    /// uniquely owned.
    [[nodiscard]] auto clone() const -> JsonValue;

    /// Structural equality: same type and equal payload, arrays element by
    /// element, objects member by member. NaN never equals itself.
    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;

    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

/// Shorthand for `type_name(value.type())`.
[[nodiscard]] inline auto type_name(const JsonValue& value) -> const char* {
    return type_name(value.type());
}

/// Writes `value.display()` to `os`.
auto operator<<(std::ostream& os, const JsonValue& value) -> std::ostream&;

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_number(double value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

/// Creates an empty array, to be filled with `push`.
inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

/// Creates an empty object, to be filled with `set`.
inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace jcodec::json
