//! # Typed Access
//!
//! Checked projections from a `JsonValue` into its payload types. Where the
//! inline accessors (`as_bool()`, `get()`) throw or return `nullptr`, these
//! report a `JsonError` of kind `InvalidType` or `UndefinedField`, which lets
//! a consumer decoding a document into its own structures propagate the
//! failure like any parse error.
//!
//! ## Example
//!
//! ```cpp
//! auto doc = parse_json(R"({"code": 200})");
//! auto code = field(unwrap(doc), "code");
//! if (is_ok(code)) {
//!     auto number = as_number_checked(*unwrap(code));
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string>
#include <string_view>

namespace jcodec::json {

/// Looks up the member `key` of an object.
///
/// # Errors
///
/// - `InvalidType` if `object` is not an object
/// - `UndefinedField` (payload `key`) if the member does not exist
[[nodiscard]] auto field(const JsonValue& object, std::string_view key)
    -> Result<const JsonValue*, JsonError>;

/// Returns the boolean payload, or `InvalidType`.
[[nodiscard]] auto as_bool_checked(const JsonValue& value) -> Result<bool, JsonError>;

/// Returns the number payload, or `InvalidType`.
[[nodiscard]] auto as_number_checked(const JsonValue& value) -> Result<double, JsonError>;

/// Returns the string payload, or `InvalidType`.
[[nodiscard]] auto as_string_checked(const JsonValue& value)
    -> Result<const std::string*, JsonError>;

/// Returns the array payload, or `InvalidType`.
[[nodiscard]] auto as_array_checked(const JsonValue& value)
    -> Result<const JsonArray*, JsonError>;

/// Returns the object payload, or `InvalidType`.
[[nodiscard]] auto as_object_checked(const JsonValue& value)
    -> Result<const JsonObject*, JsonError>;

} // namespace jcodec::json
