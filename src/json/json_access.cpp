//! # Typed Access Implementation

#include "json/json_access.hpp"

#include <optional>
#include <utility>

namespace jcodec::json {

namespace {

/// Returns the `InvalidType` error for `value` unless it has type `expected`.
auto check_type(const JsonValue& value, JsonType expected) -> std::optional<JsonError> {
    if (value.type() == expected) {
        return std::nullopt;
    }
    return JsonError::invalid_type(std::string("expected ") + type_name(expected) + ", found " +
                                   type_name(value));
}

} // namespace

auto field(const JsonValue& object, std::string_view key) -> Result<const JsonValue*, JsonError> {
    if (auto error = check_type(object, JsonType::Object)) {
        return std::move(*error);
    }
    const JsonValue* member = object.get(key);
    if (member == nullptr) {
        return JsonError::undefined_field(std::string(key));
    }
    return member;
}

auto as_bool_checked(const JsonValue& value) -> Result<bool, JsonError> {
    if (auto error = check_type(value, JsonType::Boolean)) {
        return std::move(*error);
    }
    return value.as_bool();
}

auto as_number_checked(const JsonValue& value) -> Result<double, JsonError> {
    if (auto error = check_type(value, JsonType::Number)) {
        return std::move(*error);
    }
    return value.as_number();
}

auto as_string_checked(const JsonValue& value) -> Result<const std::string*, JsonError> {
    if (auto error = check_type(value, JsonType::String)) {
        return std::move(*error);
    }
    return &value.as_string();
}

auto as_array_checked(const JsonValue& value) -> Result<const JsonArray*, JsonError> {
    if (auto error = check_type(value, JsonType::Array)) {
        return std::move(*error);
    }
    return &value.as_array();
}

auto as_object_checked(const JsonValue& value) -> Result<const JsonObject*, JsonError> {
    if (auto error = check_type(value, JsonType::Object)) {
        return std::move(*error);
    }
    return &value.as_object();
}

} // namespace jcodec::json
