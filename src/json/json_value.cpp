//! # JSON Value Implementation
//!
//! Lookup, equality, deep copy and display rendering for `JsonValue`.
//! `dump` and `dump_pretty` live with the generator in `json_generator.cpp`.

#include "json/json_generator.hpp"
#include "json/json_value.hpp"

#include <ostream>

namespace jcodec::json {

auto type_name(JsonType type) -> const char* {
    switch (type) {
    case JsonType::Null:
        return "null";
    case JsonType::Boolean:
        return "boolean";
    case JsonType::Number:
        return "number";
    case JsonType::String:
        return "string";
    case JsonType::Array:
        return "array";
    case JsonType::Object:
        return "object";
    }
    return "unknown";
}

auto JsonValue::get(std::string_view key) const -> const JsonValue* {
    if (!is_object()) {
        return nullptr;
    }
    const auto& members = as_object();
    auto it = members.find(key);
    return it == members.end() ? nullptr : &it->second;
}

auto JsonValue::size() const -> size_t {
    switch (type()) {
    case JsonType::Array:
        return as_array().size();
    case JsonType::Object:
        return as_object().size();
    default:
        return 0;
    }
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (type() != other.type()) {
        return false;
    }

    switch (type()) {
    case JsonType::Null:
        return true;
    case JsonType::Boolean:
        return as_bool() == other.as_bool();
    case JsonType::Number:
        return as_number() == other.as_number();
    case JsonType::String:
        return as_string() == other.as_string();
    case JsonType::Array: {
        const auto& lhs = as_array();
        const auto& rhs = other.as_array();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        for (size_t i = 0; i < lhs.size(); ++i) {
            if (lhs[i] != rhs[i]) {
                return false;
            }
        }
        return true;
    }
    case JsonType::Object: {
        const auto& lhs = as_object();
        const auto& rhs = other.as_object();
        if (lhs.size() != rhs.size()) {
            return false;
        }
        // Both sides iterate in key order.
        auto it = rhs.begin();
        for (const auto& [key, member] : lhs) {
            if (it->first != key || it->second != member) {
                return false;
            }
            ++it;
        }
        return true;
    }
    }
    return false;
}

auto JsonValue::clone() const -> JsonValue {
    switch (type()) {
    case JsonType::Null:
        return JsonValue();
    case JsonType::Boolean:
        return JsonValue(as_bool());
    case JsonType::Number:
        return JsonValue(as_number());
    case JsonType::String:
        return JsonValue(as_string());
    case JsonType::Array: {
        JsonArray items;
        items.reserve(as_array().size());
        for (const auto& item : as_array()) {
            items.push_back(item.clone());
        }
        return JsonValue(std::move(items));
    }
    case JsonType::Object: {
        JsonObject members;
        for (const auto& [key, member] : as_object()) {
            members.emplace_hint(members.end(), key, member.clone());
        }
        return JsonValue(std::move(members));
    }
    }
    return JsonValue();
}

auto JsonValue::display() const -> std::string {
    switch (type()) {
    case JsonType::Null:
        return "null";
    case JsonType::Boolean:
        return as_bool() ? "true" : "false";
    case JsonType::Number:
        return format_number(as_number());
    case JsonType::String:
        return as_string();
    default:
        return dump();
    }
}

auto operator<<(std::ostream& os, const JsonValue& value) -> std::ostream& {
    return os << value.display();
}

} // namespace jcodec::json
