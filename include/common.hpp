//! # Common Definitions
//!
//! Version constants, the `Result` error channel and the `Box` owner alias.
//! Every jcodec header includes this one.
//!
//! ## Errors Without Exceptions
//!
//! Fallible operations return `Result<T, JsonError>`. Callers test with
//! `is_ok` / `is_err` and then take the payload with `unwrap` /
//! `unwrap_err`:
//!
//! ```cpp
//! auto parsed = json::parse_json(text);
//! if (is_err(parsed)) {
//!     std::cerr << unwrap_err(parsed).to_string() << "\n";
//!     return;
//! }
//! const json::JsonValue& doc = unwrap(parsed);
//! ```
//!
//! Taking the wrong alternative throws `std::bad_variant_access`; the
//! library itself always checks first.

#ifndef JCODEC_COMMON_HPP
#define JCODEC_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace jcodec {

// ============================================================================
// Version Information
// ============================================================================

/// Library version as `"major.minor.patch"`.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// Either the value `T` of a successful operation or the error `E`
/// explaining why it failed.
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Returns `true` when `result` holds a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Returns `true` when `result` holds an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Returns the value held by `result`.
///
/// # Panics
///
/// Throws `std::bad_variant_access` when `result` holds an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Returns the error held by `result`.
///
/// # Panics
///
/// Throws `std::bad_variant_access` when `result` holds a value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Ownership
// ============================================================================

/// Sole owner of a heap value. `JsonValue` boxes its arrays and objects so
/// the variant can hold itself.
template <typename T> using Box = std::unique_ptr<T>;

/// Allocates a `T` from `args` and boxes it.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace jcodec

#endif // JCODEC_COMMON_HPP
