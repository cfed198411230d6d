//! # Common Definitions
//!
//! Types and constants shared by every docmd component.
//!
//! ## Overview
//!
//! - **Version Information**: Library version constants
//! - **Result Type**: Error handling without exceptions
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Recoverable failures are returned via `Result<T, E>`
//! - **Best Effort**: Rendering never fails outright; callers fall back to the
//!   original text when a `Result` holds an error

#ifndef DOCMD_COMMON_HPP
#define DOCMD_COMMON_HPP

#include <string>
#include <variant>

namespace docmd {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.3.0";

/// Major version number.
constexpr int VERSION_MAJOR = 0;

/// Minor version number.
constexpr int VERSION_MINOR = 3;

/// Patch version number.
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = doc::parse_inline_directives("{@code x}");
/// if (is_ok(result)) {
///     std::string markdown = unwrap(result);
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace docmd

#endif // DOCMD_COMMON_HPP
