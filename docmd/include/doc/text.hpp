//! # Text Helpers
//!
//! Locale-independent string helpers shared by the renderer modules. Only
//! ASCII whitespace and ASCII letters are recognized; multi-byte UTF-8
//! sequences pass through untouched.

#ifndef DOCMD_DOC_TEXT_HPP
#define DOCMD_DOC_TEXT_HPP

#include <string>
#include <string_view>

namespace docmd::doc {

/// True for space, tab, newline, carriage return, form feed and vertical tab.
[[nodiscard]] constexpr auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

/// Removes leading and trailing whitespace.
[[nodiscard]] auto trim(std::string_view s) -> std::string;

/// True if `s` is empty or only whitespace.
[[nodiscard]] auto is_blank(std::string_view s) -> bool;

/// ASCII lower-casing.
[[nodiscard]] auto to_lower(std::string_view s) -> std::string;

} // namespace docmd::doc

#endif // DOCMD_DOC_TEXT_HPP
