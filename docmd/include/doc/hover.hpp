//! # Hover Composition
//!
//! Builds the hover text shown for a declaration: its signature followed by
//! the rendered documentation.
//!
//! ```text
//! ```java
//! int size()
//! ```
//!
//! ---
//!
//! Returns the number of elements.
//! ```
//!
//! Signatures are formatted elsewhere; these functions only assemble strings.

#ifndef DOCMD_DOC_HOVER_HPP
#define DOCMD_DOC_HOVER_HPP

#include "doc/markdown.hpp"

#include <string>
#include <string_view>

namespace docmd::doc {

/// Code-fenced signature, then the docs after a rule when there are any.
[[nodiscard]] auto compose_hover(std::string_view signature, std::string_view docs,
                                 std::string_view language = "java") -> MarkupContent;

/// Hover for a type: bold package name over the unfenced signature, then
/// the docs after a rule when there are any.
[[nodiscard]] auto compose_type_hover(std::string_view qualified_name, std::string_view signature,
                                      std::string_view docs) -> MarkupContent;

/// Everything before the last `.` of a qualified name, or "" for none.
[[nodiscard]] auto package_name(std::string_view qualified_name) -> std::string;

} // namespace docmd::doc

#endif // DOCMD_DOC_HOVER_HPP
