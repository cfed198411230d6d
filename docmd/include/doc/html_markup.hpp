//! # HTML-Like Markup Converter
//!
//! Converts raw comment text that contains a subset of HTML into Markdown.
//!
//! ## Pipeline
//!
//! 1. `is_html_like()` decides with a cheap heuristic whether to convert
//! 2. inline directives are resolved (`{@code ...}` and friends)
//! 3. the text is wrapped in a synthetic root and parsed permissively with
//!    libxml2's HTML parser into a `MarkupNode` tree
//! 4. `i`, `b`, `pre`, `code` and `a` are rewritten to Markdown, innermost first
//! 5. the tree is serialized and the synthetic root stripped
//!
//! ## Error Recovery
//!
//! The converter is advisory. `html_to_markdown()` reports failures as a
//! `MarkupError`; `raw_text_to_markdown()` logs them and keeps the input.

#ifndef DOCMD_DOC_HTML_MARKUP_HPP
#define DOCMD_DOC_HTML_MARKUP_HPP

#include "common.hpp"
#include "doc/markup_tree.hpp"
#include "doc/render_options.hpp"

#include <string>
#include <string_view>

namespace docmd::doc {

/// Why markup conversion failed.
struct MarkupError {
    std::string message;
};

/// Returns true if some opening tag `<name ...>` has a matching `</name>`
/// anywhere after it.
///
/// This only looks for a later closing tag of the same name; it does not
/// check nesting or balance.
[[nodiscard]] auto is_html_like(std::string_view text) -> bool;

/// Parses `text` into a markup tree whose root is the synthetic wrapper.
///
/// @param text Markup-like text.
/// @param options Supplies the maximum element depth.
/// @returns The wrapper element, or why parsing failed.
[[nodiscard]] auto parse_markup(std::string_view text, const RenderOptions& options = {})
    -> Result<MarkupNode, MarkupError>;

/// Converts HTML-like text to Markdown.
///
/// Callers normally check `is_html_like()` first; text without markup comes
/// back with only its inline directives resolved.
[[nodiscard]] auto html_to_markdown(std::string_view text, const RenderOptions& options = {})
    -> Result<std::string, MarkupError>;

/// Renders raw comment text (no pre-parsed tree available) to Markdown.
///
/// Converts markup when the text looks like HTML, falling back to the
/// original text on failure, then resolves inline directives.
[[nodiscard]] auto raw_text_to_markdown(std::string_view text, const RenderOptions& options = {})
    -> std::string;

} // namespace docmd::doc

#endif // DOCMD_DOC_HTML_MARKUP_HPP
