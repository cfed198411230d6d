//! # Documentation Tree Renderer
//!
//! Renders a `DocNodes` sequence to Markdown.
//!
//! ## Node Rendering
//!
//! | Node            | Markdown                                             |
//! |-----------------|------------------------------------------------------|
//! | `Text`          | whitespace collapsed, verbatim inside `code`/`pre`   |
//! | `Literal`       | `` `body` ``                                         |
//! | `Link`          | rendered label, else `` `reference` ``               |
//! | `SeeReference`  | rendered reference                                   |
//! | `MarkupStart`   | token for `p`, `br`, `pre`, `code`, `b`/`strong`, `i`/`em` |
//! | `MarkupEnd`     | closing token for the same set (`br` has none)       |
//! | `Entity`        | decoded character                                    |
//! | `Erroneous`     | raw body                                             |
//! | `UnknownTag`    | raw text                                             |
//!
//! The result is passed through `normalize_markdown()`.

#ifndef DOCMD_DOC_TREE_RENDERER_HPP
#define DOCMD_DOC_TREE_RENDERER_HPP

#include "doc/doc_tree.hpp"
#include "doc/render_options.hpp"

#include <string>
#include <string_view>

namespace docmd::doc {

/// Renders a node sequence to normalized Markdown.
///
/// @param nodes The nodes, in document order.
/// @param options Rendering limits.
/// @returns Markdown text; empty when the nodes render to nothing.
[[nodiscard]] auto render_nodes(const DocNodes& nodes, const RenderOptions& options = {})
    -> std::string;

/// Collapses prose whitespace: a whitespace run containing a line break
/// becomes one space, and runs of spaces become one space.
[[nodiscard]] auto collapse_whitespace(std::string_view text) -> std::string;

/// Final clean-up applied to every rendered section.
///
/// Trims the text, drops spaces and tabs before line breaks, collapses three
/// or more consecutive line breaks to two and resolves inline directives.
[[nodiscard]] auto normalize_markdown(std::string_view text, const RenderOptions& options = {})
    -> std::string;

} // namespace docmd::doc

#endif // DOCMD_DOC_TREE_RENDERER_HPP
