//! # Comment to Markdown
//!
//! Assembles the rendered sections of one documentation comment:
//!
//! ```text
//! <first sentence>
//!
//! <body>
//!
//! <block tags>
//! ```
//!
//! Blank sections are left out together with their separator, so an empty
//! comment renders as an empty string.

#ifndef DOCMD_DOC_MARKDOWN_HPP
#define DOCMD_DOC_MARKDOWN_HPP

#include "doc/doc_tree.hpp"
#include "doc/render_options.hpp"

#include <string>
#include <string_view>

namespace docmd::doc {

/// Format of a piece of presentation text.
enum class MarkupKind {
    Markdown,
    PlainText,
};

/// Text handed to a presentation layer, tagged with its format.
struct MarkupContent {
    MarkupKind kind = MarkupKind::Markdown;
    std::string value;
};

/// Returns "markdown" or "plaintext".
[[nodiscard]] auto markup_kind_to_string(MarkupKind kind) -> std::string_view;

/// Renders a whole comment to Markdown.
[[nodiscard]] auto comment_to_markdown(const DocComment& comment,
                                       const RenderOptions& options = {}) -> std::string;

/// Same as `comment_to_markdown()`, tagged as Markdown.
[[nodiscard]] auto comment_to_markup_content(const DocComment& comment,
                                             const RenderOptions& options = {}) -> MarkupContent;

} // namespace docmd::doc

#endif // DOCMD_DOC_MARKDOWN_HPP
