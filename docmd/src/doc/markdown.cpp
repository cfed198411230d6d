//! # Comment to Markdown Implementation
//!
//! Joins the rendered first sentence, body and block tags with a blank line,
//! skipping sections that render blank.

#include "doc/markdown.hpp"

#include "doc/block_tags.hpp"
#include "doc/text.hpp"
#include "doc/tree_renderer.hpp"

namespace docmd::doc {

auto markup_kind_to_string(MarkupKind kind) -> std::string_view {
    switch (kind) {
    case MarkupKind::Markdown:
        return "markdown";
    case MarkupKind::PlainText:
        return "plaintext";
    }
    return "plaintext";
}

auto comment_to_markdown(const DocComment& comment, const RenderOptions& options)
    -> std::string {
    const std::string sections[] = {
        render_nodes(comment.first_sentence, options),
        render_nodes(comment.body, options),
        render_block_tags(comment.block_tags, options),
    };

    std::string out;
    for (const auto& section : sections) {
        if (is_blank(section)) {
            continue;
        }
        if (!out.empty()) {
            out += "\n\n";
        }
        out += section;
    }
    return out;
}

auto comment_to_markup_content(const DocComment& comment, const RenderOptions& options)
    -> MarkupContent {
    return MarkupContent{MarkupKind::Markdown, comment_to_markdown(comment, options)};
}

} // namespace docmd::doc
