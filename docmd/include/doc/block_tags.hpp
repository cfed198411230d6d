//! # Block-Tag Formatter
//!
//! Formats the trailing block tags of a comment (`@param`, `@return`, ...)
//! as one Markdown line each:
//!
//! ```text
//! @param count - number of items
//! @throws IOException - if the file is gone
//! @since 1.2
//! ```
//!
//! A blank description drops the separator as well, leaving just the label.

#ifndef DOCMD_DOC_BLOCK_TAGS_HPP
#define DOCMD_DOC_BLOCK_TAGS_HPP

#include "doc/doc_tree.hpp"
#include "doc/render_options.hpp"

#include <string>
#include <vector>

namespace docmd::doc {

/// Formats a single block tag.
[[nodiscard]] auto render_block_tag(const BlockTag& tag, const RenderOptions& options = {})
    -> std::string;

/// Formats all block tags, one per line, and normalizes the result.
[[nodiscard]] auto render_block_tags(const std::vector<BlockTag>& tags,
                                     const RenderOptions& options = {}) -> std::string;

} // namespace docmd::doc

#endif // DOCMD_DOC_BLOCK_TAGS_HPP
