//! # Render Options
//!
//! Limits shared by every rendering entry point. All entry points take the
//! options by const reference and default them, so callers that do not care
//! can ignore this header.

#ifndef DOCMD_DOC_RENDER_OPTIONS_HPP
#define DOCMD_DOC_RENDER_OPTIONS_HPP

#include <cstddef>

namespace docmd::doc {

/// Configuration for one rendering call.
struct RenderOptions {
    /// Maximum nesting of `{...}` groups the directive parser accepts.
    /// Deeper input is treated as malformed and the text is left untouched.
    size_t max_directive_depth = 64;

    /// Maximum element depth accepted by the markup converter, and the
    /// maximum link-label / see-reference nesting the tree renderer follows.
    size_t max_markup_depth = 256;
};

} // namespace docmd::doc

#endif // DOCMD_DOC_RENDER_OPTIONS_HPP
