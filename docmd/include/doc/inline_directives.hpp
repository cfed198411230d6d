//! # Inline Directive Parser
//!
//! Resolves brace-delimited inline directives in comment prose:
//!
//! - `{@code x}`, `{@link Foo#bar}`, `{@linkplain Foo}` become `` `x` ``,
//!   `` `Foo#bar` ``, `` `Foo` ``
//! - `{@literal a<b}` becomes `a<b`
//! - any other `{@name ...}` keeps its content and drops the braces
//! - a plain `{...}` group keeps its content and drops the braces
//!
//! Nested groups are resolved recursively, so `{@code Map{K}}` yields
//! `` `MapK` ``. Everything outside braces is copied through unchanged.
//!
//! ## Error Recovery
//!
//! A `{` that is never closed makes the whole parse fail. Most callers want
//! `replace_inline_directives()`, which returns the original text in that case.
//!
//! ## Output Targets
//!
//! With `DirectiveTarget::Markup` the output is meant for the markup parser:
//! everything a `code`, `link`, `linkplain` or `literal` directive produces is
//! HTML-escaped and wrapped in a `<docmd-md>` element, so `{@code List<T>}`
//! reaches the parser as character data instead of a `<T>` tag.

#ifndef DOCMD_DOC_INLINE_DIRECTIVES_HPP
#define DOCMD_DOC_INLINE_DIRECTIVES_HPP

#include "common.hpp"
#include "doc/render_options.hpp"

#include <string>
#include <string_view>

namespace docmd::doc {

/// Element name wrapping directive output in `DirectiveTarget::Markup` mode.
inline constexpr std::string_view DIRECTIVE_MARKDOWN_TAG = "docmd-md";

/// Where the resolved text goes.
enum class DirectiveTarget {
    Text,   ///< Plain Markdown text.
    Markup, ///< Input to the markup parser; directive output is escaped and wrapped.
};

/// Why a directive parse failed.
struct DirectiveError {
    std::string message; ///< Human-readable description.
    size_t position;     ///< Byte offset in the input where parsing stopped.
};

/// Parses `text` and resolves every inline directive.
///
/// @param text The comment text.
/// @param options Supplies the maximum brace nesting depth.
/// @param target How directive output is written.
/// @returns The transformed text, or the reason the braces did not balance.
[[nodiscard]] auto parse_inline_directives(std::string_view text,
                                           const RenderOptions& options = {},
                                           DirectiveTarget target = DirectiveTarget::Text)
    -> Result<std::string, DirectiveError>;

/// Best-effort variant of parse_inline_directives().
///
/// Returns the original text when it cannot be parsed.
[[nodiscard]] auto replace_inline_directives(std::string_view text,
                                             const RenderOptions& options = {},
                                             DirectiveTarget target = DirectiveTarget::Text)
    -> std::string;

} // namespace docmd::doc

#endif // DOCMD_DOC_INLINE_DIRECTIVES_HPP
