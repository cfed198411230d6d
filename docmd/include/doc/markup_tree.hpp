//! # Generic Markup Tree
//!
//! A small owning element tree used by the HTML-like markup converter.
//! Parsing fills it from libxml2; this module rewrites and serializes it.
//!
//! ## Node Kinds
//!
//! | Kind       | Content                     | Serialized as                |
//! |------------|-----------------------------|------------------------------|
//! | `Element`  | name, attributes, children  | `<name a="v">...</name>`     |
//! | `Text`     | decoded source text         | text with `<`, `>`, `&` escaped |
//! | `Markdown` | output of a rewrite rule    | verbatim                     |
//!
//! ## Rewriting
//!
//! `rewrite_elements()` is a strict post-order pass (children first, left to
//! right). An element matching a rule is replaced by a `Markdown` node built
//! from the trimmed text content of its already-rewritten subtree, so
//! `<b><i>x</i></b>` becomes `***x***` and tags without a rule inside a
//! rewritten element are flattened to their text.

#ifndef DOCMD_DOC_MARKUP_TREE_HPP
#define DOCMD_DOC_MARKUP_TREE_HPP

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace docmd::doc {

/// The kind of a markup tree node.
enum class MarkupNodeKind {
    Element,  ///< An element with children.
    Text,     ///< Character data from the source.
    Markdown, ///< Markdown produced by a rewrite rule.
};

/// An element attribute. Kept for serialization, never interpreted.
struct MarkupAttribute {
    std::string name;
    std::string value;
};

/// A node of the generic markup tree.
struct MarkupNode {
    MarkupNodeKind kind = MarkupNodeKind::Text;
    std::string name;                        ///< Lower-case tag name (elements only).
    std::vector<MarkupAttribute> attributes; ///< Attributes (elements only).
    std::vector<MarkupNode> children;        ///< Children (elements only).
    std::string text;                        ///< Content (text and Markdown nodes).

    /// Creates an element node without attributes or children.
    [[nodiscard]] static auto element(std::string name) -> MarkupNode;

    /// Creates a source text node.
    [[nodiscard]] static auto text_node(std::string text) -> MarkupNode;

    /// Creates a Markdown node.
    [[nodiscard]] static auto markdown_node(std::string markdown) -> MarkupNode;
};

/// Replaces elements named `tag` with `prefix + content + suffix`.
struct RewriteRule {
    std::string_view tag;
    std::string_view prefix;
    std::string_view suffix;
};

/// The element-to-Markdown rules: `i`, `b`, `pre`, `code` and `a`.
[[nodiscard]] auto markdown_rewrite_rules() -> std::span<const RewriteRule>;

/// Concatenated text of all text and Markdown nodes below `node`.
[[nodiscard]] auto text_content(const MarkupNode& node) -> std::string;

/// Returns a rewritten copy of `root`. The root itself is never replaced.
[[nodiscard]] auto rewrite_elements(const MarkupNode& root, std::span<const RewriteRule> rules)
    -> MarkupNode;

/// Serializes a node, including its own tags when it is an element.
[[nodiscard]] auto serialize(const MarkupNode& node) -> std::string;

/// Serializes only the children of `node`, i.e. strips its own tags.
[[nodiscard]] auto serialize_children(const MarkupNode& node) -> std::string;

} // namespace docmd::doc

#endif // DOCMD_DOC_MARKUP_TREE_HPP
