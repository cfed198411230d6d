//! # Documentation Tree
//!
//! This module defines the pre-parsed documentation tree the renderer
//! consumes. The tree is produced by an external comment parser; docmd only
//! reads it.
//!
//! ## Architecture
//!
//! - `DocNode`: one inline node (text run, literal, link, markup marker, ...)
//! - `BlockTag`: one block-level tag (`@param`, `@return`, `@throws`, ...)
//! - `DocComment`: the summary, body and block tags of one declaration
//!
//! Both `DocNode` and `BlockTag` hold a closed `std::variant` named `kind`,
//! so visitors can be checked for exhaustiveness at compile time.
//!
//! ## Usage
//!
//! ```cpp
//! DocNodes nodes = {
//!     DocNode{TextNode{"Computes "}},
//!     DocNode{LiteralNode{"sum"}},
//! };
//! std::string markdown = render_nodes(nodes);   // "Computes `sum`"
//! ```

#ifndef DOCMD_DOC_DOC_TREE_HPP
#define DOCMD_DOC_DOC_TREE_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace docmd::doc {

struct DocNode;

/// An ordered run of documentation nodes.
using DocNodes = std::vector<DocNode>;

// ============================================================================
// Inline Nodes
// ============================================================================

/// Plain prose. Whitespace is collapsed unless inside `<code>`/`<pre>`.
struct TextNode {
    std::string body;
};

/// `{@literal ...}` or `{@code ...}` content, rendered verbatim in backticks.
struct LiteralNode {
    std::string body;
};

/// `{@link reference label}`. An empty `label` means no label was written.
struct LinkNode {
    DocNodes label;
    std::string reference;
};

/// A reference appearing inline, rendered as its own text.
struct SeeReferenceNode {
    DocNodes reference;
};

/// Opening markup element, e.g. `<code>`.
struct MarkupStartNode {
    std::string name;
};

/// Closing markup element, e.g. `</code>`.
struct MarkupEndNode {
    std::string name;
};

/// Named character reference without `&` and `;`, e.g. `lt`.
struct EntityNode {
    std::string name;
};

/// Text the comment parser could not make sense of.
struct ErroneousNode {
    std::string body;
};

/// An inline tag or element the comment parser did not recognize.
struct UnknownTagNode {
    std::string raw_text;
};

/// A documentation tree node.
struct DocNode {
    std::variant<TextNode, LiteralNode, LinkNode, SeeReferenceNode, MarkupStartNode,
                 MarkupEndNode, EntityNode, ErroneousNode, UnknownTagNode>
        kind; ///< The node variant.

    /// Checks if this node is of kind `T`.
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this node as kind `T` (const). Throws if not that kind.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }
};

// ============================================================================
// Block Tags
// ============================================================================

/// `@author name`.
struct AuthorTag {
    DocNodes name;
};

/// `@since version`.
struct SinceTag {
    DocNodes body;
};

/// `@see reference`.
struct SeeTag {
    DocNodes reference;
};

/// `@param name description` or `@param <T> description`.
struct ParamTag {
    std::string name;
    bool is_type_param = false;
    DocNodes description;
};

/// `@return description`.
struct ReturnTag {
    DocNodes description;
};

/// `@throws Type description` (also `@exception`).
struct ThrowsTag {
    std::string exception_name;
    DocNodes description;
};

/// `@deprecated reason`.
struct DeprecatedTag {
    DocNodes body;
};

/// Any other block tag, kept as the raw text the comment parser captured.
struct UnknownBlockTag {
    std::string raw_text;
};

/// A block-level documentation tag.
struct BlockTag {
    std::variant<AuthorTag, SinceTag, SeeTag, ParamTag, ReturnTag, ThrowsTag, DeprecatedTag,
                 UnknownBlockTag>
        kind; ///< The tag variant.

    /// Checks if this tag is of kind `T`.
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }
};

// ============================================================================
// DocComment
// ============================================================================

/// The documentation of one declaration, as handed over by the comment parser.
struct DocComment {
    DocNodes first_sentence;           ///< Summary sentence.
    DocNodes body;                     ///< Everything after the summary.
    std::vector<BlockTag> block_tags;  ///< Trailing block tags in source order.
};

/// Helper for exhaustive `if constexpr` visitors: only instantiated (and then
/// failing) when a variant alternative is left unhandled.
template <typename T> inline constexpr bool unhandled_kind_v = !std::is_same_v<T, T>;

/// Name of a node kind for diagnostics ("text", "link", ...).
[[nodiscard]] auto node_kind_name(const DocNode& node) -> std::string_view;

/// Tag name of a block tag for diagnostics ("param", "throws", ...).
[[nodiscard]] auto block_tag_name(const BlockTag& tag) -> std::string_view;

} // namespace docmd::doc

#endif // DOCMD_DOC_DOC_TREE_HPP
