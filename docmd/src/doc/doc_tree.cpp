//! # Documentation Tree Implementation
//!
//! Diagnostic names for node and block-tag kinds.

#include "doc/doc_tree.hpp"

namespace docmd::doc {

auto node_kind_name(const DocNode& node) -> std::string_view {
    return std::visit(
        [](const auto& n) -> std::string_view {
            using T = std::decay_t<decltype(n)>;

            if constexpr (std::is_same_v<T, TextNode>) {
                return "text";
            } else if constexpr (std::is_same_v<T, LiteralNode>) {
                return "literal";
            } else if constexpr (std::is_same_v<T, LinkNode>) {
                return "link";
            } else if constexpr (std::is_same_v<T, SeeReferenceNode>) {
                return "see";
            } else if constexpr (std::is_same_v<T, MarkupStartNode>) {
                return "start_element";
            } else if constexpr (std::is_same_v<T, MarkupEndNode>) {
                return "end_element";
            } else if constexpr (std::is_same_v<T, EntityNode>) {
                return "entity";
            } else if constexpr (std::is_same_v<T, ErroneousNode>) {
                return "erroneous";
            } else if constexpr (std::is_same_v<T, UnknownTagNode>) {
                return "unknown_tag";
            } else {
                static_assert(unhandled_kind_v<T>, "unhandled DocNode kind");
            }
        },
        node.kind);
}

auto block_tag_name(const BlockTag& tag) -> std::string_view {
    return std::visit(
        [](const auto& t) -> std::string_view {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, AuthorTag>) {
                return "author";
            } else if constexpr (std::is_same_v<T, SinceTag>) {
                return "since";
            } else if constexpr (std::is_same_v<T, SeeTag>) {
                return "see";
            } else if constexpr (std::is_same_v<T, ParamTag>) {
                return t.is_type_param ? "typeparam" : "param";
            } else if constexpr (std::is_same_v<T, ReturnTag>) {
                return "return";
            } else if constexpr (std::is_same_v<T, ThrowsTag>) {
                return "throws";
            } else if constexpr (std::is_same_v<T, DeprecatedTag>) {
                return "deprecated";
            } else if constexpr (std::is_same_v<T, UnknownBlockTag>) {
                return "unknown";
            } else {
                static_assert(unhandled_kind_v<T>, "unhandled BlockTag kind");
            }
        },
        tag.kind);
}

} // namespace docmd::doc
