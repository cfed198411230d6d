//! # Block-Tag Formatter Implementation

#include "doc/block_tags.hpp"

#include "doc/text.hpp"
#include "doc/tree_renderer.hpp"
#include "log/log.hpp"

namespace docmd::doc {

namespace {

/// `label body`, or just `label` when the body is blank.
auto format_block(std::string label, const std::string& body) -> std::string {
    if (is_blank(body)) {
        return label;
    }
    label += ' ';
    label += body;
    return label;
}

/// `label - description`, or just `label` when the description is blank.
auto format_described(std::string label, const std::string& description) -> std::string {
    if (is_blank(description)) {
        return label;
    }
    label += " - ";
    label += description;
    return label;
}

} // namespace

auto render_block_tag(const BlockTag& tag, const RenderOptions& options) -> std::string {
    return std::visit(
        [&options](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, AuthorTag>) {
                return format_block("@author", render_nodes(t.name, options));
            } else if constexpr (std::is_same_v<T, SinceTag>) {
                return format_block("@since", render_nodes(t.body, options));
            } else if constexpr (std::is_same_v<T, SeeTag>) {
                return format_block("@see", render_nodes(t.reference, options));
            } else if constexpr (std::is_same_v<T, ParamTag>) {
                std::string label = t.is_type_param ? "@typeparam" : "@param";
                label = format_block(std::move(label), t.name);
                return format_described(std::move(label), render_nodes(t.description, options));
            } else if constexpr (std::is_same_v<T, ReturnTag>) {
                return format_block("@return", render_nodes(t.description, options));
            } else if constexpr (std::is_same_v<T, ThrowsTag>) {
                auto label = format_block("@throws", t.exception_name);
                return format_described(std::move(label), render_nodes(t.description, options));
            } else if constexpr (std::is_same_v<T, DeprecatedTag>) {
                return format_block("@deprecated", render_nodes(t.body, options));
            } else if constexpr (std::is_same_v<T, UnknownBlockTag>) {
                return t.raw_text;
            } else {
                static_assert(unhandled_kind_v<T>, "unhandled BlockTag kind");
            }
        },
        tag.kind);
}

auto render_block_tags(const std::vector<BlockTag>& tags, const RenderOptions& options)
    -> std::string {
    std::string joined;
    for (size_t i = 0; i < tags.size(); ++i) {
        if (i > 0) {
            joined += '\n';
        }
        DOCMD_LOG_TRACE("render", "Formatting @" << block_tag_name(tags[i]) << " tag");
        joined += render_block_tag(tags[i], options);
    }
    return normalize_markdown(joined, options);
}

} // namespace docmd::doc
