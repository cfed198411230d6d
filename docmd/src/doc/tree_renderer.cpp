//! # Documentation Tree Renderer Implementation

#include "doc/tree_renderer.hpp"

#include "doc/entities.hpp"
#include "doc/inline_directives.hpp"
#include "doc/text.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <vector>

namespace docmd::doc {

namespace {

auto open_token(std::string_view name) -> std::string_view {
    if (name == "p") {
        return "\n\n";
    }
    if (name == "br") {
        return "\n";
    }
    if (name == "pre") {
        return "\n\n```\n";
    }
    if (name == "code") {
        return "`";
    }
    if (name == "b" || name == "strong") {
        return "**";
    }
    if (name == "i" || name == "em") {
        return "*";
    }
    return "";
}

auto close_token(std::string_view name) -> std::string_view {
    if (name == "p") {
        return "\n\n";
    }
    if (name == "pre") {
        return "\n```\n";
    }
    if (name == "br") {
        return "";
    }
    return open_token(name);
}

auto render_at_depth(const DocNodes& nodes, const RenderOptions& options, size_t depth)
    -> std::string;

/// Walks one node sequence. Link labels and see-references are rendered by a
/// nested renderer with its own open-markup stack.
class TreeRenderer {
public:
    TreeRenderer(const RenderOptions& options, size_t depth) : options_(options), depth_(depth) {}

    void render(const DocNode& node) {
        std::visit(
            [this, &node](const auto& n) {
                using T = std::decay_t<decltype(n)>;

                if constexpr (std::is_same_v<T, TextNode>) {
                    out_ += in_code_or_pre() ? n.body : collapse_whitespace(n.body);
                } else if constexpr (std::is_same_v<T, LiteralNode>) {
                    out_ += '`';
                    out_ += n.body;
                    out_ += '`';
                } else if constexpr (std::is_same_v<T, LinkNode>) {
                    render_link(n);
                } else if constexpr (std::is_same_v<T, SeeReferenceNode>) {
                    out_ += render_at_depth(n.reference, options_, depth_ + 1);
                } else if constexpr (std::is_same_v<T, MarkupStartNode>) {
                    auto name = to_lower(n.name);
                    out_ += open_token(name);
                    open_tags_.push_back(std::move(name));
                } else if constexpr (std::is_same_v<T, MarkupEndNode>) {
                    auto name = to_lower(n.name);
                    out_ += close_token(name);
                    close_tag(name);
                } else if constexpr (std::is_same_v<T, EntityNode>) {
                    out_ += decode_entity(n.name);
                } else if constexpr (std::is_same_v<T, ErroneousNode>) {
                    DOCMD_LOG_TRACE("render", "Copying " << node_kind_name(node) << " node as-is");
                    out_ += n.body;
                } else if constexpr (std::is_same_v<T, UnknownTagNode>) {
                    DOCMD_LOG_TRACE("render", "Copying " << node_kind_name(node) << " node as-is");
                    out_ += n.raw_text;
                } else {
                    static_assert(unhandled_kind_v<T>, "unhandled DocNode kind");
                }
            },
            node.kind);
    }

    auto take() -> std::string {
        return std::move(out_);
    }

private:
    const RenderOptions& options_;
    size_t depth_;
    std::vector<std::string> open_tags_;
    std::string out_;

    auto in_code_or_pre() const -> bool {
        return std::any_of(open_tags_.begin(), open_tags_.end(), [](const std::string& tag) {
            return tag == "code" || tag == "pre";
        });
    }

    /// Removes the most recently opened element with this name.
    void close_tag(const std::string& name) {
        auto it = std::find(open_tags_.rbegin(), open_tags_.rend(), name);
        if (it == open_tags_.rend()) {
            DOCMD_LOG_TRACE("render", "Closing </" << name << "> that was never opened");
            return;
        }
        open_tags_.erase(std::next(it).base());
    }

    void render_link(const LinkNode& link) {
        auto label = render_at_depth(link.label, options_, depth_ + 1);
        if (!is_blank(label)) {
            out_ += label;
            return;
        }
        if (!is_blank(link.reference)) {
            out_ += '`';
            out_ += link.reference;
            out_ += '`';
        }
    }
};

auto render_at_depth(const DocNodes& nodes, const RenderOptions& options, size_t depth)
    -> std::string {
    if (depth > options.max_markup_depth) {
        DOCMD_LOG_DEBUG("render", "Dropping nested reference deeper than "
                                      << options.max_markup_depth);
        return "";
    }

    TreeRenderer renderer(options, depth);
    for (const auto& node : nodes) {
        renderer.render(node);
    }
    return normalize_markdown(renderer.take(), options);
}

} // namespace

auto render_nodes(const DocNodes& nodes, const RenderOptions& options) -> std::string {
    return render_at_depth(nodes, options, 0);
}

auto collapse_whitespace(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        if (!is_space(text[i])) {
            out += text[i++];
            continue;
        }

        size_t run_end = i;
        bool has_newline = false;
        while (run_end < text.size() && is_space(text[run_end])) {
            has_newline = has_newline || text[run_end] == '\n';
            ++run_end;
        }

        if (has_newline) {
            out += ' ';
        } else {
            for (size_t j = i; j < run_end; ++j) {
                // Keep one space out of each run of spaces; tabs stay as-is.
                if (text[j] == ' ' && j > i && text[j - 1] == ' ') {
                    continue;
                }
                out += text[j];
            }
        }
        i = run_end;
    }

    return out;
}

auto normalize_markdown(std::string_view text, const RenderOptions& options) -> std::string {
    auto trimmed = trim(text);

    std::string result;
    result.reserve(trimmed.size());
    size_t newlines = 0;
    for (size_t i = 0; i < trimmed.size();) {
        char c = trimmed[i];
        if (c == ' ' || c == '\t') {
            size_t run_end = trimmed.find_first_not_of(" \t", i);
            if (run_end == std::string::npos) {
                run_end = trimmed.size();
            }
            // Trailing blanks before a line break are dropped.
            if (run_end == trimmed.size() || trimmed[run_end] != '\n') {
                result.append(trimmed, i, run_end - i);
                newlines = 0;
            }
            i = run_end;
            continue;
        }
        if (c == '\n') {
            // At most one blank line in a row.
            if (++newlines <= 2) {
                result += c;
            }
        } else {
            newlines = 0;
            result += c;
        }
        ++i;
    }
    return replace_inline_directives(result, options);
}

} // namespace docmd::doc
