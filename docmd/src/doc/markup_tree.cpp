//! # Generic Markup Tree Implementation

#include "doc/markup_tree.hpp"

#include "doc/text.hpp"

#include <algorithm>
#include <array>

namespace docmd::doc {

namespace {

constexpr std::array<RewriteRule, 5> MARKDOWN_RULES = {{
    {"i", "*", "*"},
    {"b", "**", "**"},
    {"pre", "`", "`"},
    {"code", "`", "`"},
    {"a", "", ""},
}};

void append_escaped(std::string& out, std::string_view text, bool in_attribute) {
    for (char c : text) {
        switch (c) {
        case '&':
            out += "&amp;";
            break;
        case '<':
            out += "&lt;";
            break;
        case '>':
            out += "&gt;";
            break;
        case '"':
            if (in_attribute) {
                out += "&quot;";
            } else {
                out += c;
            }
            break;
        default:
            out += c;
        }
    }
}

void append_text_content(const MarkupNode& node, std::string& out) {
    if (node.kind != MarkupNodeKind::Element) {
        out += node.text;
        return;
    }
    for (const auto& child : node.children) {
        append_text_content(child, out);
    }
}

void append_serialized(const MarkupNode& node, std::string& out) {
    switch (node.kind) {
    case MarkupNodeKind::Text:
        append_escaped(out, node.text, false);
        return;
    case MarkupNodeKind::Markdown:
        out += node.text;
        return;
    case MarkupNodeKind::Element:
        break;
    }

    out += '<';
    out += node.name;
    for (const auto& attr : node.attributes) {
        out += ' ';
        out += attr.name;
        out += "=\"";
        append_escaped(out, attr.value, true);
        out += '"';
    }
    if (node.children.empty()) {
        out += "/>";
        return;
    }
    out += '>';
    for (const auto& child : node.children) {
        append_serialized(child, out);
    }
    out += "</";
    out += node.name;
    out += '>';
}

auto find_rule(std::string_view tag, std::span<const RewriteRule> rules) -> const RewriteRule* {
    auto it = std::find_if(rules.begin(), rules.end(),
                           [tag](const RewriteRule& rule) { return rule.tag == tag; });
    return it == rules.end() ? nullptr : &*it;
}

auto rewrite_node(const MarkupNode& node, std::span<const RewriteRule> rules, bool is_root)
    -> MarkupNode {
    if (node.kind != MarkupNodeKind::Element) {
        return node;
    }

    MarkupNode rewritten = MarkupNode::element(node.name);
    rewritten.attributes = node.attributes;
    rewritten.children.reserve(node.children.size());
    for (const auto& child : node.children) {
        rewritten.children.push_back(rewrite_node(child, rules, false));
    }

    if (is_root) {
        return rewritten;
    }
    const RewriteRule* rule = find_rule(rewritten.name, rules);
    if (rule == nullptr) {
        return rewritten;
    }

    std::string markdown(rule->prefix);
    markdown += trim(text_content(rewritten));
    markdown += rule->suffix;
    return MarkupNode::markdown_node(std::move(markdown));
}

} // namespace

auto MarkupNode::element(std::string name) -> MarkupNode {
    MarkupNode node;
    node.kind = MarkupNodeKind::Element;
    node.name = std::move(name);
    return node;
}

auto MarkupNode::text_node(std::string text) -> MarkupNode {
    MarkupNode node;
    node.kind = MarkupNodeKind::Text;
    node.text = std::move(text);
    return node;
}

auto MarkupNode::markdown_node(std::string markdown) -> MarkupNode {
    MarkupNode node;
    node.kind = MarkupNodeKind::Markdown;
    node.text = std::move(markdown);
    return node;
}

auto markdown_rewrite_rules() -> std::span<const RewriteRule> {
    return MARKDOWN_RULES;
}

auto text_content(const MarkupNode& node) -> std::string {
    std::string out;
    append_text_content(node, out);
    return out;
}

auto rewrite_elements(const MarkupNode& root, std::span<const RewriteRule> rules) -> MarkupNode {
    return rewrite_node(root, rules, true);
}

auto serialize(const MarkupNode& node) -> std::string {
    std::string out;
    append_serialized(node, out);
    return out;
}

auto serialize_children(const MarkupNode& node) -> std::string {
    std::string out;
    for (const auto& child : node.children) {
        append_serialized(child, out);
    }
    return out;
}

} // namespace docmd::doc
