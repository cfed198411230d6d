//! # HTML-Like Markup Converter Implementation
//!
//! libxml2's HTML parser does the permissive parsing (recover mode, no
//! implied `<html>`/`<body>`, no network). Its tree is copied into a
//! `MarkupNode` tree right away so that rewriting and serialization never
//! touch libxml2 state.
//!
//! Directive output reaches the parser escaped inside `<docmd-md>` elements
//! (see `DirectiveTarget::Markup`). Those elements become Markdown nodes
//! holding their decoded text, so code spans keep their literal `<` and `&`.

#include "doc/html_markup.hpp"

#include "doc/entities.hpp"
#include "doc/inline_directives.hpp"
#include "doc/text.hpp"
#include "log/log.hpp"

#include <cctype>
#include <climits>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

namespace docmd::doc {

namespace {

/// Name of the synthetic element wrapped around the converter input.
constexpr std::string_view ROOT_TAG = "docmd-root";

constexpr int PARSE_OPTIONS = HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING |
                              HTML_PARSE_NONET | HTML_PARSE_NOIMPLIED | HTML_PARSE_NODEFDTD;

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const {
        xmlFreeDoc(doc);
    }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct XmlCharDeleter {
    void operator()(xmlChar* chars) const {
        xmlFree(chars);
    }
};

using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

void ensure_parser_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { xmlInitParser(); });
}

auto to_string(const xmlChar* chars) -> std::string {
    return chars ? std::string(reinterpret_cast<const char*>(chars)) : std::string();
}

auto is_word_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

auto is_root_element(const xmlNode* node) -> bool {
    return node->type == XML_ELEMENT_NODE && node->name != nullptr &&
           to_string(node->name) == ROOT_TAG;
}

/// Depth-first search for the synthetic root among `first` and its siblings.
auto find_root_element(xmlNode* first, size_t depth, size_t max_depth) -> xmlNode* {
    if (depth > max_depth) {
        return nullptr;
    }
    for (xmlNode* node = first; node != nullptr; node = node->next) {
        if (is_root_element(node)) {
            return node;
        }
        if (node->type == XML_ELEMENT_NODE) {
            if (xmlNode* found = find_root_element(node->children, depth + 1, max_depth)) {
                return found;
            }
        }
    }
    return nullptr;
}

/// Copies a libxml2 subtree into MarkupNode form.
class TreeBuilder {
public:
    explicit TreeBuilder(size_t max_depth) : max_depth_(max_depth) {}

    auto build(xmlNode* root) -> Result<MarkupNode, MarkupError> {
        MarkupNode wrapper = MarkupNode::element(std::string(ROOT_TAG));
        if (!copy_children(root->children, wrapper, 1)) {
            return *error_;
        }
        return wrapper;
    }

private:
    size_t max_depth_;
    std::optional<MarkupError> error_;

    static void append_text(MarkupNode& parent, std::string text) {
        if (!parent.children.empty() && parent.children.back().kind == MarkupNodeKind::Text) {
            parent.children.back().text += text;
            return;
        }
        parent.children.push_back(MarkupNode::text_node(std::move(text)));
    }

    auto copy_element(xmlNode* node, MarkupNode& parent, size_t depth) -> bool {
        if (depth > max_depth_) {
            error_ = MarkupError{"element nesting deeper than " + std::to_string(max_depth_)};
            return false;
        }

        auto name = to_lower(to_string(node->name));
        if (name == DIRECTIVE_MARKDOWN_TAG) {
            XmlCharPtr content(xmlNodeGetContent(node));
            parent.children.push_back(MarkupNode::markdown_node(to_string(content.get())));
            return true;
        }

        MarkupNode element = MarkupNode::element(std::move(name));
        for (xmlAttr* attr = node->properties; attr != nullptr; attr = attr->next) {
            XmlCharPtr value(xmlGetProp(node, attr->name));
            element.attributes.push_back(
                MarkupAttribute{to_string(attr->name), to_string(value.get())});
        }
        if (!copy_children(node->children, element, depth + 1)) {
            return false;
        }
        parent.children.push_back(std::move(element));
        return true;
    }

    auto copy_children(xmlNode* first, MarkupNode& parent, size_t depth) -> bool {
        for (xmlNode* node = first; node != nullptr; node = node->next) {
            switch (node->type) {
            case XML_ELEMENT_NODE:
                if (!copy_element(node, parent, depth)) {
                    return false;
                }
                break;
            case XML_TEXT_NODE:
            case XML_CDATA_SECTION_NODE:
                append_text(parent, to_string(node->content));
                break;
            case XML_ENTITY_REF_NODE:
                append_text(parent, decode_entity(to_string(node->name)));
                break;
            default:
                // Comments and processing instructions carry no text.
                break;
            }
        }
        return true;
    }
};

} // namespace

auto is_html_like(std::string_view text) -> bool {
    // Last offset of each `</name>` seen so far, npos when absent.
    std::unordered_map<std::string_view, size_t> last_close;

    size_t pos = 0;
    while ((pos = text.find('<', pos)) != std::string_view::npos) {
        size_t name_end = pos + 1;
        while (name_end < text.size() && is_word_char(text[name_end])) {
            ++name_end;
        }
        if (name_end == pos + 1) {
            ++pos;
            continue;
        }

        size_t tag_end = text.find('>', name_end);
        if (tag_end == std::string_view::npos) {
            return false;
        }

        auto name = text.substr(pos + 1, name_end - pos - 1);
        auto [it, inserted] = last_close.try_emplace(name, std::string_view::npos);
        if (inserted) {
            std::string close = "</" + std::string(name) + ">";
            it->second = text.rfind(close);
        }
        if (it->second != std::string_view::npos && it->second > tag_end) {
            return true;
        }
        pos = tag_end + 1;
    }
    return false;
}

auto parse_markup(std::string_view text, const RenderOptions& options)
    -> Result<MarkupNode, MarkupError> {
    std::string wrapped;
    wrapped.reserve(text.size() + 2 * ROOT_TAG.size() + 5);
    wrapped += '<';
    wrapped += ROOT_TAG;
    wrapped += '>';
    wrapped += text;
    wrapped += "</";
    wrapped += ROOT_TAG;
    wrapped += '>';

    if (wrapped.size() > static_cast<size_t>(INT_MAX)) {
        return MarkupError{"input too large"};
    }

    ensure_parser_initialized();
    XmlDocPtr doc(htmlReadMemory(wrapped.data(), static_cast<int>(wrapped.size()), nullptr,
                                 "UTF-8", PARSE_OPTIONS));
    if (!doc) {
        return MarkupError{"HTML parser produced no document"};
    }

    xmlNode* root = find_root_element(doc->children, 0, options.max_markup_depth);
    if (root == nullptr) {
        return MarkupError{"synthetic root element missing from parsed document"};
    }

    TreeBuilder builder(options.max_markup_depth);
    return builder.build(root);
}

auto html_to_markdown(std::string_view text, const RenderOptions& options)
    -> Result<std::string, MarkupError> {
    auto resolved = replace_inline_directives(text, options, DirectiveTarget::Markup);

    auto parsed = parse_markup(resolved, options);
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }

    auto rewritten = rewrite_elements(unwrap(parsed), markdown_rewrite_rules());
    return serialize_children(rewritten);
}

auto raw_text_to_markdown(std::string_view text, const RenderOptions& options) -> std::string {
    std::string result(text);

    if (is_html_like(result)) {
        auto converted = html_to_markdown(result, options);
        if (is_ok(converted)) {
            result = std::move(unwrap(converted));
        } else {
            DOCMD_LOG_DEBUG("markup", "Failed to convert HTML, falling back to plain text: "
                                          << unwrap_err(converted).message);
        }
    }

    return replace_inline_directives(result, options);
}

} // namespace docmd::doc
