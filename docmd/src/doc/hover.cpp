//! # Hover Composition Implementation

#include "doc/hover.hpp"

namespace docmd::doc {

namespace {

constexpr std::string_view DOCS_SEPARATOR = "\n\n---\n\n";
constexpr std::string_view DEFAULT_PACKAGE = "(default package)";

void append_docs(std::string& markdown, std::string_view docs) {
    if (docs.empty()) {
        return;
    }
    markdown += DOCS_SEPARATOR;
    markdown += docs;
}

} // namespace

auto compose_hover(std::string_view signature, std::string_view docs, std::string_view language)
    -> MarkupContent {
    std::string markdown = "```";
    markdown += language;
    markdown += '\n';
    markdown += signature;
    markdown += "\n```";
    append_docs(markdown, docs);
    return MarkupContent{MarkupKind::Markdown, std::move(markdown)};
}

auto compose_type_hover(std::string_view qualified_name, std::string_view signature,
                        std::string_view docs) -> MarkupContent {
    auto package = package_name(qualified_name);
    if (package.empty()) {
        package = DEFAULT_PACKAGE;
    }

    std::string markdown = "**" + package + "**\n";
    markdown += signature;
    append_docs(markdown, docs);
    return MarkupContent{MarkupKind::Markdown, std::move(markdown)};
}

auto package_name(std::string_view qualified_name) -> std::string {
    auto last_dot = qualified_name.rfind('.');
    if (last_dot == std::string_view::npos) {
        return "";
    }
    return std::string(qualified_name.substr(0, last_dot));
}

} // namespace docmd::doc
