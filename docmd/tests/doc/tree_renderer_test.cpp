#include "doc/tree_renderer.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace docmd::doc;

namespace {

DocNode text(std::string body) {
    return DocNode{TextNode{std::move(body)}};
}

DocNode literal(std::string body) {
    return DocNode{LiteralNode{std::move(body)}};
}

DocNode start(std::string name) {
    return DocNode{MarkupStartNode{std::move(name)}};
}

DocNode end(std::string name) {
    return DocNode{MarkupEndNode{std::move(name)}};
}

DocNode link_to(DocNodes label, std::string reference) {
    return DocNode{LinkNode{std::move(label), std::move(reference)}};
}

} // namespace

// ============================================================================
// End to end
// ============================================================================

TEST(TreeRendererTest, MixedSummary) {
    DocNodes nodes = {text("Computes "), literal("sum"), text(" of "),
                      start("code"),     text("a"),      end("code")};
    EXPECT_EQ(render_nodes(nodes), "Computes `sum` of `a`");
}

TEST(TreeRendererTest, EmptyInput) {
    EXPECT_EQ(render_nodes({}), "");
    EXPECT_EQ(render_nodes({text("  \n ")}), "");
}

// ============================================================================
// Text and whitespace
// ============================================================================

TEST(TreeRendererTest, ProseWhitespaceCollapses) {
    EXPECT_EQ(render_nodes({text("a\n  b")}), "a b");
    EXPECT_EQ(render_nodes({text("a    b")}), "a b");
}

TEST(TreeRendererTest, WhitespaceKeptInsideCode) {
    EXPECT_EQ(render_nodes({start("code"), text("a\n  b"), end("code")}), "`a\n  b`");
}

TEST(TreeRendererTest, WhitespaceKeptInsidePre) {
    DocNodes nodes = {start("pre"), text("int x;\n    x++;"), end("pre")};
    EXPECT_EQ(render_nodes(nodes), "```\nint x;\n    x++;\n```");
}

TEST(TreeRendererTest, TagNamesIgnoreCase) {
    EXPECT_EQ(render_nodes({start("CODE"), text("a  b"), end("Code")}), "`a  b`");
}

TEST(TreeRendererTest, ClosingCodeEndsVerbatimText) {
    DocNodes nodes = {start("code"), text("x"), end("code"), text(" a   b")};
    EXPECT_EQ(render_nodes(nodes), "`x` a b");
}

TEST(TreeRendererTest, CloseRemovesMostRecentMatch) {
    // <pre><code>..</pre> leaves <code> open, so text stays verbatim
    DocNodes nodes = {start("pre"), start("code"), end("pre"), text("a  b")};
    EXPECT_EQ(render_nodes(nodes), "```\n`\n```\na  b");
}

TEST(TreeRendererTest, UnmatchedCloseIsTolerated) {
    EXPECT_EQ(render_nodes({end("i"), text("a   b")}), "*a b");
}

// ============================================================================
// Markup elements
// ============================================================================

TEST(TreeRendererTest, Paragraphs) {
    DocNodes nodes = {text("one"), start("p"), text("two"), end("p"), text("three")};
    EXPECT_EQ(render_nodes(nodes), "one\n\ntwo\n\nthree");
}

TEST(TreeRendererTest, LineBreak) {
    EXPECT_EQ(render_nodes({text("a"), start("br"), text("b")}), "a\nb");
    EXPECT_EQ(render_nodes({text("a"), start("br"), end("br"), text("b")}), "a\nb");
}

TEST(TreeRendererTest, Emphasis) {
    EXPECT_EQ(render_nodes({start("b"), text("x"), end("b")}), "**x**");
    EXPECT_EQ(render_nodes({start("strong"), text("x"), end("strong")}), "**x**");
    EXPECT_EQ(render_nodes({start("i"), text("x"), end("i")}), "*x*");
    EXPECT_EQ(render_nodes({start("em"), text("x"), end("em")}), "*x*");
}

TEST(TreeRendererTest, OtherElementsEmitNothing) {
    EXPECT_EQ(render_nodes({start("ul"), start("li"), text("x"), end("li"), end("ul")}), "x");
}

TEST(TreeRendererTest, ThreeOrMoreBreaksCollapse) {
    DocNodes nodes = {start("pre"), text("a\n\n\n\nb"), end("pre")};
    EXPECT_EQ(render_nodes(nodes), "```\na\n\nb\n```");

    DocNodes paragraphs = {text("a"), start("p"), end("p"), start("p"), text("b")};
    EXPECT_EQ(render_nodes(paragraphs), "a\n\nb");
}

TEST(TreeRendererTest, LongBlankRunsInsidePre) {
    DocNodes spaces = {start("pre"), text("a" + std::string(300000, ' ') + "\nb"), end("pre")};
    EXPECT_EQ(render_nodes(spaces), "```\na\nb\n```");

    DocNodes breaks = {start("pre"), text("a" + std::string(300000, '\n') + "b"), end("pre")};
    EXPECT_EQ(render_nodes(breaks), "```\na\n\nb\n```");
}

// ============================================================================
// Links, references, entities and fallbacks
// ============================================================================

TEST(TreeRendererTest, LinkUsesLabel) {
    EXPECT_EQ(render_nodes({link_to({text("the list")}, "java.util.List")}), "the list");
}

TEST(TreeRendererTest, LinkFallsBackToReference) {
    EXPECT_EQ(render_nodes({link_to({}, "java.util.List")}), "`java.util.List`");
    EXPECT_EQ(render_nodes({link_to({text("  ")}, "List#add")}), "`List#add`");
}

TEST(TreeRendererTest, LinkWithNothingRendersEmpty) {
    EXPECT_EQ(render_nodes({text("a"), link_to({}, " "), text(" b")}), "a b");
}

TEST(TreeRendererTest, LabelHasItsOwnMarkupStack) {
    // The unclosed <code> inside the label does not leak out
    DocNodes nodes = {link_to({start("code"), text("x")}, "X"), text(" a   b")};
    EXPECT_EQ(render_nodes(nodes), "`x a b");
}

TEST(TreeRendererTest, SeeReference) {
    DocNodes nodes = {text("see "), DocNode{SeeReferenceNode{{literal("Foo#bar")}}}};
    EXPECT_EQ(render_nodes(nodes), "see `Foo#bar`");
}

TEST(TreeRendererTest, Entities) {
    DocNodes nodes = {text("a "), DocNode{EntityNode{"lt"}}, text(" b"), DocNode{EntityNode{"x"}}};
    EXPECT_EQ(render_nodes(nodes), "a < b&x;");
}

TEST(TreeRendererTest, RawFallbacks) {
    DocNodes nodes = {DocNode{ErroneousNode{"@bad "}}, DocNode{UnknownTagNode{"<custom>"}}};
    EXPECT_EQ(render_nodes(nodes), "@bad <custom>");
}

TEST(TreeRendererTest, DirectivesInTextAreResolved) {
    EXPECT_EQ(render_nodes({text("use {@code x} here")}), "use `x` here");
}

TEST(TreeRendererTest, NestingLimitDropsDeepLabels) {
    RenderOptions options;
    options.max_markup_depth = 1;

    auto inner = link_to({text("x")}, "inner");
    EXPECT_EQ(render_nodes({link_to({inner}, "outer")}, options), "`inner`");
}

// ============================================================================
// Helpers
// ============================================================================

TEST(CollapseWhitespaceTest, Runs) {
    EXPECT_EQ(collapse_whitespace("a  b"), "a b");
    EXPECT_EQ(collapse_whitespace("a \n\t b"), "a b");
    EXPECT_EQ(collapse_whitespace("a\tb"), "a\tb");
    EXPECT_EQ(collapse_whitespace("\n"), " ");
}

TEST(NormalizeMarkdownTest, TrimsAndCollapses) {
    EXPECT_EQ(normalize_markdown("  a  \n\n\n\nb  "), "a\n\nb");
    EXPECT_EQ(normalize_markdown("a\t\nb"), "a\nb");
    EXPECT_EQ(normalize_markdown("{@code x}"), "`x`");
}

TEST(NormalizeMarkdownTest, BlanksBetweenBreaks) {
    EXPECT_EQ(normalize_markdown("a \n \n \nb"), "a\n\nb");
    EXPECT_EQ(normalize_markdown("a \t b\nc"), "a \t b\nc");
}

TEST(NormalizeMarkdownTest, LongRuns) {
    std::string text = "a" + std::string(100000, ' ') + "\n" + std::string(100000, '\n') + "b";
    EXPECT_EQ(normalize_markdown(text), "a\n\nb");

    std::string tabs = "a" + std::string(100000, '\t') + "b";
    EXPECT_EQ(normalize_markdown(tabs), tabs);
}
