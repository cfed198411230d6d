#include "doc/html_markup.hpp"
#include "log_capture.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace docmd;
using namespace docmd::doc;

class HtmlMarkupTest : public ::testing::Test {
protected:
    auto convert(std::string_view text, const RenderOptions& options = {}) -> std::string {
        auto result = html_to_markdown(text, options);
        EXPECT_TRUE(is_ok(result)) << "input: " << text;
        return is_ok(result) ? unwrap(result) : std::string();
    }
};

// ============================================================================
// HTML-likeness
// ============================================================================

TEST_F(HtmlMarkupTest, HtmlLikeNeedsMatchingCloseTag) {
    EXPECT_TRUE(is_html_like("<b>x</b>"));
    EXPECT_FALSE(is_html_like("<b>x"));
    EXPECT_FALSE(is_html_like("<b>x</i>"));
    EXPECT_FALSE(is_html_like("</b> then <b>"));
}

TEST_F(HtmlMarkupTest, HtmlLikeAllowsAttributes) {
    EXPECT_TRUE(is_html_like("<a href=\"x\">y</a>"));
}

TEST_F(HtmlMarkupTest, HtmlLikeIgnoresComparisons) {
    EXPECT_FALSE(is_html_like("x < y and y > z"));
    EXPECT_FALSE(is_html_like(""));
}

TEST_F(HtmlMarkupTest, HtmlLikeOnlyChecksForALaterCloseTag) {
    // Not balanced, but a later </p> exists
    EXPECT_TRUE(is_html_like("<p>one<p>two</p>"));
}

TEST_F(HtmlMarkupTest, HtmlLikeOnLongUnterminatedTag) {
    std::string text = "<a " + std::string(100000, 'x');
    EXPECT_FALSE(is_html_like(text));
    EXPECT_TRUE(is_html_like(text + "></a>"));
}

TEST_F(HtmlMarkupTest, HtmlLikeOnManyOpenTags) {
    std::string text;
    for (int i = 0; i < 20000; ++i) {
        text += "<b>";
    }
    EXPECT_FALSE(is_html_like(text));
    EXPECT_TRUE(is_html_like(text + "</b>"));
}

TEST_F(HtmlMarkupTest, HtmlLikeUsesWholeTagName) {
    EXPECT_FALSE(is_html_like("<bold>x</b>"));
    EXPECT_TRUE(is_html_like("<b class=\"<i>\">x</b>"));
}

// ============================================================================
// Parsing
// ============================================================================

TEST_F(HtmlMarkupTest, ParseWrapsInSyntheticRoot) {
    auto parsed = parse_markup("<b>x</b>y");
    ASSERT_TRUE(is_ok(parsed));

    const auto& root = unwrap(parsed);
    EXPECT_EQ(root.name, "docmd-root");
    ASSERT_EQ(root.children.size(), 2u);
    EXPECT_EQ(root.children[0].kind, MarkupNodeKind::Element);
    EXPECT_EQ(root.children[0].name, "b");
    EXPECT_EQ(root.children[1].kind, MarkupNodeKind::Text);
    EXPECT_EQ(root.children[1].text, "y");
}

TEST_F(HtmlMarkupTest, ParseKeepsAttributes) {
    auto parsed = parse_markup("<a href=\"Foo.html\">Foo</a>");
    ASSERT_TRUE(is_ok(parsed));

    const auto& link = unwrap(parsed).children.at(0);
    ASSERT_EQ(link.attributes.size(), 1u);
    EXPECT_EQ(link.attributes[0].name, "href");
    EXPECT_EQ(link.attributes[0].value, "Foo.html");
}

TEST_F(HtmlMarkupTest, ParseLowercasesNames) {
    auto parsed = parse_markup("<B>x</B>");
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_EQ(unwrap(parsed).children.at(0).name, "b");
}

TEST_F(HtmlMarkupTest, ParseRejectsDeepNesting) {
    RenderOptions options;
    options.max_markup_depth = 2;

    EXPECT_TRUE(is_ok(parse_markup("<b><i>x</i></b>", options)));
    auto parsed = parse_markup("<b><i><u>x</u></i></b>", options);
    ASSERT_TRUE(is_err(parsed));
    EXPECT_NE(unwrap_err(parsed).message.find("deeper than 2"), std::string::npos);
}

// ============================================================================
// Conversion
// ============================================================================

TEST_F(HtmlMarkupTest, BoldPrefix) {
    EXPECT_EQ(convert("<b>Warning</b>: deprecated"), "**Warning**: deprecated");
}

TEST_F(HtmlMarkupTest, EachRule) {
    EXPECT_EQ(convert("<i>x</i>"), "*x*");
    EXPECT_EQ(convert("<code>x</code>"), "`x`");
    EXPECT_EQ(convert("<pre>  x  </pre>"), "`x`");
    EXPECT_EQ(convert("<a href=\"Foo.html\">Foo</a>"), "Foo");
}

TEST_F(HtmlMarkupTest, SiblingsKeepSeparatingSpace) {
    EXPECT_EQ(convert("<i>a</i> <b>b</b>"), "*a* **b**");
}

TEST_F(HtmlMarkupTest, NestedRewrites) {
    EXPECT_EQ(convert("<b><i>x</i></b>"), "***x***");
    EXPECT_EQ(convert("<b><u>x</u></b>"), "**x**");
}

TEST_F(HtmlMarkupTest, EntitiesInsideCodeStayDecoded) {
    EXPECT_EQ(convert("<code>List&lt;T&gt;</code> and <b>x</b>"), "`List<T>` and **x**");
}

TEST_F(HtmlMarkupTest, SourceTextIsReEscaped) {
    EXPECT_EQ(convert("<b>x</b> a &amp; b"), "**x** a &amp; b");
}

TEST_F(HtmlMarkupTest, UnknownElementsAreKept) {
    EXPECT_EQ(convert("<u>x</u>"), "<u>x</u>");
}

TEST_F(HtmlMarkupTest, CommentsAreDropped) {
    EXPECT_EQ(convert("<b>x</b><!-- note -->y"), "**x**y");
}

TEST_F(HtmlMarkupTest, DirectivesResolvedBeforeParsing) {
    EXPECT_EQ(convert("<b>{@code x}</b>"), "**`x`**");
}

TEST_F(HtmlMarkupTest, CodeDirectiveWithGenericsIsNotMarkup) {
    EXPECT_EQ(convert("<p>Returns {@code List<String>} items</p>"),
              "<p>Returns `List<String>` items</p>");
    EXPECT_EQ(convert("Returns a {@code Map<K, V>} of <b>entries</b>"),
              "Returns a `Map<K, V>` of **entries**");
}

TEST_F(HtmlMarkupTest, CodeDirectiveKeepsComparisonOperators) {
    EXPECT_EQ(convert("<b>x</b> {@code a < b}"), "**x** `a < b`");
    EXPECT_EQ(convert("<b>Note</b>: {@code a < b && c > d}"), "**Note**: `a < b && c > d`");
}

TEST_F(HtmlMarkupTest, LiteralDirectiveKeepsEntityText) {
    EXPECT_EQ(convert("<i>x</i> {@literal &amp;}"), "*x* &amp;");
}

// ============================================================================
// Raw text entry point
// ============================================================================

TEST_F(HtmlMarkupTest, RawTextWithCodeDirective) {
    EXPECT_EQ(raw_text_to_markdown("{@code x < y}"), "`x < y`");
}

TEST_F(HtmlMarkupTest, RawTextWithMarkup) {
    EXPECT_EQ(raw_text_to_markdown("<b>Warning</b>: deprecated"), "**Warning**: deprecated");
}

TEST_F(HtmlMarkupTest, RawTextWithMarkupAndCodeDirective) {
    EXPECT_EQ(raw_text_to_markdown("<b>Note</b>: {@code a < b}"), "**Note**: `a < b`");
    EXPECT_EQ(raw_text_to_markdown("<p>Returns {@code List<String>} items</p>"),
              "<p>Returns `List<String>` items</p>");
}

TEST_F(HtmlMarkupTest, RawTextWithoutMarkup) {
    EXPECT_EQ(raw_text_to_markdown(""), "");
    EXPECT_EQ(raw_text_to_markdown("<b>x"), "<b>x");
    EXPECT_EQ(raw_text_to_markdown("see {@link Foo}"), "see `Foo`");
}

TEST_F(HtmlMarkupTest, RawTextFallsBackWhenConversionFails) {
    test_util::ScopedLogCapture capture(log::LogLevel::Debug);
    RenderOptions options;
    options.max_markup_depth = 2;

    EXPECT_EQ(raw_text_to_markdown("<b><i><u>x</u></i></b>", options), "<b><i><u>x</u></i></b>");
    EXPECT_EQ(capture.sink().count("markup", "falling back"), 1u);
}

TEST_F(HtmlMarkupTest, RawTextKeepsUnbalancedBraces) {
    EXPECT_EQ(raw_text_to_markdown("<b>x</b> {oops"), "**x** {oops");
}
