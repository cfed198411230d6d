#include "doc/markdown.hpp"

#include <gtest/gtest.h>

using namespace docmd::doc;

namespace {

DocNodes prose(std::string body) {
    return {DocNode{TextNode{std::move(body)}}};
}

} // namespace

TEST(CommentToMarkdownTest, AllSections) {
    DocComment comment;
    comment.first_sentence = prose("Adds two numbers.");
    comment.body = {DocNode{TextNode{"Overflow "}}, DocNode{MarkupStartNode{"i"}},
                    DocNode{TextNode{"wraps"}}, DocNode{MarkupEndNode{"i"}}, DocNode{TextNode{"."}}};
    comment.block_tags = {BlockTag{ParamTag{"a", false, prose("left")}},
                          BlockTag{ReturnTag{prose("the sum")}}};

    EXPECT_EQ(comment_to_markdown(comment),
              "Adds two numbers.\n\nOverflow *wraps*.\n\n@param a - left\n@return the sum");
}

TEST(CommentToMarkdownTest, BlankSectionsAreOmitted) {
    DocComment summary_only;
    summary_only.first_sentence = prose("Summary.");
    summary_only.body = prose("   ");
    EXPECT_EQ(comment_to_markdown(summary_only), "Summary.");

    DocComment tags_only;
    tags_only.block_tags = {BlockTag{SinceTag{prose("2.0")}}};
    EXPECT_EQ(comment_to_markdown(tags_only), "@since 2.0");
}

TEST(CommentToMarkdownTest, EmptyComment) {
    EXPECT_EQ(comment_to_markdown(DocComment{}), "");
}

TEST(CommentToMarkdownTest, MarkupContentIsMarkdown) {
    DocComment comment;
    comment.first_sentence = prose("Hi.");

    auto content = comment_to_markup_content(comment);
    EXPECT_EQ(content.kind, MarkupKind::Markdown);
    EXPECT_EQ(content.value, "Hi.");
}

TEST(MarkupKindTest, Names) {
    EXPECT_EQ(markup_kind_to_string(MarkupKind::Markdown), "markdown");
    EXPECT_EQ(markup_kind_to_string(MarkupKind::PlainText), "plaintext");
}
