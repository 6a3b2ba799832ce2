#include "mdview/render/MarkdownConverter.hpp"

#include "MdviewTestHelpers.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace mdview::render {
namespace {

std::string convert(std::string_view markdown, const ConvertOptions& options = {}) {
    std::ostringstream out;
    auto result = convertMarkdown(markdown, out, options);
    EXPECT_TRUE(result.has_value()) << (result.has_value() ? "" : result.error().message);
    return out.str();
}

TEST(MarkdownConverterTest, HeadingWrapsText) {
    const auto html = convert("# Hi\n");
    EXPECT_NE(html.find("<h1>Hi</h1>"), std::string::npos) << html;
}

TEST(MarkdownConverterTest, TrailingSpacesProduceLineBreak) {
    const auto html = convert("a  \nb\n");
    const auto br = html.find("a<br");
    ASSERT_NE(br, std::string::npos) << html;
    EXPECT_GT(html.find("b</p>"), br) << html;
}

TEST(MarkdownConverterTest, SoftBreakRendersAsHardBreak) {
    const auto html = convert("first line\nsecond line\n");
    const auto br = html.find("<br");
    ASSERT_NE(br, std::string::npos) << html;
    EXPECT_LT(html.find("first line"), br);
    EXPECT_GT(html.find("second line"), br);
}

TEST(MarkdownConverterTest, SoftBreakCollapsesWithoutHardWraps) {
    ConvertOptions options;
    options.hardWraps = false;
    const auto html = convert("first line\nsecond line\n", options);
    EXPECT_EQ(html.find("<br"), std::string::npos) << html;
}

TEST(MarkdownConverterTest, GithubExtensionsAreEnabled) {
    const auto html = convert("| a | b |\n|---|---|\n| 1 | 2 |\n\n"
                              "~~gone~~\n\n"
                              "- [x] done\n- [ ] todo\n\n"
                              "see https://example.com now\n");
    EXPECT_NE(html.find("<table>"), std::string::npos) << html;
    EXPECT_NE(html.find("<td>1</td>"), std::string::npos) << html;
    EXPECT_NE(html.find("<del>gone</del>"), std::string::npos) << html;
    EXPECT_NE(html.find("type=\"checkbox\""), std::string::npos) << html;
    EXPECT_NE(html.find("href=\"https://example.com\""), std::string::npos) << html;
}

TEST(MarkdownConverterTest, RawHtmlIsEscapedByDefault) {
    const auto html = convert("<script>alert(1)</script>\n");
    EXPECT_EQ(html.find("<script>"), std::string::npos) << html;
    EXPECT_NE(html.find("&lt;script&gt;"), std::string::npos) << html;
}

TEST(MarkdownConverterTest, RawHtmlPassesThroughWhenAllowed) {
    ConvertOptions options;
    options.allowRawHtml = true;
    const auto html = convert("<div class=\"x\">hi</div>\n", options);
    EXPECT_NE(html.find("<div class=\"x\">hi</div>"), std::string::npos) << html;
}

TEST(MarkdownConverterTest, EmptyInputProducesEmptyOutput) {
    EXPECT_TRUE(convert("").empty());
}

TEST(MarkdownConverterTest, ParserFlagsIncludeDialectAndHardBreaks) {
    const unsigned flags = parserFlags({});
    ConvertOptions soft;
    soft.hardWraps = false;
    soft.allowRawHtml = true;
    EXPECT_NE(flags, parserFlags(soft));
    EXPECT_EQ(flags & parserFlags(soft), parserFlags(soft));
}

TEST(MarkdownConverterTest, FailingSinkReportsRenderError) {
    test_helpers::FailingStreamBuf buf;
    std::ostream out(&buf);
    auto result = convertMarkdown("# Title\n\nbody\n", out);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::RenderError);
}

}  // namespace
}  // namespace mdview::render
