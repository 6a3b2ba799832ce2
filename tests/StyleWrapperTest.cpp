#include "mdview/render/StyleWrapper.hpp"

#include "mdview/render/MarkdownConverter.hpp"

#include "MdviewTestHelpers.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace mdview::render {
namespace {

std::string render(std::string_view markdown, bool styled) {
    std::ostringstream out;
    StyleWrapper wrapper{std::string(githubMarkdownCss())};
    if (styled) {
        EXPECT_TRUE(wrapper.begin(out).has_value());
    }
    EXPECT_TRUE(convertMarkdown(markdown, out).has_value());
    if (styled) {
        EXPECT_TRUE(wrapper.finish(out).has_value());
    }
    return out.str();
}

TEST(StyleWrapperTest, PreambleEmbedsBuiltInCss) {
    auto preamble = buildPreamble(githubMarkdownCss());
    ASSERT_TRUE(preamble.has_value());
    EXPECT_TRUE(preamble->starts_with("<html>\n<head>\n"));
    EXPECT_NE(preamble->find("<style>\n"), std::string::npos);
    EXPECT_NE(preamble->find(".markdown-body {"), std::string::npos);
    EXPECT_TRUE(preamble->ends_with("<body>\n<article class=\"markdown-body\">\n"));
}

TEST(StyleWrapperTest, BuiltInCssIsNotEscaped) {
    auto preamble = buildPreamble(githubMarkdownCss());
    ASSERT_TRUE(preamble.has_value());
    // The CSS has child combinators and quoted strings that escaping would break.
    EXPECT_NE(preamble->find(".markdown-body>*:first-child"), std::string::npos);
    EXPECT_EQ(preamble->find("&gt;"), std::string::npos);
    EXPECT_EQ(preamble->find("&quot;"), std::string::npos);
}

TEST(StyleWrapperTest, StrippingWrapperGivesUnstyledOutput) {
    constexpr std::string_view kMarkdown = "# Title\n\nline one\nline two\n\n| a | b |\n|---|---|\n| 1 | 2 |\n";
    const auto plain = render(kMarkdown, false);
    const auto styled = render(kMarkdown, true);

    auto preamble = buildPreamble(githubMarkdownCss());
    ASSERT_TRUE(preamble.has_value());
    const auto suffix = documentSuffix();

    ASSERT_TRUE(styled.starts_with(*preamble));
    ASSERT_TRUE(styled.ends_with(suffix));
    const auto body = styled.substr(preamble->size(), styled.size() - preamble->size() - suffix.size());
    EXPECT_EQ(body, plain);
}

TEST(StyleWrapperTest, EmptyInputGivesBareWrapper) {
    const auto styled = render("", true);
    auto preamble = buildPreamble(githubMarkdownCss());
    ASSERT_TRUE(preamble.has_value());
    EXPECT_EQ(styled, *preamble + std::string(documentSuffix()));
}

TEST(StyleWrapperTest, UnsafeCssLeavesSinkUntouched) {
    std::ostringstream out;
    StyleWrapper wrapper{"p{}</style><script>alert(1)</script>"};
    auto began = wrapper.begin(out);
    ASSERT_FALSE(began.has_value());
    EXPECT_EQ(began.error().kind, ErrorKind::TemplateError);
    EXPECT_TRUE(out.str().empty());
}

TEST(StyleWrapperTest, LoadsCustomStylesheet) {
    test_helpers::ScopedTempDir dir("mdview-stylewrapper-custom");
    const auto cssPath = dir.path() / "custom.css";
    test_helpers::writeFile(cssPath, "body { color: #123456; }\n");

    auto css = loadStylesheet(cssPath);
    ASSERT_TRUE(css.has_value());
    EXPECT_EQ(*css, "body { color: #123456; }\n");

    auto builtIn = loadStylesheet(std::nullopt);
    ASSERT_TRUE(builtIn.has_value());
    EXPECT_EQ(*builtIn, githubMarkdownCss());
}

TEST(StyleWrapperTest, MissingStylesheetIsTemplateError) {
    auto css = loadStylesheet(std::filesystem::path("/nonexistent/mdview/custom.css"));
    ASSERT_FALSE(css.has_value());
    EXPECT_EQ(css.error().kind, ErrorKind::TemplateError);
}

TEST(StyleWrapperTest, DirectoryStylesheetIsTemplateError) {
    test_helpers::ScopedTempDir dir("mdview-stylewrapper-dir");
    auto css = loadStylesheet(dir.path());
    ASSERT_FALSE(css.has_value());
    EXPECT_EQ(css.error().kind, ErrorKind::TemplateError);
}

TEST(StyleWrapperTest, SuffixWriteFailureIsRenderError) {
    test_helpers::FailingStreamBuf buf;
    std::ostream out(&buf);
    StyleWrapper wrapper{"body{}"};
    auto finished = wrapper.finish(out);
    ASSERT_FALSE(finished.has_value());
    EXPECT_EQ(finished.error().kind, ErrorKind::RenderError);
}

}  // namespace
}  // namespace mdview::render
