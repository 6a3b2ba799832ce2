#include "mdview/render/HtmlTemplate.hpp"

#include <gtest/gtest.h>

namespace mdview::render {
namespace {

TEST(HtmlTemplateTest, EscapesTextContext) {
    EXPECT_EQ(htmlEscape("<a href=\"x\">Tom & 'Jerry'</a>"),
              "&lt;a href=&quot;x&quot;&gt;Tom &amp; &#39;Jerry&#39;&lt;/a&gt;");
}

TEST(HtmlTemplateTest, CssSlotIsInsertedVerbatim) {
    TemplateValues values;
    values.emplace("css", TemplateValue{SlotContext::Css, "a > b { content: \"&\"; }"});
    auto expanded = expandTemplate("<style>{{css}}</style>", values);
    ASSERT_TRUE(expanded.has_value());
    EXPECT_EQ(*expanded, "<style>a > b { content: \"&\"; }</style>");
}

TEST(HtmlTemplateTest, TextSlotIsEscaped) {
    TemplateValues values;
    values.emplace("title", TemplateValue{SlotContext::Text, "<b>notes</b>"});
    auto expanded = expandTemplate("<title>{{ title }}</title>", values);
    ASSERT_TRUE(expanded.has_value());
    EXPECT_EQ(*expanded, "<title>&lt;b&gt;notes&lt;/b&gt;</title>");
}

TEST(HtmlTemplateTest, TemplateWithoutPlaceholdersIsUnchanged) {
    auto expanded = expandTemplate("<p>plain { braces }</p>", {});
    ASSERT_TRUE(expanded.has_value());
    EXPECT_EQ(*expanded, "<p>plain { braces }</p>");
}

TEST(HtmlTemplateTest, UnknownPlaceholderFails) {
    auto expanded = expandTemplate("<p>{{missing}}</p>", {});
    ASSERT_FALSE(expanded.has_value());
    EXPECT_EQ(expanded.error().kind, ErrorKind::TemplateError);
}

TEST(HtmlTemplateTest, UnterminatedPlaceholderFails) {
    TemplateValues values;
    values.emplace("css", TemplateValue{SlotContext::Css, ""});
    auto expanded = expandTemplate("<style>{{css</style>", values);
    ASSERT_FALSE(expanded.has_value());
    EXPECT_EQ(expanded.error().kind, ErrorKind::TemplateError);
}

TEST(HtmlTemplateTest, MalformedPlaceholderFails) {
    auto expanded = expandTemplate("{{9lives}}", {});
    ASSERT_FALSE(expanded.has_value());
    EXPECT_EQ(expanded.error().kind, ErrorKind::TemplateError);
}

TEST(HtmlTemplateTest, PlaceholderSyntaxIsBareIdentifier) {
    TemplateValues values;
    values.emplace("css", TemplateValue{SlotContext::Css, "p{}"});
    values.emplace("page_title", TemplateValue{SlotContext::Text, "t"});

    auto bare = expandTemplate("{{css}}|{{ page_title }}", values);
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(*bare, "p{}|t");

    for (const char* tmpl : {"{{.css}}", "{{.Css}}", "{{css-x}}", "{{}}"}) {
        auto expanded = expandTemplate(tmpl, values);
        ASSERT_FALSE(expanded.has_value()) << tmpl;
        EXPECT_EQ(expanded.error().kind, ErrorKind::TemplateError) << tmpl;
    }
}

TEST(HtmlTemplateTest, CssThatClosesStyleElementIsRejected) {
    EXPECT_FALSE(validateCss("body{}</STYLE><script>x()</script>").has_value());
    EXPECT_TRUE(validateCss("body { color: red; }").has_value());

    TemplateValues values;
    values.emplace("css", TemplateValue{SlotContext::Css, "p{}</style><script>"});
    auto expanded = expandTemplate("<style>{{css}}</style>", values);
    ASSERT_FALSE(expanded.has_value());
    EXPECT_EQ(expanded.error().kind, ErrorKind::TemplateError);
}

}  // namespace
}  // namespace mdview::render
