#include <memory_resource>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "vellum/util/html.hpp"
#include "vellum/util/html_names.hpp"

using namespace std::string_view_literals;

namespace vellum {
namespace {

struct String_Consumer {
    std::pmr::u8string& out;

    void operator()(std::u8string_view str) const
    {
        out += str;
    }
    void operator()(char8_t c) const
    {
        out += c;
    }
};

struct HTML_Escape_Test : testing::Test {
    std::pmr::monotonic_buffer_resource memory;
    std::pmr::u8string out { &memory };
    String_Consumer consumer { out };
};

static_assert(html_entity_of(u8'&') == u8"&amp;"sv);
static_assert(html_entity_of(u8'<') == u8"&lt;"sv);
static_assert(html_entity_of(u8'>') == u8"&gt;"sv);
static_assert(html_entity_of(u8'"') == u8"&quot;"sv);
static_assert(html_entity_of(u8'\'') == u8"&apos;"sv);

TEST_F(HTML_Escape_Test, empty)
{
    append_html_escaped_of(consumer, u8"", html_text_escape_charset);

    EXPECT_TRUE(out.empty());
}

TEST_F(HTML_Escape_Test, nothing_to_escape)
{
    append_html_escaped_of(consumer, u8"Hello, world!", html_text_escape_charset);

    EXPECT_EQ(out, u8"Hello, world!");
}

TEST_F(HTML_Escape_Test, text_charset)
{
    append_html_escaped_of(consumer, u8"<a href=\"x\">'&'</a>", html_text_escape_charset);

    EXPECT_EQ(out, u8"&lt;a href=&quot;x&quot;&gt;'&amp;'&lt;/a&gt;");
}

TEST_F(HTML_Escape_Test, custom_charset)
{
    append_html_escaped_of(consumer, u8"<'&'>", u8"'");

    EXPECT_EQ(out, u8"<&apos;&&apos;>");
}

TEST_F(HTML_Escape_Test, leading_and_trailing)
{
    append_html_escaped_of(consumer, u8"&middle&", html_text_escape_charset);

    EXPECT_EQ(out, u8"&amp;middle&amp;");
}

TEST(HTML_Names, tag_names)
{
    EXPECT_TRUE(is_html_tag_name(u8"p"));
    EXPECT_TRUE(is_html_tag_name(u8"foo-bar"));
    EXPECT_FALSE(is_html_tag_name(u8""));
    EXPECT_FALSE(is_html_tag_name(u8"a b"));
    EXPECT_FALSE(is_html_tag_name(u8"<p>"));
}

} // namespace
} // namespace vellum
