#include "Color.h"

#include <gtest/gtest.h>

#include <unordered_set>

using namespace iml;

TEST(Color, to_html_string_rgb_returns_uppercase_hex)
{
    ASSERT_EQ(to_html_string_rgb(Color::red()), "#FF0000");
    ASSERT_EQ(to_html_string_rgb(Color{0x0a, 0xbc, 0x01}), "#0ABC01");
}

TEST(Color, try_parse_html_color_string_parses_six_digit_hex)
{
    ASSERT_EQ(try_parse_html_color_string("#FF0000"), Color::red());
    ASSERT_EQ(try_parse_html_color_string("#00ff00"), Color::green());
    ASSERT_EQ(try_parse_html_color_string("#0aBc01"), (Color{0x0a, 0xbc, 0x01}));
}

TEST(Color, try_parse_html_color_string_parses_shorthand)
{
    ASSERT_EQ(try_parse_html_color_string("#00f"), Color::blue());
    ASSERT_EQ(try_parse_html_color_string("#abc"), (Color{0xaa, 0xbb, 0xcc}));
}

TEST(Color, try_parse_html_color_string_rejects_malformed_strings)
{
    ASSERT_EQ(try_parse_html_color_string(""), std::nullopt);
    ASSERT_EQ(try_parse_html_color_string("FF0000"), std::nullopt);
    ASSERT_EQ(try_parse_html_color_string("#FF00"), std::nullopt);
    ASSERT_EQ(try_parse_html_color_string("#GG0000"), std::nullopt);
    ASSERT_EQ(try_parse_html_color_string("#FF0000FF"), std::nullopt);
    ASSERT_EQ(try_parse_html_color_string("red"), std::nullopt);
}

TEST(Color, html_string_roundtrips)
{
    const Color c{0x12, 0x34, 0x56};
    ASSERT_EQ(try_parse_html_color_string(to_html_string_rgb(c)), c);
}

TEST(Color, can_be_hashed)
{
    const std::unordered_set<Color> colors = {Color::red(), Color::green(), Color::red()};
    ASSERT_EQ(colors.size(), 2);
}
