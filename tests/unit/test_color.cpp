#include <gtest/gtest.h>
#include <vellum/color.hpp>

using namespace vellum;

TEST(Color, ParseShortHex)
{
    auto c = parse_color("#eee");
    ASSERT_TRUE(c.has_value());
    EXPECT_FLOAT_EQ(c->r, 238.0f / 255.0f);
    EXPECT_FLOAT_EQ(c->g, 238.0f / 255.0f);
    EXPECT_FLOAT_EQ(c->b, 238.0f / 255.0f);
    EXPECT_FLOAT_EQ(c->a, 1.0f);
}

TEST(Color, ParseLongHex)
{
    auto c = parse_color("#ff0000");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(*c, colors::red);
}

TEST(Color, ParseHexWithAlpha)
{
    auto c = parse_color("#00000080");
    ASSERT_TRUE(c.has_value());
    EXPECT_NEAR(c->a, 128.0f / 255.0f, 1e-6f);
}

TEST(Color, RejectsMalformed)
{
    EXPECT_FALSE(parse_color("").has_value());
    EXPECT_FALSE(parse_color("eee").has_value());
    EXPECT_FALSE(parse_color("#ee").has_value());
    EXPECT_FALSE(parse_color("#gggggg").has_value());
}

TEST(Color, HexRoundTripOfNamedColors)
{
    EXPECT_EQ(to_hex(colors::yellow), "#ffff00");
    EXPECT_EQ(parse_color(to_hex(colors::black)), colors::black);
}

TEST(Color, WithAlpha)
{
    auto c = colors::white.with_alpha(0.5f);
    EXPECT_FLOAT_EQ(c.a, 0.5f);
    EXPECT_FLOAT_EQ(c.r, 1.0f);
}
