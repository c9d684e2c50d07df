#include <gtest/gtest.h>
#include <string>
#include <vellum/property.hpp>

using namespace vellum;

TEST(PropertyMerge, SourceWins)
{
    PropertyMap target{{"x", 1.0}, {"stroke", std::string("#000")}};
    PropertyMap source{{"x", 5.0}, {"visible", false}};

    merge_into(target, source);

    ASSERT_EQ(target.size(), 3u);
    EXPECT_EQ(as_number(target["x"]), 5.0);
    EXPECT_EQ(as_flag(target["visible"]), false);
    EXPECT_EQ(std::get<std::string>(target["stroke"]), "#000");
}

TEST(PropertyMerge, EmptySourceLeavesTarget)
{
    PropertyMap target{{"x", 1.0}};
    merge_into(target, {});
    EXPECT_EQ(target.size(), 1u);
}

TEST(PropertyAccess, NumbersAndFlagsDoNotCoerce)
{
    EXPECT_EQ(as_number(PropertyValue{2.5}), 2.5);
    EXPECT_FALSE(as_number(PropertyValue{true}).has_value());
    EXPECT_FALSE(as_number(PropertyValue{std::string("3")}).has_value());

    EXPECT_EQ(as_flag(PropertyValue{true}), true);
    EXPECT_FALSE(as_flag(PropertyValue{1.0}).has_value());
}

TEST(PropertyAccess, ColorsFromStringsOrColors)
{
    EXPECT_EQ(as_color(PropertyValue{std::string("#f00")}), colors::red);
    EXPECT_EQ(as_color(PropertyValue{colors::yellow}), colors::yellow);
    EXPECT_FALSE(as_color(PropertyValue{std::string("red")}).has_value());
    EXPECT_FALSE(as_color(PropertyValue{0.0}).has_value());
}

TEST(PropertyAccess, TypeNames)
{
    EXPECT_STREQ(type_name(PropertyValue{1.0}), "number");
    EXPECT_STREQ(type_name(PropertyValue{false}), "boolean");
    EXPECT_STREQ(type_name(PropertyValue{colors::black}), "color");
    EXPECT_STREQ(type_name(PropertyValue{std::string("a")}), "string");
}

TEST(PropertyAccess, ToString)
{
    EXPECT_EQ(to_string(PropertyValue{0.5}), "0.5");
    EXPECT_EQ(to_string(PropertyValue{10.0}), "10");
    EXPECT_EQ(to_string(PropertyValue{true}), "true");
    EXPECT_EQ(to_string(PropertyValue{colors::red}), "#ff0000");
    EXPECT_EQ(to_string(PropertyValue{std::string("#eee")}), "#eee");
}
