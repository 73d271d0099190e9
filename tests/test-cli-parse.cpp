/*
 * Unit tests for command-line value parsing
 */

#include <gtest/gtest.h>

#include "core/cli_parse.h"

using namespace collager::core;

TEST(CliParseTest, PositiveInt) {
    int value = 7;
    EXPECT_TRUE(parse_positive_int("42", value));
    EXPECT_EQ(value, 42);
    EXPECT_FALSE(parse_positive_int("0", value));
    EXPECT_FALSE(parse_positive_int("-3", value));
    EXPECT_FALSE(parse_positive_int("12px", value));
    EXPECT_FALSE(parse_positive_int("", value));
    EXPECT_EQ(value, 42);
}

TEST(CliParseTest, NonNegativeUint) {
    unsigned int value = 9;
    EXPECT_TRUE(parse_non_negative_uint("0", value));
    EXPECT_EQ(value, 0u);
    EXPECT_TRUE(parse_non_negative_uint("16", value));
    EXPECT_EQ(value, 16u);
    EXPECT_FALSE(parse_non_negative_uint("-1", value));
    EXPECT_FALSE(parse_non_negative_uint("four", value));
}

TEST(CliParseTest, ShapeIsCaseInsensitive) {
    Shape shape = Shape::Rectangle;
    EXPECT_TRUE(parse_shape("Circle", shape));
    EXPECT_EQ(shape, Shape::Circle);
    EXPECT_TRUE(parse_shape("RECTANGLE", shape));
    EXPECT_EQ(shape, Shape::Rectangle);
    EXPECT_FALSE(parse_shape("triangle", shape));
}

TEST(CliParseTest, DrawMode) {
    DrawMode mode = DrawMode::Joined;
    EXPECT_TRUE(parse_draw_mode("serial", mode));
    EXPECT_EQ(mode, DrawMode::Serial);
    EXPECT_TRUE(parse_draw_mode("Detached", mode));
    EXPECT_EQ(mode, DrawMode::Detached);
    EXPECT_TRUE(parse_draw_mode("joined", mode));
    EXPECT_EQ(mode, DrawMode::Joined);
    EXPECT_FALSE(parse_draw_mode("async", mode));
}

TEST(CliParseTest, ColorWithOptionalAlpha) {
    Color color;
    ASSERT_TRUE(parse_color("10, 20,30", color));
    EXPECT_EQ(color, (Color{10, 20, 30, 255}));
    ASSERT_TRUE(parse_color("1,2,3,0", color));
    EXPECT_EQ(color, (Color{1, 2, 3, 0}));

    EXPECT_FALSE(parse_color("1,2", color));
    EXPECT_FALSE(parse_color("1,2,3,4,5", color));
    EXPECT_FALSE(parse_color("1,,3", color));
    EXPECT_FALSE(parse_color("1,2,256", color));
    EXPECT_FALSE(parse_color("1,2,3,", color));
}

TEST(CliParseTest, TrimAndLower) {
    EXPECT_EQ(trim_copy("  a b \t\n"), "a b");
    EXPECT_EQ(trim_copy("   "), "");
    EXPECT_EQ(to_lower_copy("MiXeD"), "mixed");
}
