#include "errors.hpp"
#include "optimization_options.hpp"
#include <gtest/gtest.h>

using namespace optipack;

TEST(OptimizationOptionsTest, DefaultsAreValid) {
    const OptimizationOptions options;
    EXPECT_EQ(options.jpeg_quality, kDefaultJpegQuality);
    EXPECT_FALSE(options.convert_png_to_jpeg);
    EXPECT_NO_THROW(options.validate());
}

TEST(OptimizationOptionsTest, QualityBoundsAreInclusive) {
    OptimizationOptions options;
    options.jpeg_quality = 1;
    EXPECT_NO_THROW(options.validate());
    options.jpeg_quality = 100;
    EXPECT_NO_THROW(options.validate());
    options.jpeg_quality = 0;
    EXPECT_THROW(options.validate(), ValidationError);
    options.jpeg_quality = 101;
    EXPECT_THROW(options.validate(), ValidationError);
}

TEST(OptimizationOptionsTest, ParseFormFields) {
    const auto options = OptimizationOptions::parse(" 72 ", "on");
    EXPECT_EQ(options.jpeg_quality, 72);
    EXPECT_TRUE(options.convert_png_to_jpeg);

    const auto defaults = OptimizationOptions::parse("", "");
    EXPECT_EQ(defaults.jpeg_quality, kDefaultJpegQuality);
    EXPECT_FALSE(defaults.convert_png_to_jpeg);
}

TEST(OptimizationOptionsTest, ParseRejectsGarbage) {
    EXPECT_THROW(OptimizationOptions::parse("high", ""), ValidationError);
    EXPECT_THROW(OptimizationOptions::parse("80.5", ""), ValidationError);
    EXPECT_THROW(OptimizationOptions::parse("0", ""), ValidationError);
    EXPECT_THROW(OptimizationOptions::parse("80", "maybe"), ValidationError);
}

TEST(OptimizationOptionsTest, FlagSpellings) {
    EXPECT_TRUE(OptimizationOptions::parse_flag("TRUE"));
    EXPECT_TRUE(OptimizationOptions::parse_flag("yes"));
    EXPECT_TRUE(OptimizationOptions::parse_flag("1"));
    EXPECT_FALSE(OptimizationOptions::parse_flag("off"));
    EXPECT_FALSE(OptimizationOptions::parse_flag("0"));
}
