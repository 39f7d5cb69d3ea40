/**
 * @file test_types.cpp
 * @brief Unit tests for Core value types
 */

#include <QiChroma/Core/Types.h>
#include <QiChroma/Core/Constants.h>
#include <QiChroma/Core/Exception.h>

#include <gtest/gtest.h>

#include <cmath>

using namespace Qi::Chroma;

// =============================================================================
// ColorSpace Tests
// =============================================================================

TEST(ColorSpaceTest, ParseKnownNames) {
    EXPECT_EQ(ParseColorSpace("lab"), ColorSpace::Lab);
    EXPECT_EQ(ParseColorSpace("luv"), ColorSpace::Luv);
    EXPECT_EQ(ParseColorSpace("hsl"), ColorSpace::Hsl);
    EXPECT_EQ(ParseColorSpace("yuv"), ColorSpace::Yuv);
    EXPECT_EQ(ParseColorSpace("hslab"), ColorSpace::HsLab);
    EXPECT_EQ(ParseColorSpace("hsluv"), ColorSpace::HsLuv);
}

TEST(ColorSpaceTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(ParseColorSpace("LAB"), ColorSpace::Lab);
    EXPECT_EQ(ParseColorSpace("HSLuv"), ColorSpace::HsLuv);
}

TEST(ColorSpaceTest, ParseUnknownNameThrows) {
    EXPECT_THROW(ParseColorSpace("rgb"), InvalidArgumentException);
    EXPECT_THROW(ParseColorSpace(""), InvalidArgumentException);
    EXPECT_THROW(ParseColorSpace("cielab"), Exception);
}

TEST(ColorSpaceTest, NameRoundTrip) {
    for (ColorSpace space : {ColorSpace::Lab, ColorSpace::Luv, ColorSpace::Hsl,
                             ColorSpace::Yuv, ColorSpace::HsLab, ColorSpace::HsLuv}) {
        EXPECT_EQ(ParseColorSpace(GetColorSpaceName(space)), space);
    }
}

// =============================================================================
// Color Tests
// =============================================================================

TEST(ColorTest, DefaultIsOpaqueBlack) {
    Color c;
    EXPECT_EQ(c.r, 0);
    EXPECT_EQ(c.g, 0);
    EXPECT_EQ(c.b, 0);
    EXPECT_DOUBLE_EQ(c.alpha, 1.0);
    EXPECT_TRUE(c.IsOpaque());
}

TEST(ColorTest, FromRgbClampsAndRounds) {
    Color c = Color::FromRgb(-20.0, 127.5, 300.0, 1.7);
    EXPECT_EQ(c.r, 0);
    EXPECT_EQ(c.g, 128);
    EXPECT_EQ(c.b, 255);
    EXPECT_DOUBLE_EQ(c.alpha, 1.0);

    Color d = Color::FromRgb(33.15, 221.85, 0.49, -0.5);
    EXPECT_EQ(d.r, 33);
    EXPECT_EQ(d.g, 222);
    EXPECT_EQ(d.b, 0);
    EXPECT_DOUBLE_EQ(d.alpha, 0.0);
    EXPECT_TRUE(d.IsTransparent());
}

TEST(ColorTest, ConstructorClampsChannels) {
    int r = 300;
    int g = -5;
    Color c(r, g, 128);
    EXPECT_EQ(c, Color::FromHex(0xff0080));
    EXPECT_EQ(c.ToString(), "#ff0080");
    EXPECT_EQ(Color(256, 256, 256), Color::White());
    EXPECT_EQ(Color(-1, -255, -256), Color::Black());
    EXPECT_DOUBLE_EQ(Color(0, 0, 0, 2.0).alpha, 1.0);
}

TEST(ColorTest, HexConversion) {
    Color c = Color::FromHex(0xbbbbff);
    EXPECT_EQ(c, Color(0xbb, 0xbb, 0xff));
    EXPECT_EQ(c.ToHex(), 0xbbbbffu);
    EXPECT_EQ(Color::Green().ToHex(), 0x008000u);
}

TEST(ColorTest, ToString) {
    EXPECT_EQ(Color::FromHex(0x8080ff).ToString(), "#8080ff");
    EXPECT_EQ(Color(170, 170, 255, 0.75).ToString(), "rgba(170,170,255,0.75)");
}

TEST(ColorTest, EqualityIncludesAlpha) {
    EXPECT_EQ(Color::White(), Color(255, 255, 255));
    EXPECT_NE(Color::White(), Color::White().WithAlpha(0.5));
}

// =============================================================================
// Angle Tests
// =============================================================================

TEST(AngleTest, BareNumberIsDegrees) {
    Angle a = 40.0;
    EXPECT_EQ(a.Unit(), AngleUnit::Degrees);
    EXPECT_DOUBLE_EQ(a.ToDegrees(), 40.0);
    EXPECT_NEAR(a.ToRadians(), 0.6981317, 1e-6);
}

TEST(AngleTest, UnitConversions) {
    EXPECT_NEAR(Angle::Radians(PI).ToDegrees(), 180.0, 1e-12);
    EXPECT_NEAR(Angle::Gradians(200.0).ToDegrees(), 180.0, 1e-12);
    EXPECT_NEAR(Angle::Turns(0.25).ToDegrees(), 90.0, 1e-12);
    EXPECT_NEAR(Angle::Degrees(90.0).In(AngleUnit::Turns).Value(), 0.25, 1e-12);
    EXPECT_NEAR(Angle::Degrees(180.0).In(AngleUnit::Radians).Value(), PI, 1e-12);
}

TEST(AngleTest, NormalizeDegrees) {
    EXPECT_DOUBLE_EQ(NormalizeDegrees(-90.0), 270.0);
    EXPECT_DOUBLE_EQ(NormalizeDegrees(720.0), 0.0);
    EXPECT_DOUBLE_EQ(NormalizeDegrees(400.0), 40.0);
}

// =============================================================================
// Ratio Tests
// =============================================================================

TEST(RatioTest, PercentAndFractionAgree) {
    EXPECT_DOUBLE_EQ(Ratio::Percent(20).Fraction(), Ratio(0.2).Fraction());
    EXPECT_DOUBLE_EQ(Ratio(0.35).ToPercent(), 35.0);
}

TEST(RatioTest, Clamped) {
    EXPECT_DOUBLE_EQ(Ratio(1.5).Fraction(), 1.0);
    EXPECT_DOUBLE_EQ(Ratio::Percent(-10).Fraction(), 0.0);
}
