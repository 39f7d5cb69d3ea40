/**
 * @file test_contrast.cpp
 * @brief Unit tests for Wcag/Contrast
 */

#include <QiChroma/Wcag/Contrast.h>
#include <QiChroma/Internal/ColorTransfer.h>
#include <QiChroma/Core/Exception.h>

#include <gtest/gtest.h>

#include <string>

using namespace Qi::Chroma;
using namespace Qi::Chroma::Wcag;

namespace {

Color Hex(uint32_t hex) {
    return Color::FromHex(hex);
}

} // anonymous namespace

// =============================================================================
// Luma Tests
// =============================================================================

class LumaTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

TEST_F(LumaTest, Extremes) {
    EXPECT_DOUBLE_EQ(Luma(Color::White()), 1.0);
    EXPECT_DOUBLE_EQ(Luma(Color::Black()), 0.0);
}

TEST_F(LumaTest, PrimariesCarryTheirWeights) {
    EXPECT_NEAR(Luma(Color::Red()), 0.2126, 1e-12);
    EXPECT_NEAR(Luma(Color::Lime()), 0.7152, 1e-12);
    EXPECT_NEAR(Luma(Color::Blue()), 0.0722, 1e-12);
    EXPECT_NEAR(Luma(Color::Yellow()), 0.9278, 1e-4);
    EXPECT_NEAR(Luma(Color::Magenta()), 0.2848, 1e-4);
    EXPECT_NEAR(Luma(Color::Cyan()), 0.7874, 1e-4);
}

TEST_F(LumaTest, MidTone) {
    EXPECT_NEAR(Luma(Color(12, 180, 92)), 0.3349, 0.02);
}

TEST_F(LumaTest, IgnoresAlpha) {
    EXPECT_DOUBLE_EQ(Luma(Color::Yellow().WithAlpha(0.25)), Luma(Color::Yellow()));
}

TEST_F(LumaTest, TableFollowsSharedTransfer) {
    for (int i = 0; i < 256; ++i) {
        EXPECT_DOUBLE_EQ(SrgbChannelToLinear(static_cast<uint8_t>(i)),
                         Internal::SrgbToLinear(i / 2.55) / 100.0) << "channel " << i;
    }
}

TEST_F(LumaTest, TableMatchesTransferCurve) {
    EXPECT_DOUBLE_EQ(SrgbChannelToLinear(0), 0.0);
    EXPECT_DOUBLE_EQ(SrgbChannelToLinear(255), 1.0);
    EXPECT_NEAR(SrgbChannelToLinear(10), 10.0 / 255.0 / 12.92, 1e-12);
    EXPECT_NEAR(SrgbChannelToLinear(128), 0.2158605, 1e-6);
}

// =============================================================================
// AlphaBlend Tests
// =============================================================================

class AlphaBlendTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

TEST_F(AlphaBlendTest, OpaqueForegroundUnchanged) {
    EXPECT_EQ(AlphaBlend(Color::White()), Color::White());
    EXPECT_EQ(AlphaBlend(Color::Black()), Color::Black());
    EXPECT_EQ(AlphaBlend(Color::Red()), Color::Red());
    EXPECT_EQ(AlphaBlend(Color::Red(), Color::Blue()), Color::Red());
}

TEST_F(AlphaBlendTest, TransparentForegroundGivesBackground) {
    EXPECT_EQ(AlphaBlend(Color::White().WithAlpha(0.0), Color::Blue()), Color::Blue());
    EXPECT_EQ(AlphaBlend(Color::Black().WithAlpha(0.0), Color::Blue()), Color::Blue());
    EXPECT_EQ(AlphaBlend(Color::Red().WithAlpha(0.0), Color::Blue()), Color::Blue());
    EXPECT_EQ(AlphaBlend(Color::Blue().WithAlpha(0.0)), Color::White());
}

TEST_F(AlphaBlendTest, HalfTransparent) {
    EXPECT_EQ(AlphaBlend(Color::White().WithAlpha(0.5), Color::Blue()), Hex(0x8080ff));
    EXPECT_EQ(AlphaBlend(Color::Black().WithAlpha(0.5), Color::Blue()), Hex(0x000080));
    EXPECT_EQ(AlphaBlend(Color::Red().WithAlpha(0.5), Color::Blue()), Hex(0x800080));
    EXPECT_EQ(AlphaBlend(Color::Blue().WithAlpha(0.5)), Hex(0x8080ff));
}

TEST_F(AlphaBlendTest, MostlyTransparent) {
    EXPECT_EQ(AlphaBlend(Color::White().WithAlpha(0.13), Color::Blue()), Hex(0x2121ff));
    EXPECT_EQ(AlphaBlend(Color::Black().WithAlpha(0.13), Color::Blue()), Hex(0x0000de));
    EXPECT_EQ(AlphaBlend(Color::Red().WithAlpha(0.13), Color::Blue()), Hex(0x2100de));
    EXPECT_EQ(AlphaBlend(Color::Blue().WithAlpha(0.13)), Hex(0xdedeff));
}

TEST_F(AlphaBlendTest, TranslucentBackground) {
    Color c = AlphaBlend(Color::White().WithAlpha(0.5), Color::Blue().WithAlpha(0.5));
    EXPECT_EQ(c.r, 170);
    EXPECT_EQ(c.g, 170);
    EXPECT_EQ(c.b, 255);
    EXPECT_DOUBLE_EQ(c.alpha, 0.75);
}

TEST_F(AlphaBlendTest, BothTransparentReturnsForeground) {
    Color fg = Color::White().WithAlpha(0.0);
    Color c = AlphaBlend(fg, Color::Black().WithAlpha(0.0));
    EXPECT_EQ(c, fg);
    EXPECT_EQ(c.ToString(), "rgba(255,255,255,0)");
}

// =============================================================================
// Contrast Tests
// =============================================================================

class ContrastTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

TEST_F(ContrastTest, Extremes) {
    EXPECT_DOUBLE_EQ(Contrast(Color::Black(), Color::White()), 21.0);
    EXPECT_DOUBLE_EQ(Contrast(Color::White(), Color::White()), 1.0);
    EXPECT_DOUBLE_EQ(Contrast(Color::Red(), Color::Red()), 1.0);
}

TEST_F(ContrastTest, Symmetric) {
    Color a = Hex(0x555555);
    Color b = Hex(0xeeeeee);
    EXPECT_DOUBLE_EQ(Contrast(a, b), Contrast(b, a));
    EXPECT_NEAR(Contrast(a, b), 6.4256, 1e-3);
    EXPECT_NEAR(Contrast(a, Hex(0x111111)), 2.5329, 1e-3);
}

TEST_F(ContrastTest, EqualLuminanceDifferentHue) {
    EXPECT_NEAR(Contrast(Color::Red(), Hex(0x676eff)), 1.0, 0.02);
}

TEST_F(ContrastTest, TranslucentColors) {
    EXPECT_NEAR(Contrast(Color::Black().WithAlpha(0.5), Color::White()), 3.9494, 1e-3);
    EXPECT_NEAR(Contrast(Color::White().WithAlpha(0.3), Color::Black()), 2.4843, 1e-3);

    // Both translucent: some backdrop makes them equal
    EXPECT_DOUBLE_EQ(Contrast(Color::Red().WithAlpha(0.5), Color::Blue().WithAlpha(0.5)), 1.0);
}

TEST_F(ContrastTest, ContrastMinOverOpaqueBackground) {
    Color fg = Hex(0x555555);
    Color bg = Hex(0xeeeeee);
    EXPECT_DOUBLE_EQ(ContrastMin(fg, bg), Contrast(fg, bg));
}

TEST_F(ContrastTest, ContrastMinTakesWorstBackdrop) {
    Color bg = Color::Black().WithAlpha(0.5);
    // Over white the half-black background is closest to white text
    double expected = Contrast(Color::White(), AlphaBlend(bg, Color::White()));
    EXPECT_DOUBLE_EQ(ContrastMin(Color::White(), bg), expected);

    // Black text can match the background over a black backdrop
    EXPECT_DOUBLE_EQ(ContrastMin(Color::Black(), bg), 1.0);
}

// =============================================================================
// ContrastColor Tests
// =============================================================================

TEST(ContrastColorTest, DefaultCandidates) {
    EXPECT_EQ(ContrastColor(Color::White()), Color::Black());
    EXPECT_EQ(ContrastColor(Color::Black()), Color::White());
    EXPECT_EQ(ContrastColor(Color::Red()), Color::Black());
    EXPECT_EQ(ContrastColor(Color::Lime()), Color::Black());
    EXPECT_EQ(ContrastColor(Color::Blue()), Color::White());
    EXPECT_EQ(ContrastColor(Color::Yellow()), Color::Black());
    EXPECT_EQ(ContrastColor(Color::Cyan()), Color::Black());
}

TEST(ContrastColorTest, CustomCandidates) {
    Color dark = Hex(0x111111);
    Color light = Hex(0xeeeeee);
    EXPECT_EQ(ContrastColor(Color::White(), dark, light), dark);
    EXPECT_EQ(ContrastColor(Color::Black(), dark, light), light);
    EXPECT_EQ(ContrastColor(Hex(0x555555), dark, light), light);

    // Candidates are not required to be ordered
    EXPECT_EQ(ContrastColor(Color::White(), light, dark), dark);
}

TEST(ContrastColorTest, TieGoesToDark) {
    EXPECT_EQ(ContrastColor(Color::Gray(), Color::Gray(), Color::Gray().WithAlpha(0.5)),
              Color::Gray());
}

// =============================================================================
// ContrastStretch Tests
// =============================================================================

class ContrastStretchTest : public ::testing::Test {
protected:
    void SetUp() override {}
};

TEST_F(ContrastStretchTest, PassingColorUnchanged) {
    EXPECT_EQ(ContrastStretch(Color::White(), Color::Black()), Color::Black());
    EXPECT_EQ(ContrastStretch(Color::White(), Hex(0x333333)), Hex(0x333333));
}

TEST_F(ContrastStretchTest, UnreachableThresholdGivesExtreme) {
    EXPECT_EQ(ContrastStretch(Color::White(), Hex(0x333333), 21.0), Color::Black());
}

TEST_F(ContrastStretchTest, LightensOnDarkBase) {
    EXPECT_EQ(ContrastStretch(Hex(0x333333), Color::Blue(), 7.0), Hex(0xbbbbff));
    EXPECT_EQ(ContrastStretch(Hex(0x333333), Color::Blue(), "AAA"), Hex(0xbbbbff));
}

TEST_F(ContrastStretchTest, ResultPassesOrIsExtreme) {
    const Color bases[] = {Color(0x20, 0x40, 0x60), Color(200, 180, 90), Color(128, 128, 128)};
    const Color colors[] = {Color(120, 120, 120), Color(100, 40, 200), Color(250, 250, 10)};
    const double thresholds[] = {THRESHOLD_AA_LARGE, THRESHOLD_AA, THRESHOLD_AAA};

    for (const Color& base : bases) {
        for (const Color& color : colors) {
            for (double t : thresholds) {
                Color result = ContrastStretch(base, color, t);
                bool extreme = result == Color::Black() || result == Color::White();
                EXPECT_TRUE(Contrast(base, result) >= t || extreme)
                    << color.ToString() << " on " << base.ToString() << " at " << t;
            }
        }
    }
}

// =============================================================================
// Threshold Tests
// =============================================================================

TEST(ThresholdTest, Aliases) {
    EXPECT_DOUBLE_EQ(ResolveThreshold("AA"), 4.5);
    EXPECT_DOUBLE_EQ(ResolveThreshold("AALG"), 3.0);
    EXPECT_DOUBLE_EQ(ResolveThreshold("AAA"), 7.0);
    EXPECT_DOUBLE_EQ(ResolveThreshold("AAALG"), 4.5);
}

TEST(ThresholdTest, NumericString) {
    EXPECT_DOUBLE_EQ(ResolveThreshold("5.5"), 5.5);
    EXPECT_DOUBLE_EQ(Threshold("3").Value(), 3.0);
    EXPECT_DOUBLE_EQ(Threshold().Value(), THRESHOLD_AA);
}

TEST(ThresholdTest, IntegerLiteral) {
    EXPECT_DOUBLE_EQ(Threshold(0).Value(), 0.0);
    EXPECT_DOUBLE_EQ(Threshold(7).Value(), THRESHOLD_AAA);

    // A zero threshold passes every color through
    EXPECT_EQ(ContrastStretch(Color::White(), Color::White(), 0), Color::White());
    EXPECT_EQ(ContrastStretch(Hex(0x333333), Color::Blue(), 7), Hex(0xbbbbff));
}

TEST(ThresholdTest, NullAliasThrows) {
    const char* none = nullptr;
    EXPECT_THROW(ResolveThreshold(none), InvalidArgumentException);
    EXPECT_THROW(Threshold{none}, InvalidArgumentException);
}

TEST(ThresholdTest, UnknownAliasThrows) {
    EXPECT_THROW(ResolveThreshold("AAAA"), InvalidArgumentException);
    EXPECT_THROW(ResolveThreshold(""), InvalidArgumentException);
    EXPECT_THROW(ResolveThreshold("4.5x"), InvalidArgumentException);
}

// =============================================================================
// ContrastCheck Tests
// =============================================================================

TEST(ContrastCheckTest, WarnsBelowThreshold) {
    testing::internal::CaptureStderr();
    Color c = ContrastCheck(Color::White(), Hex(0xcccccc));
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(c, Hex(0xcccccc));
    EXPECT_NE(output.find("[ContrastCheck] Warning"), std::string::npos);
    EXPECT_NE(output.find("#cccccc on #ffffff"), std::string::npos);
}

TEST(ContrastCheckTest, SilentWhenPassing) {
    testing::internal::CaptureStderr();
    Color c = ContrastCheck(Color::White(), Hex(0x333333), "AAA");
    std::string output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(c, Hex(0x333333));
    EXPECT_TRUE(output.empty());
}
