#pragma once

/**
 * @file Contrast.h
 * @brief WCAG luminance, compositing and contrast ratio
 *
 * Reference: WCAG 2.x relative luminance and contrast ratio
 *   contrast = (L_light + 0.05) / (L_dark + 0.05), in [1, 21]
 *
 * Transparent colors are handled by compositing: the minimum contrast of a
 * translucent background is taken over every opaque backdrop it may be
 * placed on.
 */

#include <QiChroma/Core/Types.h>

#include <string>

namespace Qi::Chroma::Wcag {

// =============================================================================
// Thresholds
// =============================================================================

/// WCAG AA, normal text
constexpr double THRESHOLD_AA = 4.5;
/// WCAG AA, large text
constexpr double THRESHOLD_AA_LARGE = 3.0;
/// WCAG AAA, normal text
constexpr double THRESHOLD_AAA = 7.0;
/// WCAG AAA, large text
constexpr double THRESHOLD_AAA_LARGE = 4.5;

/**
 * @brief Resolve a threshold alias
 *
 * "AA" -> 4.5, "AALG" -> 3, "AAA" -> 7, "AAALG" -> 4.5. Any other string is
 * read as a number ("5.5" -> 5.5).
 *
 * @throws InvalidArgumentException if the string is neither an alias nor a number
 */
double ResolveThreshold(const std::string& alias);

/// @throws InvalidArgumentException if alias is null
double ResolveThreshold(const char* alias);

/**
 * @brief Minimum contrast ratio, given as a number or a WCAG alias
 */
class Threshold {
public:
    Threshold(double value = THRESHOLD_AA) : value_(value) {}
    Threshold(int value) : value_(value) {}
    Threshold(const std::string& alias) : value_(ResolveThreshold(alias)) {}
    Threshold(const char* alias) : value_(ResolveThreshold(alias)) {}

    double Value() const { return value_; }

private:
    double value_;
};

// =============================================================================
// Luminance and Compositing
// =============================================================================

/**
 * @brief Linear light [0-1] of an 8-bit sRGB channel (lookup table)
 */
double SrgbChannelToLinear(uint8_t channel);

/**
 * @brief WCAG relative luminance [0-1]
 *
 * 0.2126 R + 0.7152 G + 0.0722 B in linear light. Alpha is ignored.
 */
double Luma(const Color& color);

/**
 * @brief Source-over compositing of fg onto bg
 *
 * @param fg Foreground color
 * @param bg Background color (default white)
 * @return Composite; if both are fully transparent, fg unchanged
 */
Color AlphaBlend(const Color& fg, const Color& bg = Color::White());

// =============================================================================
// Contrast
// =============================================================================

/**
 * @brief Minimum contrast of fg over bg across all possible backdrops of bg
 *
 * Equals the plain ratio when bg is opaque. Returns 1 when some backdrop can
 * make bg match the luminance of fg.
 */
double ContrastMin(const Color& fg, const Color& bg);

/**
 * @brief Contrast ratio of two colors [1-21]
 *
 * Symmetric. With transparency, the average of both ContrastMin orderings.
 */
double Contrast(const Color& color1, const Color& color2);

/**
 * @brief Pick the candidate with the higher contrast against base
 *
 * Ties go to dark.
 */
Color ContrastColor(const Color& base,
                    const Color& dark = Color::Black(),
                    const Color& light = Color::White());

/**
 * @brief Move color toward black or white until it reaches a contrast
 *
 * Returns color unchanged if it already passes. Otherwise the extreme on the
 * far side of base (white when Luma(base) < 0.18, else black) is the target;
 * if even the extreme fails it is returned as the best achievable. Else 10
 * bisection steps of a linear RGB mix between color and the extreme return
 * the passing end of the final interval.
 *
 * @param base Background color
 * @param color Color to adjust
 * @param threshold Minimum contrast (number or "AA", "AALG", "AAA", "AAALG")
 */
Color ContrastStretch(const Color& base, const Color& color,
                      Threshold threshold = THRESHOLD_AA);

/**
 * @brief Warn on stderr if the contrast of two colors is below a threshold
 *
 * @return color, unchanged
 */
Color ContrastCheck(const Color& base, const Color& color,
                    Threshold threshold = THRESHOLD_AA);

} // namespace Qi::Chroma::Wcag
