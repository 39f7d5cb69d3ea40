#pragma once

/**
 * @file Lch.h
 * @brief Perceptual color construction and adjustment in polar color spaces
 *
 * API Style: Color Func(const Color& in, params..., ColorSpace space)
 *
 * Every function accepts the color space either as a ColorSpace value or as
 * its name ("lab", "luv", "hsl", "yuv", "hslab", "hsluv"). Unknown names
 * throw InvalidArgumentException. Constructed colors are always clipped into
 * the sRGB gamut by reducing chroma.
 *
 * @code
 * Color red = Lch(53.23288, 104.57421, 40);           // #ff0000
 * Color lighter = Lighten(red, 10, ColorSpace::Luv);
 * double hue = GetHue(lighter, "luv").ToDegrees();
 * @endcode
 */

#include <QiChroma/Core/Types.h>

#include <optional>
#include <string>

namespace Qi::Chroma::Perceptual {

// =============================================================================
// Construction
// =============================================================================

/**
 * @brief Create an opaque color from lightness, chroma and hue
 *
 * @param lightness Lightness [0-100]
 * @param chroma Chroma (absolute, or [0-100] for HsLab/HsLuv)
 * @param hue Hue angle; bare numbers are degrees
 * @param space Color space of the coordinates
 */
Color Lch(double lightness, double chroma, Angle hue,
          ColorSpace space = DEFAULT_COLOR_SPACE);
Color Lch(double lightness, double chroma, Angle hue, const std::string& space);

/**
 * @brief Create a color from lightness, chroma, hue and alpha
 */
Color Lcha(double lightness, double chroma, Angle hue, double alpha,
           ColorSpace space = DEFAULT_COLOR_SPACE);
Color Lcha(double lightness, double chroma, Angle hue, double alpha,
           const std::string& space);

// =============================================================================
// Projection
// =============================================================================

/**
 * @brief Polar coordinates of a color (hue in degrees)
 */
LchTriple ToLch(const Color& color, ColorSpace space = DEFAULT_COLOR_SPACE);
LchTriple ToLch(const Color& color, const std::string& space);

double GetLightness(const Color& color, ColorSpace space = DEFAULT_COLOR_SPACE);
double GetLightness(const Color& color, const std::string& space);

double GetChroma(const Color& color, ColorSpace space = DEFAULT_COLOR_SPACE);
double GetChroma(const Color& color, const std::string& space);

/**
 * @brief Hue of a color, in degrees
 *
 * Not wrapped: the Lab hue of blue is about -53.7 degrees.
 */
Angle GetHue(const Color& color, ColorSpace space = DEFAULT_COLOR_SPACE);
Angle GetHue(const Color& color, const std::string& space);

// =============================================================================
// Adjustment
// =============================================================================

/**
 * @brief Coordinates to adjust or replace
 *
 * Unset fields are left alone. Used as deltas by AdjustColor and as absolute
 * values by ChangeColor.
 *
 * @code
 * LchAdjustment adj;
 * adj.SetLightness(10).SetHue(Angle::Radians(0.5));
 * Color out = AdjustColor(in, adj);
 * @endcode
 */
struct LchAdjustment {
    std::optional<double> lightness;
    std::optional<double> chroma;
    std::optional<Angle> hue;
    std::optional<double> alpha;

    LchAdjustment& SetLightness(double value) { lightness = value; return *this; }
    LchAdjustment& SetChroma(double value) { chroma = value; return *this; }
    LchAdjustment& SetHue(Angle value) { hue = value; return *this; }
    LchAdjustment& SetAlpha(double value) { alpha = value; return *this; }
};

/**
 * @brief Add deltas to the polar coordinates of a color
 *
 * Chroma is floored at 0, alpha is clamped to [0, 1].
 */
Color AdjustColor(const Color& color, const LchAdjustment& delta,
                  ColorSpace space = DEFAULT_COLOR_SPACE);
Color AdjustColor(const Color& color, const LchAdjustment& delta,
                  const std::string& space);

/**
 * @brief Replace polar coordinates of a color
 */
Color ChangeColor(const Color& color, const LchAdjustment& values,
                  ColorSpace space = DEFAULT_COLOR_SPACE);
Color ChangeColor(const Color& color, const LchAdjustment& values,
                  const std::string& space);

/// Rotate hue by an angle
Color AdjustHue(const Color& color, Angle degrees, ColorSpace space = DEFAULT_COLOR_SPACE);
Color AdjustHue(const Color& color, Angle degrees, const std::string& space);

/// Increase lightness by an amount (lightness units)
Color Lighten(const Color& color, double amount, ColorSpace space = DEFAULT_COLOR_SPACE);
Color Lighten(const Color& color, double amount, const std::string& space);

/// Decrease lightness by an amount (lightness units)
Color Darken(const Color& color, double amount, ColorSpace space = DEFAULT_COLOR_SPACE);
Color Darken(const Color& color, double amount, const std::string& space);

/// Increase chroma by an amount (chroma units)
Color Saturate(const Color& color, double amount, ColorSpace space = DEFAULT_COLOR_SPACE);
Color Saturate(const Color& color, double amount, const std::string& space);

/// Decrease chroma by an amount (chroma units)
Color Desaturate(const Color& color, double amount, ColorSpace space = DEFAULT_COLOR_SPACE);
Color Desaturate(const Color& color, double amount, const std::string& space);

/// Rotate hue by 180 degrees
Color Complement(const Color& color, ColorSpace space = DEFAULT_COLOR_SPACE);
Color Complement(const Color& color, const std::string& space);

/// Set chroma to 0
Color Grayscale(const Color& color, ColorSpace space = DEFAULT_COLOR_SPACE);
Color Grayscale(const Color& color, const std::string& space);

// =============================================================================
// Distance
// =============================================================================

/**
 * @brief Euclidean distance of two colors in Lab (CIE76 delta E)
 *
 * Alpha is ignored. Distance between white and black is 100.
 */
double ColorDistance(const Color& a, const Color& b);

} // namespace Qi::Chroma::Perceptual
