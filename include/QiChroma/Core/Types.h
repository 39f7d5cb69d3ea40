#pragma once

/**
 * @file Types.h
 * @brief Value types shared by all QiChroma modules
 *
 * Provides:
 * - Color: 8-bit RGB + floating alpha
 * - Triple / LchTriple: real-valued coordinates of a color space
 * - Angle: hue value carrying its unit
 * - Ratio: weight or amount in [0, 1]
 * - ColorSpace: polar color space selector
 */

#include <cstdint>
#include <string>

namespace Qi::Chroma {

// =============================================================================
// Color Space Enumeration
// =============================================================================

/**
 * @brief Color spaces with a polar (lightness, chroma, hue) form
 */
enum class ColorSpace {
    Lab,        ///< CIE L*a*b* LCh(ab)
    Luv,        ///< CIE L*u*v* LCh(uv)
    Hsl,        ///< Native HSL: lightness, saturation, hue
    Yuv,        ///< BT.601 Y with polar (V, -U) chroma
    HsLab,      ///< Lab LCh with chroma relative to the sRGB gamut [0-100]
    HsLuv       ///< Luv LCh with chroma relative to the sRGB gamut [0-100]
};

/// Color space used when an operation is called without one
constexpr ColorSpace DEFAULT_COLOR_SPACE = ColorSpace::Lab;

/**
 * @brief Parse a color space name
 *
 * @param name One of "lab", "luv", "hsl", "yuv", "hslab", "hsluv"
 *             (case-insensitive)
 * @throws InvalidArgumentException for any other name
 */
ColorSpace ParseColorSpace(const std::string& name);

/**
 * @brief Get the canonical lower-case name of a color space
 */
std::string GetColorSpaceName(ColorSpace space);

// =============================================================================
// Color
// =============================================================================

/**
 * @brief sRGB color with 8-bit channels and floating alpha
 *
 * Immutable by convention: every library operation returns a new Color.
 */
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    double alpha = 1.0;

    Color() = default;

    /// Channels are clamped to [0, 255], alpha to [0, 1]
    Color(int r_, int g_, int b_, double alpha_ = 1.0);

    /**
     * @brief Build a color from real-valued channels
     *
     * Each channel is clamped to [0, 255] and rounded half-up; alpha is
     * clamped to [0, 1].
     */
    static Color FromRgb(double r, double g, double b, double alpha = 1.0);

    /// Build from 0xRRGGBB
    static Color FromHex(uint32_t rgb, double alpha = 1.0);

    // Predefined colors
    static Color White()   { return Color(255, 255, 255); }
    static Color Black()   { return Color(0, 0, 0); }
    static Color Red()     { return Color(255, 0, 0); }
    static Color Green()   { return Color(0, 128, 0); }
    static Color Lime()    { return Color(0, 255, 0); }
    static Color Blue()    { return Color(0, 0, 255); }
    static Color Yellow()  { return Color(255, 255, 0); }
    static Color Cyan()    { return Color(0, 255, 255); }
    static Color Magenta() { return Color(255, 0, 255); }
    static Color Gray()    { return Color(128, 128, 128); }

    /// 0xRRGGBB (alpha ignored)
    uint32_t ToHex() const;

    /// "#rrggbb" when opaque, "rgba(r,g,b,a)" otherwise
    std::string ToString() const;

    Color WithAlpha(double alpha_) const;

    bool IsOpaque() const { return alpha >= 1.0; }
    bool IsTransparent() const { return alpha <= 0.0; }

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && alpha == other.alpha;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// =============================================================================
// Coordinates
// =============================================================================

/**
 * @brief Three real coordinates of a color space
 *
 * The meaning and scale of each component is defined by the conversion that
 * produced it (e.g. XYZ scaled 0-100, raw RGB scaled 0-255, Lab as L, a, b).
 */
struct Triple {
    double c1 = 0.0;
    double c2 = 0.0;
    double c3 = 0.0;

    Triple() = default;
    Triple(double c1_, double c2_, double c3_) : c1(c1_), c2(c2_), c3(c3_) {}
};

/**
 * @brief Polar coordinates: lightness, chroma, hue (degrees)
 */
struct LchTriple {
    double lightness = 0.0;
    double chroma = 0.0;
    double hue = 0.0;   ///< Degrees, not wrapped

    LchTriple() = default;
    LchTriple(double l, double c, double h) : lightness(l), chroma(c), hue(h) {}
};

// =============================================================================
// Angle
// =============================================================================

/**
 * @brief Unit of an Angle value
 */
enum class AngleUnit {
    Degrees,
    Radians,
    Gradians,
    Turns
};

/**
 * @brief Hue angle carrying its unit
 *
 * A bare number converts implicitly and is interpreted as degrees:
 * @code
 * Lch(53.2, 104.6, 40);                      // 40 degrees
 * Lch(53.2, 104.6, Angle::Radians(0.69818)); // same hue
 * @endcode
 */
class Angle {
public:
    Angle(double degrees = 0.0) : value_(degrees), unit_(AngleUnit::Degrees) {}
    Angle(double value, AngleUnit unit) : value_(value), unit_(unit) {}

    static Angle Degrees(double value) { return Angle(value, AngleUnit::Degrees); }
    static Angle Radians(double value) { return Angle(value, AngleUnit::Radians); }
    static Angle Gradians(double value) { return Angle(value, AngleUnit::Gradians); }
    static Angle Turns(double value) { return Angle(value, AngleUnit::Turns); }

    double Value() const { return value_; }
    AngleUnit Unit() const { return unit_; }

    double ToDegrees() const;
    double ToRadians() const;

    /// Same angle expressed in another unit
    Angle In(AngleUnit unit) const;

private:
    double value_;
    AngleUnit unit_;
};

// =============================================================================
// Ratio
// =============================================================================

/**
 * @brief Weight or amount in [0, 1]
 *
 * A bare number converts implicitly as a unit fraction; percentages go
 * through Ratio::Percent.
 */
class Ratio {
public:
    Ratio(double fraction = 0.0);

    static Ratio Percent(double percent) { return Ratio(percent / 100.0); }

    double Fraction() const { return fraction_; }
    double ToPercent() const { return fraction_ * 100.0; }

private:
    double fraction_;
};

} // namespace Qi::Chroma
