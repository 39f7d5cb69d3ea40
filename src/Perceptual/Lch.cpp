/**
 * @file Lch.cpp
 * @brief Perceptual construction, projection and adjustment
 */

#include <QiChroma/Perceptual/Lch.h>
#include <QiChroma/Internal/ColorPolar.h>
#include <QiChroma/Internal/ColorTransfer.h>
#include <QiChroma/Internal/GamutClip.h>
#include <QiChroma/Core/Constants.h>

#include <algorithm>
#include <cmath>

namespace Qi::Chroma::Perceptual {

namespace {

Color Rebuild(const LchTriple& lch, double alpha, ColorSpace space) {
    LchTriple target = lch;
    target.chroma = std::max(0.0, target.chroma);
    return Internal::ClipToGamut(target, space, Clamp(alpha, 0.0, 1.0));
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Color Lch(double lightness, double chroma, Angle hue, ColorSpace space) {
    return Lcha(lightness, chroma, hue, 1.0, space);
}

Color Lch(double lightness, double chroma, Angle hue, const std::string& space) {
    return Lch(lightness, chroma, hue, ParseColorSpace(space));
}

Color Lcha(double lightness, double chroma, Angle hue, double alpha, ColorSpace space) {
    return Internal::ClipToGamut(LchTriple(lightness, chroma, hue.ToDegrees()), space,
                                 Clamp(alpha, 0.0, 1.0));
}

Color Lcha(double lightness, double chroma, Angle hue, double alpha,
           const std::string& space) {
    return Lcha(lightness, chroma, hue, alpha, ParseColorSpace(space));
}

// =============================================================================
// Projection
// =============================================================================

LchTriple ToLch(const Color& color, ColorSpace space) {
    return Internal::ToLch(color, space);
}

LchTriple ToLch(const Color& color, const std::string& space) {
    return Internal::ToLch(color, ParseColorSpace(space));
}

double GetLightness(const Color& color, ColorSpace space) {
    return Internal::ToLch(color, space).lightness;
}

double GetLightness(const Color& color, const std::string& space) {
    return GetLightness(color, ParseColorSpace(space));
}

double GetChroma(const Color& color, ColorSpace space) {
    return Internal::ToLch(color, space).chroma;
}

double GetChroma(const Color& color, const std::string& space) {
    return GetChroma(color, ParseColorSpace(space));
}

Angle GetHue(const Color& color, ColorSpace space) {
    return Angle::Degrees(Internal::ToLch(color, space).hue);
}

Angle GetHue(const Color& color, const std::string& space) {
    return GetHue(color, ParseColorSpace(space));
}

// =============================================================================
// Adjustment
// =============================================================================

Color AdjustColor(const Color& color, const LchAdjustment& delta, ColorSpace space) {
    LchTriple lch = Internal::ToLch(color, space);
    double alpha = color.alpha;

    if (delta.lightness) lch.lightness += *delta.lightness;
    if (delta.chroma) lch.chroma += *delta.chroma;
    if (delta.hue) lch.hue += delta.hue->ToDegrees();
    if (delta.alpha) alpha += *delta.alpha;

    return Rebuild(lch, alpha, space);
}

Color AdjustColor(const Color& color, const LchAdjustment& delta, const std::string& space) {
    return AdjustColor(color, delta, ParseColorSpace(space));
}

Color ChangeColor(const Color& color, const LchAdjustment& values, ColorSpace space) {
    LchTriple lch = Internal::ToLch(color, space);
    double alpha = color.alpha;

    if (values.lightness) lch.lightness = *values.lightness;
    if (values.chroma) lch.chroma = *values.chroma;
    if (values.hue) lch.hue = values.hue->ToDegrees();
    if (values.alpha) alpha = *values.alpha;

    return Rebuild(lch, alpha, space);
}

Color ChangeColor(const Color& color, const LchAdjustment& values, const std::string& space) {
    return ChangeColor(color, values, ParseColorSpace(space));
}

Color AdjustHue(const Color& color, Angle degrees, ColorSpace space) {
    return AdjustColor(color, LchAdjustment().SetHue(degrees), space);
}

Color AdjustHue(const Color& color, Angle degrees, const std::string& space) {
    return AdjustHue(color, degrees, ParseColorSpace(space));
}

Color Lighten(const Color& color, double amount, ColorSpace space) {
    return AdjustColor(color, LchAdjustment().SetLightness(amount), space);
}

Color Lighten(const Color& color, double amount, const std::string& space) {
    return Lighten(color, amount, ParseColorSpace(space));
}

Color Darken(const Color& color, double amount, ColorSpace space) {
    return AdjustColor(color, LchAdjustment().SetLightness(-amount), space);
}

Color Darken(const Color& color, double amount, const std::string& space) {
    return Darken(color, amount, ParseColorSpace(space));
}

Color Saturate(const Color& color, double amount, ColorSpace space) {
    return AdjustColor(color, LchAdjustment().SetChroma(amount), space);
}

Color Saturate(const Color& color, double amount, const std::string& space) {
    return Saturate(color, amount, ParseColorSpace(space));
}

Color Desaturate(const Color& color, double amount, ColorSpace space) {
    return AdjustColor(color, LchAdjustment().SetChroma(-amount), space);
}

Color Desaturate(const Color& color, double amount, const std::string& space) {
    return Desaturate(color, amount, ParseColorSpace(space));
}

Color Complement(const Color& color, ColorSpace space) {
    return AdjustHue(color, Angle::Degrees(180.0), space);
}

Color Complement(const Color& color, const std::string& space) {
    return Complement(color, ParseColorSpace(space));
}

Color Grayscale(const Color& color, ColorSpace space) {
    return ChangeColor(color, LchAdjustment().SetChroma(0.0), space);
}

Color Grayscale(const Color& color, const std::string& space) {
    return Grayscale(color, ParseColorSpace(space));
}

// =============================================================================
// Distance
// =============================================================================

double ColorDistance(const Color& a, const Color& b) {
    Triple labA = Internal::XyzToLab(Internal::RgbToXyz(a));
    Triple labB = Internal::XyzToLab(Internal::RgbToXyz(b));

    return std::sqrt(Square(labA.c1 - labB.c1) +
                     Square(labA.c2 - labB.c2) +
                     Square(labA.c3 - labB.c3));
}

} // namespace Qi::Chroma::Perceptual
