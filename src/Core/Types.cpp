/**
 * @file Types.cpp
 * @brief Core value type implementation
 */

#include <QiChroma/Core/Types.h>
#include <QiChroma/Core/Constants.h>
#include <QiChroma/Core/Exception.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace Qi::Chroma {

namespace {

inline uint8_t RoundChannel(double val) {
    // Half-up rounding of the clamped value
    return static_cast<uint8_t>(std::floor(Clamp(val, 0.0, 255.0) + 0.5));
}

} // anonymous namespace

// =============================================================================
// ColorSpace
// =============================================================================

ColorSpace ParseColorSpace(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    if (lower == "lab") return ColorSpace::Lab;
    if (lower == "luv") return ColorSpace::Luv;
    if (lower == "hsl") return ColorSpace::Hsl;
    if (lower == "yuv") return ColorSpace::Yuv;
    if (lower == "hslab") return ColorSpace::HsLab;
    if (lower == "hsluv") return ColorSpace::HsLuv;

    throw InvalidArgumentException("Unknown color space: " + name);
}

std::string GetColorSpaceName(ColorSpace space) {
    switch (space) {
        case ColorSpace::Lab: return "lab";
        case ColorSpace::Luv: return "luv";
        case ColorSpace::Hsl: return "hsl";
        case ColorSpace::Yuv: return "yuv";
        case ColorSpace::HsLab: return "hslab";
        case ColorSpace::HsLuv: return "hsluv";
    }
    throw InvalidArgumentException("Unknown color space value");
}

// =============================================================================
// Color
// =============================================================================

Color::Color(int r_, int g_, int b_, double alpha_)
    : r(static_cast<uint8_t>(Clamp(r_, 0, 255)))
    , g(static_cast<uint8_t>(Clamp(g_, 0, 255)))
    , b(static_cast<uint8_t>(Clamp(b_, 0, 255)))
    , alpha(Clamp(alpha_, 0.0, 1.0)) {}

Color Color::FromRgb(double r, double g, double b, double alpha) {
    return Color(RoundChannel(r), RoundChannel(g), RoundChannel(b), alpha);
}

Color Color::FromHex(uint32_t rgb, double alpha) {
    return Color(static_cast<uint8_t>((rgb >> 16) & 0xFF),
                 static_cast<uint8_t>((rgb >> 8) & 0xFF),
                 static_cast<uint8_t>(rgb & 0xFF),
                 alpha);
}

uint32_t Color::ToHex() const {
    return (static_cast<uint32_t>(r) << 16) |
           (static_cast<uint32_t>(g) << 8) |
           static_cast<uint32_t>(b);
}

std::string Color::ToString() const {
    char buf[48];
    if (IsOpaque()) {
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    } else {
        std::snprintf(buf, sizeof(buf), "rgba(%d,%d,%d,%g)", r, g, b, alpha);
    }
    return buf;
}

Color Color::WithAlpha(double alpha_) const {
    return Color(r, g, b, alpha_);
}

// =============================================================================
// Angle
// =============================================================================

double Angle::ToDegrees() const {
    switch (unit_) {
        case AngleUnit::Degrees: return value_;
        case AngleUnit::Radians: return RadToDeg(value_);
        case AngleUnit::Gradians: return value_ * 0.9;
        case AngleUnit::Turns: return value_ * FULL_TURN_DEG;
    }
    return value_;
}

double Angle::ToRadians() const {
    if (unit_ == AngleUnit::Radians) return value_;
    return DegToRad(ToDegrees());
}

Angle Angle::In(AngleUnit unit) const {
    double degrees = ToDegrees();
    switch (unit) {
        case AngleUnit::Degrees: return Angle(degrees, unit);
        case AngleUnit::Radians: return Angle(ToRadians(), unit);
        case AngleUnit::Gradians: return Angle(degrees / 0.9, unit);
        case AngleUnit::Turns: return Angle(degrees / FULL_TURN_DEG, unit);
    }
    return *this;
}

// =============================================================================
// Ratio
// =============================================================================

Ratio::Ratio(double fraction) : fraction_(Clamp(fraction, 0.0, 1.0)) {}

} // namespace Qi::Chroma
