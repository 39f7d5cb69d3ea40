/**
 * @file ColorPolar.cpp
 * @brief Polar representation and color space dispatch
 */

#include <QiChroma/Internal/ColorPolar.h>
#include <QiChroma/Internal/ColorTransfer.h>
#include <QiChroma/Internal/GamutClip.h>
#include <QiChroma/Core/Constants.h>
#include <QiChroma/Core/Exception.h>

#include <cmath>

namespace Qi::Chroma::Internal {

LchTriple LabToLch(const Triple& lab) {
    double chroma = std::hypot(lab.c2, lab.c3);

    // atan2(0, 0) is unstable for achromatic colors
    double hue = 0.0;
    if (std::abs(lab.c2) > ACHROMATIC_EPSILON || std::abs(lab.c3) > ACHROMATIC_EPSILON) {
        hue = RadToDeg(std::atan2(lab.c3, lab.c2));
    }

    return LchTriple(lab.c1, chroma, hue);
}

Triple LchToLab(const LchTriple& lch) {
    double h = DegToRad(lch.hue);
    return Triple(lch.lightness, std::cos(h) * lch.chroma, std::sin(h) * lch.chroma);
}

ColorSpace BaseColorSpace(ColorSpace space) {
    switch (space) {
        case ColorSpace::HsLab: return ColorSpace::Lab;
        case ColorSpace::HsLuv: return ColorSpace::Luv;
        default: return space;
    }
}

bool IsRelativeChroma(ColorSpace space) {
    return space == ColorSpace::HsLab || space == ColorSpace::HsLuv;
}

LchTriple ToLch(const Color& color, ColorSpace space) {
    switch (space) {
        case ColorSpace::Lab:
            return LabToLch(XyzToLab(RgbToXyz(color)));

        case ColorSpace::Luv:
            return LabToLch(XyzToLuv(RgbToXyz(color)));

        case ColorSpace::Hsl: {
            // HSL is already polar: (lightness, saturation, hue)
            Triple hsl = RgbToHsl(color);
            return LchTriple(hsl.c1, hsl.c2, hsl.c3);
        }

        case ColorSpace::Yuv:
            return LabToLch(RgbToYuv(color));

        case ColorSpace::HsLab:
        case ColorSpace::HsLuv: {
            ColorSpace base = BaseColorSpace(space);
            LchTriple lch = ToLch(color, base);
            double maxChroma = MaxChroma(lch.lightness, lch.hue, base);
            lch.chroma = lch.chroma / maxChroma * 100.0;
            return lch;
        }
    }
    throw InvalidArgumentException("Unknown color space value");
}

Triple LchToRawRgb(const LchTriple& lch, ColorSpace space) {
    switch (space) {
        case ColorSpace::Lab:
            return XyzToRgb(LabToXyz(LchToLab(lch)));

        case ColorSpace::Luv:
            return XyzToRgb(LuvToXyz(LchToLab(lch)));

        case ColorSpace::Hsl:
            return HslToRgb(Triple(lch.lightness, lch.chroma, lch.hue));

        case ColorSpace::Yuv:
            return YuvToRgb(LchToLab(lch));

        case ColorSpace::HsLab:
        case ColorSpace::HsLuv:
            throw UnsupportedException("LchToRawRgb requires absolute chroma, got " +
                                       GetColorSpaceName(space));
    }
    throw InvalidArgumentException("Unknown color space value");
}

bool IsInGamut(const Triple& rgb) {
    return rgb.c1 >= 0.0 && rgb.c1 <= 255.0 &&
           rgb.c2 >= 0.0 && rgb.c2 <= 255.0 &&
           rgb.c3 >= 0.0 && rgb.c3 <= 255.0;
}

} // namespace Qi::Chroma::Internal
