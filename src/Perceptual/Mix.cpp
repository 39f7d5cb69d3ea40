/**
 * @file Mix.cpp
 * @brief Polar color mixing
 */

#include <QiChroma/Perceptual/Mix.h>
#include <QiChroma/Internal/ColorPolar.h>
#include <QiChroma/Internal/GamutClip.h>
#include <QiChroma/Core/Constants.h>

namespace Qi::Chroma::Perceptual {

LchTriple InterpolateLch(const LchTriple& a, const LchTriple& b, double weight) {
    double w = Clamp(weight, 0.0, 1.0);

    double lightness = a.lightness * w + b.lightness * (1.0 - w);
    double chroma = a.chroma * w + b.chroma * (1.0 - w);

    double w1 = w * a.chroma;
    double w2 = (1.0 - w) * b.chroma;
    if (w1 + w2 == 0.0) {
        // Both achromatic
        w1 = 0.5;
        w2 = 0.5;
    }

    // Bring hues within 180 degrees of each other
    double h1 = a.hue;
    double h2 = b.hue;
    if (h1 < h2) {
        if (h2 - h1 > 180.0) h1 += FULL_TURN_DEG;
    } else {
        if (h1 - h2 > 180.0) h2 += FULL_TURN_DEG;
    }

    double hue = (h1 * w1 + h2 * w2) / (w1 + w2);

    return LchTriple(lightness, chroma, hue);
}

Color Mix(const Color& color1, const Color& color2, Ratio weight, ColorSpace space) {
    double w = weight.Fraction();
    LchTriple lch1 = Internal::ToLch(color1, space);
    LchTriple lch2 = Internal::ToLch(color2, space);

    LchTriple mixed = InterpolateLch(lch1, lch2, w);
    double alpha = color1.alpha * w + color2.alpha * (1.0 - w);

    return Internal::ClipToGamut(mixed, space, alpha);
}

Color Mix(const Color& color1, const Color& color2, Ratio weight, const std::string& space) {
    return Mix(color1, color2, weight, ParseColorSpace(space));
}

Color Tint(const Color& color, Ratio amount, ColorSpace space) {
    return Mix(Color::White(), color, amount, space);
}

Color Tint(const Color& color, Ratio amount, const std::string& space) {
    return Tint(color, amount, ParseColorSpace(space));
}

Color Shade(const Color& color, Ratio amount, ColorSpace space) {
    return Mix(Color::Black(), color, amount, space);
}

Color Shade(const Color& color, Ratio amount, const std::string& space) {
    return Shade(color, amount, ParseColorSpace(space));
}

} // namespace Qi::Chroma::Perceptual
