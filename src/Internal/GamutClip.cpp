/**
 * @file GamutClip.cpp
 * @brief Gamut boundary searches
 */

#include <QiChroma/Internal/GamutClip.h>
#include <QiChroma/Internal/ColorPolar.h>
#include <QiChroma/Core/Constants.h>

#include <cstdio>

namespace Qi::Chroma::Internal {

double MaxChroma(double lightness, double hue, ColorSpace space) {
    ColorSpace base = BaseColorSpace(space);

    double low = 0.0;
    double high = MAX_CHROMA_SEARCH;
    while (high - low > MAX_CHROMA_TOLERANCE) {
        double mid = (low + high) / 2.0;
        if (IsInGamut(LchToRawRgb(LchTriple(lightness, mid, hue), base))) {
            low = mid;
        } else {
            high = mid;
        }
    }

    return (low + high) / 2.0;
}

Color ClipToGamut(const LchTriple& lch, ColorSpace space, double alpha) {
    ColorSpace base = BaseColorSpace(space);
    LchTriple target = lch;
    if (IsRelativeChroma(space)) {
        target.chroma = lch.chroma / 100.0 * MaxChroma(lch.lightness, lch.hue, base);
    }

    Triple rgb = LchToRawRgb(target, base);
    if (IsInGamut(rgb)) {
        return Color::FromRgb(rgb.c1, rgb.c2, rgb.c3, alpha);
    }

    // low is always in gamut (or 0), high never is
    double low = 0.0;
    double high = target.chroma;
    int steps = 0;
    while (high - low > CLIP_CHROMA_TOLERANCE) {
        double mid = (low + high) / 2.0;
        LchTriple candidate(target.lightness, mid, target.hue);
        if (IsInGamut(LchToRawRgb(candidate, base))) {
            low = mid;
        } else {
            high = mid;
        }
        ++steps;
    }

#ifdef QICHROMA_DEBUG
    std::fprintf(stderr, "[GamutClip] %s L=%.3f C=%.3f h=%.3f -> C=%.3f (%d steps)\n",
                 GetColorSpaceName(space).c_str(), target.lightness, target.chroma,
                 target.hue, low, steps);
#else
    (void)steps;
#endif

    rgb = LchToRawRgb(LchTriple(target.lightness, low, target.hue), base);
    return Color::FromRgb(rgb.c1, rgb.c2, rgb.c3, alpha);
}

} // namespace Qi::Chroma::Internal
