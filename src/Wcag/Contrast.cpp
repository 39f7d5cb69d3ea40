/**
 * @file Contrast.cpp
 * @brief WCAG contrast implementation
 */

#include <QiChroma/Wcag/Contrast.h>
#include <QiChroma/Internal/ColorTransfer.h>
#include <QiChroma/Core/Constants.h>
#include <QiChroma/Core/Exception.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>

namespace Qi::Chroma::Wcag {

// =============================================================================
// Constants
// =============================================================================

namespace {

// BT.709 luminance weights
constexpr double LUMA_R = 0.2126;
constexpr double LUMA_G = 0.7152;
constexpr double LUMA_B = 0.0722;

// WCAG flare term
constexpr double CONTRAST_FLARE = 0.05;

// Channel scale between 8-bit and percent
constexpr double PERCENT_TO_BYTE = 2.55;

std::array<double, 256> BuildSrgbTable() {
    std::array<double, 256> table{};
    for (int i = 0; i < 256; ++i) {
        table[i] = Internal::SrgbToLinear(i / PERCENT_TO_BYTE) / 100.0;
    }
    return table;
}

const std::array<double, 256>& SrgbTable() {
    static const std::array<double, 256> table = BuildSrgbTable();
    return table;
}

// Channel-wise linear mix in sRGB, weight is the fraction of a
Color MixRgb(const Color& a, const Color& b, double weight) {
    return Color::FromRgb(a.r * weight + b.r * (1.0 - weight),
                          a.g * weight + b.g * (1.0 - weight),
                          a.b * weight + b.b * (1.0 - weight),
                          a.alpha * weight + b.alpha * (1.0 - weight));
}

double RatioOf(double luma1, double luma2) {
    return (std::max(luma1, luma2) + CONTRAST_FLARE) /
           (std::min(luma1, luma2) + CONTRAST_FLARE);
}

// Contrast of fg composited onto an opaque bg
double OpaqueContrast(const Color& fg, const Color& bg) {
    return RatioOf(Luma(bg), Luma(AlphaBlend(fg, bg)));
}

} // anonymous namespace

// =============================================================================
// Thresholds
// =============================================================================

double ResolveThreshold(const std::string& alias) {
    if (alias == "AA") return THRESHOLD_AA;
    if (alias == "AALG") return THRESHOLD_AA_LARGE;
    if (alias == "AAA") return THRESHOLD_AAA;
    if (alias == "AAALG") return THRESHOLD_AAA_LARGE;

    const char* begin = alias.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0') {
        throw InvalidArgumentException("Unknown contrast threshold: " + alias);
    }
    return value;
}

double ResolveThreshold(const char* alias) {
    if (alias == nullptr) {
        throw InvalidArgumentException("Contrast threshold is null");
    }
    return ResolveThreshold(std::string(alias));
}

// =============================================================================
// Luminance and Compositing
// =============================================================================

double SrgbChannelToLinear(uint8_t channel) {
    return SrgbTable()[channel];
}

double Luma(const Color& color) {
    const auto& table = SrgbTable();
    return LUMA_R * table[color.r] + LUMA_G * table[color.g] + LUMA_B * table[color.b];
}

Color AlphaBlend(const Color& fg, const Color& bg) {
    double af = fg.alpha;
    double ab = bg.alpha;
    if (af == 0.0 && ab == 0.0) {
        return fg;
    }

    double a = af + (1.0 - af) * ab;
    return Color::FromRgb((af * fg.r + (1.0 - af) * ab * bg.r) / a,
                          (af * fg.g + (1.0 - af) * ab * bg.g) / a,
                          (af * fg.b + (1.0 - af) * ab * bg.b) / a,
                          a);
}

// =============================================================================
// Contrast
// =============================================================================

double ContrastMin(const Color& fg, const Color& bg) {
    if (bg.IsOpaque()) {
        return OpaqueContrast(fg, bg);
    }

    Color overWhite = AlphaBlend(bg, Color::White());
    Color overBlack = AlphaBlend(bg, Color::Black());
    double fgLuma = Luma(fg);

    if (Luma(overWhite) < fgLuma) {
        return OpaqueContrast(fg, overWhite);
    }
    if (Luma(overBlack) > fgLuma) {
        return OpaqueContrast(fg, overBlack);
    }
    // Some backdrop matches the luminance of fg
    return 1.0;
}

double Contrast(const Color& color1, const Color& color2) {
    if (color1.IsOpaque() && color2.IsOpaque()) {
        return OpaqueContrast(color1, color2);
    }
    return (ContrastMin(color1, color2) + ContrastMin(color2, color1)) / 2.0;
}

Color ContrastColor(const Color& base, const Color& dark, const Color& light) {
    return Contrast(base, dark) >= Contrast(base, light) ? dark : light;
}

Color ContrastStretch(const Color& base, const Color& color, Threshold threshold) {
    double target = threshold.Value();
    if (Contrast(base, color) >= target) {
        return color;
    }

    Color upper = Luma(base) < CONTRAST_STRETCH_PIVOT_LUMA ? Color::White() : Color::Black();
    if (Contrast(base, upper) < target) {
        return upper;
    }

    // Contrast is not monotonic in the mix fraction; the loop only relies on
    // lower failing and upper passing.
    Color lower = color;
    for (int i = 0; i < CONTRAST_STRETCH_ITERATIONS; ++i) {
        Color mid = MixRgb(lower, upper, 0.5);
        if (Contrast(base, mid) < target) {
            lower = mid;
        } else {
            upper = mid;
        }
    }

    return upper;
}

Color ContrastCheck(const Color& base, const Color& color, Threshold threshold) {
    double ratio = Contrast(base, color);
    if (ratio < threshold.Value()) {
        std::fprintf(stderr, "[ContrastCheck] Warning: contrast of %s on %s is %.2f, below %.2f\n",
                     color.ToString().c_str(), base.ToString().c_str(),
                     ratio, threshold.Value());
    }
    return color;
}

} // namespace Qi::Chroma::Wcag
