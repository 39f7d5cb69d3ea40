/**
 * @file contrast_palette.cpp
 * @brief Build an accessible text palette from a brand color
 *
 * Derives tints and shades of a base color in LCh, then stretches each text
 * color until it meets WCAG AA (or AAA when requested) on its background.
 *
 * Usage: contrast_palette [#rrggbb] [lab|luv|hsl|yuv|hslab|hsluv] [AA|AAA|ratio]
 */

#include <QiChroma/QiChroma.h>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

using namespace Qi::Chroma;
using namespace Qi::Chroma::Perceptual;
using namespace Qi::Chroma::Wcag;

namespace {

Color ParseHex(const std::string& text) {
    std::string digits = (!text.empty() && text[0] == '#') ? text.substr(1) : text;
    if (digits.size() != 6) {
        throw InvalidArgumentException("Expected #rrggbb, got " + text);
    }
    char* end = nullptr;
    unsigned long value = std::strtoul(digits.c_str(), &end, 16);
    if (*end != '\0') {
        throw InvalidArgumentException("Expected #rrggbb, got " + text);
    }
    return Color::FromHex(static_cast<uint32_t>(value));
}

void PrintRow(const std::string& name, const Color& bg, const Color& fg, double threshold) {
    double ratio = Contrast(bg, fg);
    std::cout << "  " << std::left << std::setw(10) << name
              << bg.ToString() << "  text " << fg.ToString()
              << "  " << std::fixed << std::setprecision(2) << ratio
              << (ratio >= threshold ? "  pass" : "  FAIL") << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string baseText = argc > 1 ? argv[1] : "#3366cc";
    std::string spaceText = argc > 2 ? argv[2] : "lab";
    std::string thresholdText = argc > 3 ? argv[3] : "AA";

    Color base;
    ColorSpace space;
    Threshold threshold;
    try {
        base = ParseHex(baseText);
        space = ParseColorSpace(spaceText);
        threshold = Threshold(thresholdText);
    } catch (const Exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::cout << "=== QiChroma " << GetVersion() << " Contrast Palette ===" << std::endl;

    LchTriple lch = ToLch(base, space);
    std::cout << "Base: " << base.ToString() << " in " << GetColorSpaceName(space)
              << "  L=" << std::fixed << std::setprecision(2) << lch.lightness
              << " C=" << lch.chroma << " h=" << lch.hue << std::endl;
    std::cout << "Threshold: " << threshold.Value() << std::endl;

    // =========================================================================
    // Background ramp
    // =========================================================================
    std::cout << "\n=== Backgrounds ===" << std::endl;

    const double steps[] = {0.8, 0.6, 0.4, 0.2};
    for (double amount : steps) {
        Color bg = Tint(base, amount, space);
        Color text = ContrastStretch(bg, base, threshold);
        PrintRow("tint " + std::to_string(static_cast<int>(amount * 100)) + "%", bg, text,
                 threshold.Value());
    }

    PrintRow("base", base, ContrastColor(base), threshold.Value());

    for (double amount : steps) {
        Color bg = Shade(base, 1.0 - amount, space);
        Color text = ContrastStretch(bg, base, threshold);
        PrintRow("shade " + std::to_string(static_cast<int>((1.0 - amount) * 100)) + "%", bg,
                 text, threshold.Value());
    }

    // =========================================================================
    // Accent colors around the hue circle
    // =========================================================================
    std::cout << "\n=== Accents on white ===" << std::endl;

    for (int i = 1; i < 6; ++i) {
        Color accent = AdjustHue(base, 60.0 * i, space);
        Color text = ContrastCheck(Color::White(), ContrastStretch(Color::White(), accent, threshold),
                                   threshold);
        PrintRow("hue+" + std::to_string(60 * i), Color::White(), text, threshold.Value());
    }

    std::cout << "\nComplement: " << Complement(base, space).ToString()
              << "  Grayscale: " << Grayscale(base, space).ToString() << std::endl;

    return 0;
}
