#pragma once

/**
 * @file Mix.h
 * @brief Perceptual blending of two colors in a polar color space
 *
 * Lightness and chroma are interpolated linearly; hue takes the short way
 * around the circle, weighted by chroma so that a gray input does not drag
 * the hue of a saturated one. The result goes through gamut clipping, so a
 * mix may come out less saturated than the straight interpolation.
 */

#include <QiChroma/Core/Types.h>

#include <string>

namespace Qi::Chroma::Perceptual {

/**
 * @brief Interpolate two polar values
 *
 * @param a First value
 * @param b Second value
 * @param weight Fraction of a in the result [0-1]
 * @return Interpolated lightness/chroma and chroma-weighted circular mean hue
 */
LchTriple InterpolateLch(const LchTriple& a, const LchTriple& b, double weight);

/**
 * @brief Mix two colors
 *
 * @param color1 First color
 * @param color2 Second color
 * @param weight Fraction of color1 (0.2 or Ratio::Percent(20))
 * @param space Color space to interpolate in
 *
 * @code
 * Color c = Mix(Color::Black(), Color::White(), Ratio::Percent(20));  // #c6c6c6
 * @endcode
 */
Color Mix(const Color& color1, const Color& color2, Ratio weight = 0.5,
          ColorSpace space = DEFAULT_COLOR_SPACE);
Color Mix(const Color& color1, const Color& color2, Ratio weight,
          const std::string& space);

/**
 * @brief Mix a color with white
 *
 * @param amount Fraction of white in the result
 */
Color Tint(const Color& color, Ratio amount, ColorSpace space = DEFAULT_COLOR_SPACE);
Color Tint(const Color& color, Ratio amount, const std::string& space);

/**
 * @brief Mix a color with black
 *
 * @param amount Fraction of black in the result
 */
Color Shade(const Color& color, Ratio amount, ColorSpace space = DEFAULT_COLOR_SPACE);
Color Shade(const Color& color, Ratio amount, const std::string& space);

} // namespace Qi::Chroma::Perceptual
