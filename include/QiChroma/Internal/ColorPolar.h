#pragma once

/**
 * @file ColorPolar.h
 * @brief Polar (lightness, chroma, hue) representation and color space dispatch
 *
 * Provides:
 * - Cartesian <-> polar conversion of Lab-like triples
 * - Color -> LCh projection for every ColorSpace
 * - LCh -> raw (unclipped) RGB reconstruction
 * - Gamut test on raw RGB
 */

#include <QiChroma/Core/Types.h>

namespace Qi::Chroma::Internal {

/**
 * @brief (L, a, b) to (L, C, h)
 *
 * Hue is atan2(b, a) in degrees when |a| or |b| exceeds 0.0001, else 0.
 * Also used for Luv (L, u, v) and YUV (Y, V, -U) triples.
 */
LchTriple LabToLch(const Triple& lab);

/**
 * @brief (L, C, h) to (L, a, b)
 */
Triple LchToLab(const LchTriple& lch);

/**
 * @brief Underlying absolute space of a relative-chroma space
 *
 * HsLab -> Lab, HsLuv -> Luv, everything else maps to itself.
 */
ColorSpace BaseColorSpace(ColorSpace space);

/**
 * @brief Whether chroma of the space is relative to the sRGB gamut
 */
bool IsRelativeChroma(ColorSpace space);

/**
 * @brief Project a color onto the polar form of a color space
 *
 * For HsLab / HsLuv the chroma is 100 * C / MaxChroma(L, h) of the base space.
 */
LchTriple ToLch(const Color& color, ColorSpace space);

/**
 * @brief Exact RGB [0, 255] of an LCh value, possibly out of gamut
 *
 * @param lch Polar value with absolute chroma
 * @param space Lab, Luv, Hsl or Yuv
 * @throws UnsupportedException for HsLab / HsLuv (resolve chroma first)
 */
Triple LchToRawRgb(const LchTriple& lch, ColorSpace space);

/**
 * @brief Whether every channel of a raw RGB triple lies in [0, 255]
 */
bool IsInGamut(const Triple& rgb);

} // namespace Qi::Chroma::Internal
