#pragma once

/**
 * @file GamutClip.h
 * @brief Chroma searches that keep generated colors inside the sRGB gamut
 *
 * Both searches are plain bisections with a fixed tolerance, so their cost
 * is bounded: MaxChroma runs 8 steps, ClipToGamut at most ~14.
 */

#include <QiChroma/Core/Types.h>

namespace Qi::Chroma::Internal {

/**
 * @brief Largest in-gamut chroma at a lightness and hue
 *
 * Bisects chroma over [0, 200] until the interval is at most 1 wide and
 * returns its midpoint. The tolerance defines the HSLab/HSLuv chroma scale.
 *
 * @param lightness Lightness of the base space
 * @param hue Hue in degrees
 * @param space Lab, Luv, Hsl or Yuv (relative spaces use their base)
 */
double MaxChroma(double lightness, double hue, ColorSpace space);

/**
 * @brief Build an in-gamut color from a polar value
 *
 * Relative chroma (HsLab/HsLuv) is first converted to absolute chroma. If the
 * exact color is in gamut it is returned directly; otherwise chroma is
 * bisected down toward 0 to within 0.01, keeping the candidate known to be
 * in gamut. Lightness and hue are never changed.
 *
 * @param lch Requested lightness, chroma, hue (degrees)
 * @param space Color space of lch
 * @param alpha Alpha of the result
 */
Color ClipToGamut(const LchTriple& lch, ColorSpace space, double alpha = 1.0);

} // namespace Qi::Chroma::Internal
