#pragma once

/**
 * @file ColorTransfer.h
 * @brief sRGB transfer curve and matrix conversions between color spaces
 *
 * Scales used throughout:
 * - sRGB / linear RGB channels for the transfer curve: [0, 100]
 * - XYZ: [0, 100] per channel (D65 white = (95.05, 100, 108.9))
 * - Raw RGB triples returned by the inverse transforms: [0, 255], unclipped
 * - YUV: Y in [0, 100], stored as (Y, V, -U)
 * - HSL: (lightness [0-100], saturation [0-100], hue [0-360))
 *
 * All functions are pure; inverse transforms may return out-of-gamut values
 * that the caller is expected to test with IsInGamut (ColorPolar.h).
 */

#include <QiChroma/Core/Types.h>

namespace Qi::Chroma::Internal {

// =============================================================================
// Transfer Curve
// =============================================================================

/**
 * @brief sRGB-encoded channel to linear light, both on [0, 100]
 */
double SrgbToLinear(double channel);

/**
 * @brief Linear light to sRGB-encoded channel, both on [0, 100]
 *
 * Out-of-range inputs extrapolate (negative stays negative on the linear
 * segment, > 100 stays > 100).
 */
double LinearToSrgb(double channel);

// =============================================================================
// RGB <-> XYZ
// =============================================================================

/**
 * @brief Reference white (D65) in XYZ, equal to RgbToXyz(white)
 */
const Triple& WhitePoint();

Triple RgbToXyz(const Color& color);

/**
 * @brief XYZ to raw sRGB triple in [0, 255] (not clipped)
 */
Triple XyzToRgb(const Triple& xyz);

// =============================================================================
// XYZ <-> Lab
// =============================================================================

Triple XyzToLab(const Triple& xyz);
Triple LabToXyz(const Triple& lab);

// =============================================================================
// XYZ <-> Luv
// =============================================================================

/**
 * @brief XYZ to (Y, u', v') chromaticity
 *
 * u' = v' = 0 when X + 15Y + 3Z is zero.
 */
Triple XyzToYuuvv(const Triple& xyz);

Triple XyzToLuv(const Triple& xyz);

/**
 * @brief Luv to XYZ; L = 0 maps to black
 */
Triple LuvToXyz(const Triple& luv);

// =============================================================================
// RGB <-> YUV
// =============================================================================

/**
 * @brief BT.601 YUV, returned as (Y, V, -U) on a [0, 100] channel scale
 */
Triple RgbToYuv(const Color& color);

/**
 * @brief Inverse of RgbToYuv; expects (Y, V, -U), returns raw RGB [0, 255]
 */
Triple YuvToRgb(const Triple& yuv);

// =============================================================================
// RGB <-> HSL
// =============================================================================

/**
 * @brief Native HSL as (lightness, saturation, hue)
 */
Triple RgbToHsl(const Color& color);

/**
 * @brief (lightness, saturation, hue) to raw RGB [0, 255]
 *
 * Lightness and saturation are clamped to [0, 100], hue wraps.
 */
Triple HslToRgb(const Triple& hsl);

} // namespace Qi::Chroma::Internal
