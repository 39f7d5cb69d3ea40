/**
 * @file ColorTransfer.cpp
 * @brief Transfer curve and matrix conversion implementation
 */

#include <QiChroma/Internal/ColorTransfer.h>
#include <QiChroma/Core/Constants.h>

#include <algorithm>
#include <cmath>

namespace Qi::Chroma::Internal {

// =============================================================================
// Constants
// =============================================================================

namespace {

// sRGB to XYZ (D65) conversion matrix
constexpr double RGB_TO_XYZ[3][3] = {
    {0.4124, 0.3576, 0.1805},
    {0.2126, 0.7152, 0.0722},
    {0.0193, 0.1192, 0.9505}
};

// XYZ to sRGB (D65) conversion matrix
constexpr double XYZ_TO_RGB[3][3] = {
    { 3.2406, -1.5372, -0.4986},
    {-0.9689,  1.8758,  0.0415},
    { 0.0557, -0.2040,  1.0570}
};

// sRGB transfer curve
constexpr double SRGB_ENCODED_THRESHOLD = 0.04045;
constexpr double SRGB_LINEAR_THRESHOLD = 0.0031308;
constexpr double SRGB_SLOPE = 12.92;
constexpr double SRGB_GAMMA = 2.4;
constexpr double SRGB_OFFSET = 0.055;
constexpr double SRGB_SCALE = 1.055;

// CIE constants: epsilon = (6/29)^3, kappa = (29/3)^3
constexpr double CIE_EPSILON = 216.0 / 24389.0;
constexpr double CIE_KAPPA = 24389.0 / 27.0;
constexpr double LAB_DELTA = 6.0 / 29.0;
constexpr double LAB_LINEAR_SLOPE = 841.0 / 108.0;
constexpr double LAB_LINEAR_OFFSET = 4.0 / 29.0;
constexpr double LAB_INV_SLOPE = 108.0 / 841.0;

// BT.601 YUV
constexpr double YUV_KR = 0.299;
constexpr double YUV_KG = 0.587;
constexpr double YUV_KB = 0.114;

// Channel scale between 8-bit and percent
constexpr double PERCENT_TO_BYTE = 2.55;

inline double LabF(double t) {
    return (t > CIE_EPSILON) ? std::cbrt(t) : LAB_LINEAR_SLOPE * t + LAB_LINEAR_OFFSET;
}

inline double LabFInv(double t) {
    return (t > LAB_DELTA) ? t * t * t : LAB_INV_SLOPE * (t - LAB_LINEAR_OFFSET);
}

inline Triple MatMul(const double m[3][3], double x, double y, double z) {
    return Triple(m[0][0] * x + m[0][1] * y + m[0][2] * z,
                  m[1][0] * x + m[1][1] * y + m[1][2] * z,
                  m[2][0] * x + m[2][1] * y + m[2][2] * z);
}

} // anonymous namespace

// =============================================================================
// Transfer Curve
// =============================================================================

double SrgbToLinear(double channel) {
    double c = channel / 100.0;
    if (c > SRGB_ENCODED_THRESHOLD) {
        return 100.0 * std::pow((c + SRGB_OFFSET) / SRGB_SCALE, SRGB_GAMMA);
    }
    return channel / SRGB_SLOPE;
}

double LinearToSrgb(double channel) {
    double c = channel / 100.0;
    if (c > SRGB_LINEAR_THRESHOLD) {
        return 100.0 * (SRGB_SCALE * std::pow(c, 1.0 / SRGB_GAMMA) - SRGB_OFFSET);
    }
    return channel * SRGB_SLOPE;
}

// =============================================================================
// RGB <-> XYZ
// =============================================================================

const Triple& WhitePoint() {
    static const Triple white = RgbToXyz(Color::White());
    return white;
}

Triple RgbToXyz(const Color& color) {
    double r = SrgbToLinear(color.r / PERCENT_TO_BYTE);
    double g = SrgbToLinear(color.g / PERCENT_TO_BYTE);
    double b = SrgbToLinear(color.b / PERCENT_TO_BYTE);
    return MatMul(RGB_TO_XYZ, r, g, b);
}

Triple XyzToRgb(const Triple& xyz) {
    Triple lin = MatMul(XYZ_TO_RGB, xyz.c1, xyz.c2, xyz.c3);
    return Triple(LinearToSrgb(lin.c1) * PERCENT_TO_BYTE,
                  LinearToSrgb(lin.c2) * PERCENT_TO_BYTE,
                  LinearToSrgb(lin.c3) * PERCENT_TO_BYTE);
}

// =============================================================================
// XYZ <-> Lab
// =============================================================================

Triple XyzToLab(const Triple& xyz) {
    const Triple& w = WhitePoint();
    double fx = LabF(xyz.c1 / w.c1);
    double fy = LabF(xyz.c2 / w.c2);
    double fz = LabF(xyz.c3 / w.c3);

    return Triple(116.0 * fy - 16.0,
                  500.0 * (fx - fy),
                  200.0 * (fy - fz));
}

Triple LabToXyz(const Triple& lab) {
    const Triple& w = WhitePoint();
    double fy = (lab.c1 + 16.0) / 116.0;
    double fx = fy + lab.c2 / 500.0;
    double fz = fy - lab.c3 / 200.0;

    return Triple(w.c1 * LabFInv(fx),
                  w.c2 * LabFInv(fy),
                  w.c3 * LabFInv(fz));
}

// =============================================================================
// XYZ <-> Luv
// =============================================================================

Triple XyzToYuuvv(const Triple& xyz) {
    double denom = xyz.c1 + 15.0 * xyz.c2 + 3.0 * xyz.c3;
    if (denom == 0.0) {
        return Triple(xyz.c2, 0.0, 0.0);
    }
    return Triple(xyz.c2, 4.0 * xyz.c1 / denom, 9.0 * xyz.c2 / denom);
}

Triple XyzToLuv(const Triple& xyz) {
    const Triple& w = WhitePoint();
    Triple yuv = XyzToYuuvv(xyz);
    Triple white = XyzToYuuvv(w);

    double yr = yuv.c1 / w.c2;
    double l = (yr > CIE_EPSILON) ? 116.0 * std::cbrt(yr) - 16.0 : CIE_KAPPA * yr;

    return Triple(l,
                  13.0 * l * (yuv.c2 - white.c2),
                  13.0 * l * (yuv.c3 - white.c3));
}

Triple LuvToXyz(const Triple& luv) {
    double l = luv.c1;
    if (l == 0.0) {
        return Triple();
    }

    const Triple& w = WhitePoint();
    Triple white = XyzToYuuvv(w);

    double up = luv.c2 / (13.0 * l) + white.c2;
    double vp = luv.c3 / (13.0 * l) + white.c3;
    double y = (l > CIE_KAPPA * CIE_EPSILON)
        ? w.c2 * std::pow((l + 16.0) / 116.0, 3.0)
        : w.c2 * l * 27.0 / 24389.0;

    if (vp == 0.0) {
        return Triple(0.0, y, 0.0);
    }

    return Triple(y * 9.0 * up / (4.0 * vp),
                  y,
                  y * (12.0 - 3.0 * up - 20.0 * vp) / (4.0 * vp));
}

// =============================================================================
// RGB <-> YUV
// =============================================================================

Triple RgbToYuv(const Color& color) {
    double r = color.r / PERCENT_TO_BYTE;
    double g = color.g / PERCENT_TO_BYTE;
    double b = color.b / PERCENT_TO_BYTE;

    double y = YUV_KR * r + YUV_KG * g + YUV_KB * b;
    double u = -0.14713 * r - 0.28886 * g + 0.436 * b;
    double v = 0.615 * r - 0.51499 * g - 0.10001 * b;

    return Triple(y, v, -u);
}

Triple YuvToRgb(const Triple& yuv) {
    double y = yuv.c1;
    double v = yuv.c2;
    double u = -yuv.c3;

    return Triple((y + 1.13983 * v) * PERCENT_TO_BYTE,
                  (y - 0.39465 * u - 0.58060 * v) * PERCENT_TO_BYTE,
                  (y + 2.03211 * u) * PERCENT_TO_BYTE);
}

// =============================================================================
// RGB <-> HSL
// =============================================================================

Triple RgbToHsl(const Color& color) {
    double rd = color.r / 255.0;
    double gd = color.g / 255.0;
    double bd = color.b / 255.0;

    double maxVal = std::max({rd, gd, bd});
    double minVal = std::min({rd, gd, bd});
    double diff = maxVal - minVal;

    // Lightness
    double ld = (maxVal + minVal) / 2.0;

    if (diff == 0) {
        return Triple(ld * 100.0, 0.0, 0.0);
    }

    // Saturation
    double sd = diff / (1.0 - std::fabs(2.0 * ld - 1.0));

    // Hue
    double hue;
    if (maxVal == rd) {
        hue = 60.0 * std::fmod((gd - bd) / diff + 6.0, 6.0);
    } else if (maxVal == gd) {
        hue = 60.0 * ((bd - rd) / diff + 2.0);
    } else {
        hue = 60.0 * ((rd - gd) / diff + 4.0);
    }

    return Triple(ld * 100.0, sd * 100.0, hue);
}

Triple HslToRgb(const Triple& hsl) {
    double ld = Clamp(hsl.c1, 0.0, 100.0) / 100.0;
    double sd = Clamp(hsl.c2, 0.0, 100.0) / 100.0;
    double hd = NormalizeDegrees(hsl.c3);

    if (sd == 0) {
        return Triple(ld * 255.0, ld * 255.0, ld * 255.0);
    }

    double c = (1.0 - std::fabs(2.0 * ld - 1.0)) * sd;
    double x = c * (1.0 - std::fabs(std::fmod(hd / 60.0, 2.0) - 1.0));
    double m = ld - c / 2.0;

    double rd, gd, bd;
    if (hd < 60) { rd = c; gd = x; bd = 0; }
    else if (hd < 120) { rd = x; gd = c; bd = 0; }
    else if (hd < 180) { rd = 0; gd = c; bd = x; }
    else if (hd < 240) { rd = 0; gd = x; bd = c; }
    else if (hd < 300) { rd = x; gd = 0; bd = c; }
    else { rd = c; gd = 0; bd = x; }

    return Triple((rd + m) * 255.0, (gd + m) * 255.0, (bd + m) * 255.0);
}

} // namespace Qi::Chroma::Internal
