#pragma once

/**
 * @file Constants.h
 * @brief Mathematical and precision constants for QiChroma
 */

#include <cmath>
#include <cstdint>
#include <limits>

namespace Qi::Chroma {

// =============================================================================
// Mathematical Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

/// Degrees in a full turn of the hue circle
constexpr double FULL_TURN_DEG = 360.0;

// =============================================================================
// Precision Constants
// =============================================================================

/// Tolerance for floating point comparison
constexpr double EPSILON = 1e-9;

/// Below this |a| and |b| a color is treated as achromatic (hue = 0)
constexpr double ACHROMATIC_EPSILON = 0.0001;

// =============================================================================
// Algorithm Limits
// =============================================================================

/// Upper bound of the chroma search used by MaxChroma
constexpr double MAX_CHROMA_SEARCH = 200.0;

/// Interval width at which MaxChroma stops (part of the HSLab/HSLuv scale)
constexpr double MAX_CHROMA_TOLERANCE = 1.0;

/// Interval width at which gamut clipping stops
constexpr double CLIP_CHROMA_TOLERANCE = 0.01;

/// Bisection steps of ContrastStretch
constexpr int CONTRAST_STRETCH_ITERATIONS = 10;

/// Base luma below which ContrastStretch moves toward white
constexpr double CONTRAST_STRETCH_PIVOT_LUMA = 0.18;

// =============================================================================
// Utility Functions
// =============================================================================

/**
 * @brief Check if two doubles are approximately equal
 */
inline bool ApproxEqual(double a, double b, double epsilon = EPSILON) {
    return std::abs(a - b) <= epsilon;
}

/**
 * @brief Clamp value to range
 */
template<typename T>
inline T Clamp(T value, T minVal, T maxVal) {
    return value < minVal ? minVal : (value > maxVal ? maxVal : value);
}

/**
 * @brief Convert degrees to radians
 */
inline double DegToRad(double degrees) {
    return degrees * DEG_TO_RAD;
}

/**
 * @brief Convert radians to degrees
 */
inline double RadToDeg(double radians) {
    return radians * RAD_TO_DEG;
}

/**
 * @brief Normalize angle in degrees to [0, 360)
 */
inline double NormalizeDegrees(double degrees) {
    double wrapped = std::fmod(degrees, FULL_TURN_DEG);
    return wrapped < 0.0 ? wrapped + FULL_TURN_DEG : wrapped;
}

/**
 * @brief Square of a value
 */
template<typename T>
inline T Square(T x) {
    return x * x;
}

} // namespace Qi::Chroma
