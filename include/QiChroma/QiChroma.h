#pragma once

/**
 * @file QiChroma.h
 * @brief Main header file for QiChroma library
 *
 * QiChroma is a colorimetric library providing perceptual color
 * construction (Lab/Luv/HSL/YUV LCh with sRGB gamut clipping), perceptual
 * mixing and WCAG contrast computation.
 *
 * @author QiChroma Team
 * @version 0.1.0
 */

// Core types and utilities
#include <QiChroma/Core/Types.h>
#include <QiChroma/Core/Constants.h>
#include <QiChroma/Core/Exception.h>

// Feature modules
#include <QiChroma/Perceptual/Lch.h>
#include <QiChroma/Perceptual/Mix.h>
#include <QiChroma/Wcag/Contrast.h>

namespace Qi::Chroma {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return "0.1.0";
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = 0;
    minor = 1;
    patch = 0;
}

} // namespace Qi::Chroma
