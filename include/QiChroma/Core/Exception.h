#pragma once

/**
 * @file Exception.h
 * @brief Exception hierarchy for QiChroma
 *
 * All library errors derive from Qi::Chroma::Exception so callers can catch
 * a single type. Numeric degeneracies are never reported through exceptions.
 */

#include <stdexcept>
#include <string>

namespace Qi::Chroma {

/**
 * @brief Base class of all QiChroma exceptions
 */
class Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief An argument is outside the accepted set (e.g. unknown color space)
 */
class InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief The operation is not defined for the given combination of inputs
 */
class UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

} // namespace Qi::Chroma
