#pragma once

#include <ChtVision/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for ChtVision
 */

#include <stdexcept>
#include <string>

namespace Cht::Vision {

/**
 * @brief Base exception class for ChtVision
 */
class CHTVISION_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument (bad radius range, parameter outside [0, 1], ...)
 */
class CHTVISION_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief Unsupported pixel type, channel layout or build feature
 */
class CHTVISION_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

/**
 * @brief File I/O exception
 */
class CHTVISION_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

} // namespace Cht::Vision
