#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for ChtVision
 *
 * Design principles:
 * - Empty image returns false (not an error), invalid throws
 * - Parameter checks run before any computation
 * - Consistent error message format: "<function>: <param> must be ..., got ..."
 */

#include <ChtVision/Core/Export.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Core/QImage.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace Cht::Vision::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

inline const char* PixelTypeName(PixelType type) {
    switch (type) {
        case PixelType::UInt8:   return "UInt8";
        case PixelType::UInt16:  return "UInt16";
        case PixelType::Int16:   return "Int16";
        case PixelType::Float32: return "Float32";
        case PixelType::Float64: return "Float64";
        default:                 return "Unknown";
    }
}

} // namespace Detail

// =============================================================================
// Image Validation
// =============================================================================

/**
 * @brief Check image is allocated and valid (no type restriction)
 *
 * @return false if empty (caller should return empty result)
 * @throws InvalidArgumentException if image is invalid (corrupted)
 */
inline bool RequireImageValid(const QImage& image, const char* funcName) {
    if (image.Empty()) {
        return false;  // Empty = no-op, not an error
    }
    if (!image.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is invalid");
    }
    return true;
}

/**
 * @brief Check image has specific pixel type
 * @throws UnsupportedException if type mismatch
 */
inline void RequireImageType(const QImage& image, PixelType expected, const char* funcName) {
    if (image.Type() != expected) {
        throw UnsupportedException(
            std::string(funcName) + ": expected " + Detail::PixelTypeName(expected) +
            " image, got " + Detail::PixelTypeName(image.Type()));
    }
}

/**
 * @brief Check image has exactly one channel
 */
inline void RequireSingleChannel(const QImage& image, const char* funcName) {
    if (image.Channels() != 1) {
        throw UnsupportedException(
            std::string(funcName) + ": expected 1 channel, got " +
            std::to_string(image.Channels()));
    }
}

/**
 * @brief Validate Float64 grayscale image
 * @return false if empty
 */
inline bool RequireImageDoubleGray(const QImage& image, const char* funcName) {
    if (!RequireImageValid(image, funcName)) return false;
    RequireImageType(image, PixelType::Float64, funcName);
    RequireSingleChannel(image, funcName);
    return true;
}

/**
 * @brief Check two images have identical dimensions
 */
inline void RequireSameSize(const QImage& a, const QImage& b, const char* funcName) {
    if (a.Width() != b.Width() || a.Height() != b.Height()) {
        throw InvalidArgumentException(
            std::string(funcName) + ": image size mismatch (" +
            std::to_string(a.Width()) + "x" + std::to_string(a.Height()) + " vs " +
            std::to_string(b.Width()) + "x" + std::to_string(b.Height()) + ")");
    }
}

// =============================================================================
// Value Range Validation
// =============================================================================

/**
 * @brief Validate value is finite
 */
inline void RequireFinite(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be finite");
    }
}

/**
 * @brief Validate value is in range [min, max]
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (!(value >= minVal && value <= maxVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is positive (> 0)
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (!(value > T(0))) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is at least minimum (>= min)
 */
template<typename T>
inline void RequireMin(T value, T minVal, const char* paramName, const char* funcName) {
    if (!(value >= minVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= " +
            Detail::FormatValue(minVal) + ", got " + Detail::FormatValue(value));
    }
}

// =============================================================================
// Detector Parameters
// =============================================================================

/**
 * @brief Validate a radius search range: finite, minRadius >= 1, maxRadius >= minRadius
 */
inline void RequireRadiusRange(double minRadius, double maxRadius, const char* funcName) {
    RequireFinite(minRadius, "minRadius", funcName);
    RequireFinite(maxRadius, "maxRadius", funcName);
    RequireMin(minRadius, 1.0, "minRadius", funcName);
    RequireMin(maxRadius, minRadius, "maxRadius", funcName);
}

/**
 * @brief Validate a fraction in [0, 1] (sensitivity, thresholds); NaN is rejected
 */
inline void RequireUnitInterval(double value, const char* paramName, const char* funcName) {
    RequireRange(value, 0.0, 1.0, paramName, funcName);
}

// =============================================================================
// Convenience Macros
// =============================================================================

/// Early return with retval for an empty image, throw for an invalid one
#define CHTVISION_REQUIRE_IMAGE_OR(img, retval) \
    if (!::Cht::Vision::Validate::RequireImageValid(img, __func__)) return retval

#define CHTVISION_REQUIRE_IMAGE(img) \
    CHTVISION_REQUIRE_IMAGE_OR(img, {})

/// As CHTVISION_REQUIRE_IMAGE, and require Float64 single channel
#define CHTVISION_REQUIRE_IMAGE_DOUBLE(img) \
    if (!::Cht::Vision::Validate::RequireImageDoubleGray(img, __func__)) return {}

} // namespace Cht::Vision::Validate
