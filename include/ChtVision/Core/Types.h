#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for ChtVision
 *
 * Coordinates are 0-based with pixel centers at integer positions:
 * x is the column, y is the row.
 */

#include <ChtVision/Core/Export.h>

#include <cmath>
#include <cstdint>

namespace Cht::Vision {

// =============================================================================
// Pixel Types
// =============================================================================

/**
 * @brief Pixel data types accepted as detector input
 */
enum class PixelType {
    UInt8,      ///< [0, 255], normalized by 255
    UInt16,     ///< [0, 65535], normalized by 65535
    Int16,      ///< [-32768, 32767], shifted then normalized
    Float32,    ///< Used as-is
    Float64     ///< Working type of gradient and accumulator images
};

/**
 * @brief Channel layouts; color input is reduced to luma before detection
 */
enum class ChannelType {
    Gray,
    RGB,
    BGR,
    RGBA,
    BGRA
};

// =============================================================================
// Geometry
// =============================================================================

/**
 * @brief Sub-pixel point (detected circle centers)
 */
struct CHTVISION_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    /// False for NaN or infinite coordinates (e.g. zero-weight centroids)
    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    Point2d operator+(const Point2d& other) const { return {x + other.x, y + other.y}; }
    Point2d operator-(const Point2d& other) const { return {x - other.x, y - other.y}; }

    double DistanceTo(const Point2d& other) const {
        double dx = x - other.x;
        double dy = y - other.y;
        return std::sqrt(dx * dx + dy * dy);
    }
};

/**
 * @brief Detected circle
 */
struct CHTVISION_API Circle2d {
    Point2d center;
    double radius = 0.0;

    Circle2d() = default;
    Circle2d(const Point2d& c, double r) : center(c), radius(r) {}
    Circle2d(double cx, double cy, double r) : center(cx, cy), radius(r) {}

    double Circumference() const;

    /// Point on the circle at angle (radians, measured from +x towards +y)
    Point2d PointAt(double angle) const;

    bool Contains(const Point2d& p) const { return center.DistanceTo(p) <= radius; }

    bool IsValid() const {
        return center.IsValid() && std::isfinite(radius) && radius >= 0.0;
    }
};

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Pixel neighborhood for reconstruction, maxima and labeling
 */
enum class Connectivity {
    Four,
    Eight
};

/**
 * @brief Intensity polarity of the circles to detect
 *
 * The gradient points from bright to dark, so bright objects have their
 * center against the gradient and dark objects along it.
 */
enum class ObjectPolarity {
    Bright,         ///< Bright object on dark background
    Dark            ///< Dark object on bright background
};

} // namespace Cht::Vision
