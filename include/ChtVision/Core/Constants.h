#pragma once

/**
 * @file Constants.h
 * @brief Mathematical constants and library-wide defaults
 */

#include <cstddef>

namespace Cht::Vision {

// =============================================================================
// Mathematical Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double EPSILON = 1e-10;

// =============================================================================
// Memory
// =============================================================================

/// Row alignment of image buffers (AVX-512 friendly)
constexpr size_t MEMORY_ALIGNMENT = 64;

// =============================================================================
// Circular Hough Transform Defaults
// =============================================================================

/// Default detection sensitivity (acceptance threshold = 1 - sensitivity)
constexpr double CHT_DEFAULT_SENSITIVITY = 0.85;

/// Spacing of the radius samples used for voting
constexpr double CHT_RADIUS_STEP = 0.5;

/// Side length of the median filter applied to the accumulator magnitude
constexpr int CHT_MEDIAN_FILTER_SIZE = 5;

/// Element budget of the per-chunk edge x radius matrices
constexpr size_t CHT_MAX_CHUNK_ELEMENTS = 1000000;

/// Radii at or below this value trigger an accuracy warning
constexpr double CHT_SMALL_RADIUS_WARNING = 5.0;

} // namespace Cht::Vision
