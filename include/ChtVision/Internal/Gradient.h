#pragma once

/**
 * @file Gradient.h
 * @brief Image normalization and Sobel gradient field
 *
 * Provides:
 * - Conversion of any supported image to Float64 gray in [0, 1]
 * - 3x3 Sobel kernels
 * - Gradient field (Gx, Gy, magnitude)
 *
 * Sign convention: the Sobel kernels are applied as a convolution, so the
 * gradient vector (Gx, Gy) points from brighter towards darker intensity.
 * A bright disk therefore has gradients pointing outward along its rim.
 *
 * Used by:
 * - CircleAccumulator (edge extraction and center projection)
 */

#include <ChtVision/Core/QImage.h>
#include <ChtVision/Internal/Convolution.h>

#include <vector>

namespace Cht::Vision::Internal {

// =============================================================================
// Data Structures
// =============================================================================

/**
 * @brief Gradient components and magnitude of an image
 *
 * All three images are Float64 gray of identical size.
 * magnitude(x, y) == sqrt(gx^2 + gy^2).
 */
struct GradientField {
    QImage gx;
    QImage gy;
    QImage magnitude;

    int32_t Width() const { return magnitude.Width(); }
    int32_t Height() const { return magnitude.Height(); }
    bool Empty() const { return magnitude.Empty(); }
};

// =============================================================================
// Normalization
// =============================================================================

/**
 * @brief Convert an image to Float64 gray
 *
 * Color input is reduced to gray first. Integer samples are scaled to [0, 1]
 * (UInt8 / 255, UInt16 / 65535, Int16 shifted by 32768 then / 65535).
 * Floating-point samples are copied unchanged.
 *
 * @return Float64 gray image, empty if input is empty
 */
QImage NormalizeToDouble(const QImage& image);

// =============================================================================
// Sobel Kernels
// =============================================================================

/// Derivative kernel {1, 0, -1}, correlation form of the convolution kernel {-1, 0, 1}
std::vector<double> SobelDerivativeKernel();

/// Smoothing kernel {1, 2, 1}
std::vector<double> SobelSmoothingKernel();

// =============================================================================
// Gradient Computation
// =============================================================================

/**
 * @brief Compute the Sobel gradient field
 *
 * @param image Float64 gray image (see NormalizeToDouble)
 * @param borderMode Border handling (default: replicate)
 * @return Gradient field, empty if image is empty
 *
 * @throws UnsupportedException if image is not Float64 gray
 */
GradientField ComputeGradientField(const QImage& image,
                                   BorderMode borderMode = BorderMode::Replicate);

} // namespace Cht::Vision::Internal
