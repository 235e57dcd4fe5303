#pragma once

/**
 * @file MorphGray.h
 * @brief Gray-level morphological reconstruction on Float64 images
 *
 * Provides:
 * - Reconstruction by dilation (hybrid raster / FIFO algorithm)
 * - h-maxima transform
 * - Regional maxima
 *
 * Used by:
 * - CirclePeaks (suppression of weak accumulator peaks)
 */

#include <ChtVision/Core/QImage.h>
#include <ChtVision/Core/Types.h>

namespace Cht::Vision::Internal {

// =============================================================================
// Geodesic Operations
// =============================================================================

/**
 * @brief Morphological reconstruction by dilation
 *
 * Repeated geodesic dilation of marker under mask until stability.
 * The marker is clamped to the mask first, so marker > mask is allowed.
 *
 * @param marker Marker image (Float64 gray)
 * @param mask Mask image (Float64 gray, same size)
 * @param connectivity Neighborhood (default: 8-connected)
 * @return Reconstructed image
 *
 * @throws InvalidArgumentException if sizes differ
 * @throws UnsupportedException if an image is not Float64 gray
 */
QImage GrayReconstructByDilation(const QImage& marker, const QImage& mask,
                                 Connectivity connectivity = Connectivity::Eight);

// =============================================================================
// Extrema
// =============================================================================

/**
 * @brief h-maxima transform
 *
 * Reconstruction by dilation of (src - h) under src. Suppresses all maxima
 * whose height above their surroundings is at most h.
 *
 * @param h Height (>= 0)
 */
QImage HMaxima(const QImage& src, double h,
               Connectivity connectivity = Connectivity::Eight);

/**
 * @brief Regional maxima mask
 *
 * A regional maximum is a connected set of equal-valued pixels with at least
 * one neighbor outside the set, all such neighbors having strictly lower
 * values. A plateau covering the whole image is not a maximum.
 *
 * @return UInt8 gray mask (1 = maximum, 0 = other)
 */
QImage RegionalMaxima(const QImage& src,
                      Connectivity connectivity = Connectivity::Eight);

} // namespace Cht::Vision::Internal
