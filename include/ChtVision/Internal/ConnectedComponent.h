#pragma once

/**
 * @file ConnectedComponent.h
 * @brief Connected component labeling and per-component statistics
 *
 * Algorithms:
 * - Two-pass labeling with union-find
 * - Area, bounding box and centroid per component
 * - Intensity-weighted centroid per component
 *
 * Labels are numbered 1..N in the raster order (row-major) of each
 * component's first pixel.
 */

#include <ChtVision/Core/QImage.h>
#include <ChtVision/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Cht::Vision::Internal {

// =============================================================================
// Types
// =============================================================================

/**
 * @brief Label map with 32-bit labels (0 = background)
 */
struct LabelImage {
    int32_t width = 0;
    int32_t height = 0;
    int32_t numLabels = 0;
    std::vector<int32_t> labels;    ///< Row-major, width * height

    bool Empty() const { return labels.empty(); }

    int32_t At(int32_t x, int32_t y) const {
        return labels[static_cast<size_t>(y) * width + x];
    }
};

// =============================================================================
// Labeling
// =============================================================================

/**
 * @brief Label connected components in a binary image
 *
 * @param binary UInt8 gray image (non-zero = foreground)
 * @param connectivity 4 or 8 connectivity
 * @return Label map, empty if binary is empty
 *
 * @throws UnsupportedException if binary is not UInt8 gray
 */
LabelImage LabelConnectedComponents(const QImage& binary,
                                    Connectivity connectivity = Connectivity::Eight);

// =============================================================================
// Statistics
// =============================================================================

/**
 * @brief Intensity-weighted centroid of every component
 *
 * centroid = sum(w * p) / sum(w) over the component's pixels. A component
 * whose total weight is zero yields a NaN centroid.
 *
 * @param labels Label map
 * @param weights Float64 gray image of the same size
 * @return One centroid per label (index 0 = label 1)
 *
 * @throws InvalidArgumentException if sizes differ
 */
std::vector<Point2d> ComputeWeightedCentroids(const LabelImage& labels,
                                              const QImage& weights);

} // namespace Cht::Vision::Internal
