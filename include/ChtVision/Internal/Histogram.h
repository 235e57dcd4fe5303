#pragma once

/**
 * @file Histogram.h
 * @brief Histogram computation and global threshold selection
 *
 * Provides:
 * - 256-bin histogram of unit-range double data
 * - Otsu threshold level (between-class variance maximization)
 *
 * Used by:
 * - CircleAccumulator (adaptive gradient threshold)
 */

#include <ChtVision/Core/QImage.h>
#include <ChtVision/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Cht::Vision::Internal {

// ============================================================================
// Constants
// ============================================================================

/// Standard histogram bin count for 8-bit quantization
constexpr int32_t HISTOGRAM_BINS_8BIT = 256;

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief 1D Histogram data
 */
struct Histogram {
    std::vector<uint32_t> bins;     ///< Bin counts
    int32_t numBins = 256;          ///< Number of bins
    double minValue = 0;            ///< Value mapped to bin 0
    double maxValue = 1;            ///< Value mapped to the last bin
    uint64_t totalCount = 0;        ///< Total sample count

    Histogram() : bins(HISTOGRAM_BINS_8BIT, 0) {}

    explicit Histogram(int32_t nBins, double minVal = 0, double maxVal = 1)
        : bins(nBins, 0), numBins(nBins), minValue(minVal), maxValue(maxVal) {}

    /// Get bin count at index
    uint32_t At(int32_t idx) const {
        if (idx < 0 || idx >= static_cast<int32_t>(bins.size())) return 0;
        return bins[idx];
    }

    /**
     * @brief Get bin index for a value
     *
     * Bin centers sit on minValue + k * (maxValue - minValue) / (numBins - 1);
     * values are rounded to the nearest center and clamped.
     */
    int32_t GetBinIndex(double value) const;

    /// Get value at bin center
    double GetBinValue(int32_t idx) const {
        if (numBins <= 1) return minValue;
        return minValue + idx * (maxValue - minValue) / (numBins - 1);
    }
};

// ============================================================================
// Histogram Computation
// ============================================================================

/**
 * @brief Compute histogram of raw double data
 *
 * NaN samples are skipped.
 */
Histogram ComputeHistogram(const double* data, size_t count,
                           int32_t numBins = HISTOGRAM_BINS_8BIT,
                           double minVal = 0.0, double maxVal = 1.0);

/**
 * @brief Compute histogram of a Float64 gray image
 */
Histogram ComputeHistogram(const QImage& image,
                           int32_t numBins = HISTOGRAM_BINS_8BIT,
                           double minVal = 0.0, double maxVal = 1.0);

// ============================================================================
// Threshold Selection
// ============================================================================

/**
 * @brief Otsu threshold level as a fraction of the histogram range
 *
 * For every candidate split k the between-class variance
 * sigma_b^2 = (mu_t * omega_k - mu_k)^2 / (omega_k * (1 - omega_k)) is
 * evaluated with 1-based bin indices. The level is the mean of all maximizing
 * indices minus one, divided by numBins - 1. If the maximum is not finite
 * (degenerate histogram) the level is 0.
 *
 * @return Level in [0, 1]
 */
double ComputeOtsuLevel(const Histogram& hist);

} // namespace Cht::Vision::Internal
