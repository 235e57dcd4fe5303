#pragma once

/**
 * @file CircleAccumulator.h
 * @brief Phase-coded circle voting
 *
 * This module provides:
 * - Edge pixel extraction from a gradient field (Otsu or fixed threshold)
 * - Radius sampling of a search range
 * - Phase-coded vote weights
 * - Accumulation of votes into a complex 2D array
 *
 * Every edge pixel votes, for each sampled radius r, at the point r pixels
 * away along its gradient direction. The vote weight is
 * exp(i * phi(r)) / (2 * pi * r), where phi maps [ln rMin, ln rMax] linearly
 * onto [-pi, pi]. The accumulator magnitude then measures how many edges
 * agree on a center, and its phase encodes the dominant radius, so a single
 * 2D array replaces the (x, y, r) parameter space.
 *
 * Used by:
 * - CircleFinder (public API)
 * - CirclePeaks / PhaseCoding (read-only consumers)
 */

#include <ChtVision/Core/Constants.h>
#include <ChtVision/Core/QImage.h>
#include <ChtVision/Core/Types.h>
#include <ChtVision/Internal/Gradient.h>

#include <complex>
#include <cstddef>
#include <optional>
#include <vector>

namespace Cht::Vision::Internal {

// =============================================================================
// Data Structures
// =============================================================================

/**
 * @brief Edge pixel with its gradient
 */
struct EdgePixel {
    int32_t x = 0;              ///< Column (0-based)
    int32_t y = 0;              ///< Row (0-based)
    double gx = 0.0;            ///< Horizontal gradient
    double gy = 0.0;            ///< Vertical gradient
    double magnitude = 0.0;     ///< sqrt(gx^2 + gy^2), > 0

    EdgePixel() = default;
    EdgePixel(int32_t x_, int32_t y_, double gx_, double gy_, double mag_)
        : x(x_), y(y_), gx(gx_), gy(gy_), magnitude(mag_) {}
};

/**
 * @brief Complex accumulator, same size as the source image
 */
struct CircleAccumulator {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<std::complex<double>> data;     ///< Row-major, width * height

    CircleAccumulator() = default;
    CircleAccumulator(int32_t w, int32_t h)
        : width(w), height(h), data(static_cast<size_t>(w) * h) {}

    bool Empty() const { return data.empty(); }

    const std::complex<double>& At(int32_t x, int32_t y) const {
        return data[static_cast<size_t>(y) * width + x];
    }

    std::complex<double>& At(int32_t x, int32_t y) {
        return data[static_cast<size_t>(y) * width + x];
    }

    /// True if no cell received a non-zero vote
    bool IsAllZero() const;

    /// Magnitude as a Float64 gray image
    QImage Magnitude() const;
};

/**
 * @brief Voting parameters
 */
struct AccumulatorParams {
    /// Bright: center lies against the gradient. Dark: along the gradient.
    ObjectPolarity polarity = ObjectPolarity::Bright;

    /// Upper bound of (edge pixels x radius samples) processed per chunk
    size_t maxChunkElements = CHT_MAX_CHUNK_ELEMENTS;

    /// Number of worker threads (> 1 requires an OpenMP build)
    int numThreads = 1;
};

// =============================================================================
// Edge Extraction
// =============================================================================

/**
 * @brief Threshold level for edge extraction
 *
 * Otsu level of magnitude / maxMagnitude on a 256-bin histogram.
 *
 * @return Level in [0, 1], 0 if maxMagnitude is not positive
 */
double ComputeEdgeThresholdLevel(const QImage& magnitude, double maxMagnitude);

/**
 * @brief Select voting pixels
 *
 * Keeps every pixel whose magnitude is strictly greater than
 * level * max(magnitude). level is edgeThreshold when given, otherwise the
 * Otsu level. Pixels are returned in row-major order.
 *
 * @param field Gradient field
 * @param edgeThreshold Optional fixed level in [0, 1]
 * @return Edge pixels, empty if the field is empty or has no gradient
 *
 * @throws InvalidArgumentException if edgeThreshold is outside [0, 1]
 */
std::vector<EdgePixel> ExtractEdgePixels(const GradientField& field,
                                         std::optional<double> edgeThreshold = std::nullopt);

// =============================================================================
// Radius Sampling and Phase Coding
// =============================================================================

/**
 * @brief Radius samples rMin, rMin + step, ... with rMax always included
 *
 * Returns {rMin} when rMin == rMax.
 *
 * @throws InvalidArgumentException if rMin < 1, rMax < rMin or step <= 0
 */
std::vector<double> ComputeRadiusSamples(double rMin, double rMax,
                                         double step = CHT_RADIUS_STEP);

/**
 * @brief Phase angle of a radius inside [rMin, rMax]
 *
 * phi = 2 * pi * (ln r - ln rMin) / (ln rMax - ln rMin) - pi.
 * Returns -pi when rMin == rMax.
 */
double RadiusToPhase(double radius, double rMin, double rMax);

/**
 * @brief Vote weight per radius sample
 *
 * w(r) = exp(i * phi(r)) / (2 * pi * r), with phi spanning the first and
 * last sample.
 */
std::vector<std::complex<double>> ComputePhaseWeights(const std::vector<double>& radii);

/**
 * @brief Edge pixels per chunk: max(1, maxChunkElements / numRadii)
 */
size_t ComputeChunkSize(size_t maxChunkElements, size_t numRadii);

// =============================================================================
// Voting
// =============================================================================

/**
 * @brief Build the phase-coded accumulator
 *
 * For each edge pixel and radius sample, the projected center
 * (x - s * r * gx / g, y - s * r * gy / g), s = +1 for bright and -1 for
 * dark objects, is rounded to the nearest pixel. Votes are kept for
 * 0 <= cx <= width - 1 and 0 <= cy <= height - 2; the last row never
 * receives votes.
 *
 * Edge pixels are processed in consecutive chunks. With numThreads > 1 the
 * chunks are split into contiguous groups that vote into private arrays,
 * which are then summed in group order, so the result is deterministic for
 * a given thread count. The group count is min(numThreads, chunks,
 * omp_get_max_threads()), which bounds the extra memory to one image-sized
 * array per available thread; builds without OpenMP always use one group.
 *
 * @throws InvalidArgumentException on invalid radius range or parameters
 */
CircleAccumulator BuildCircleAccumulator(int32_t width, int32_t height,
                                         const std::vector<EdgePixel>& edges,
                                         double rMin, double rMax,
                                         const AccumulatorParams& params = AccumulatorParams());

} // namespace Cht::Vision::Internal
