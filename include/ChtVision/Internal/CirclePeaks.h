#pragma once

/**
 * @file CirclePeaks.h
 * @brief Circle center detection in a phase-coded accumulator
 *
 * Pipeline:
 * 1. |accumulator|
 * 2. 5x5 median filter (zero padding) when both sides exceed 5 pixels
 * 3. h-maxima suppression with h just below the suppression threshold
 * 4. Regional maxima (8-connected)
 * 5. Weighted centroid of each maximum, weights = unfiltered magnitude
 * 6. Metric = suppressed value at the rounded centroid, sorted descending
 */

#include <ChtVision/Core/QImage.h>
#include <ChtVision/Core/Types.h>
#include <ChtVision/Internal/CircleAccumulator.h>

#include <vector>

namespace Cht::Vision::Internal {

/**
 * @brief Candidate circle center
 */
struct CircleCandidate {
    Point2d center;         ///< Sub-pixel center (0-based)
    double metric = 0.0;    ///< Accumulator strength after suppression

    CircleCandidate() = default;
    CircleCandidate(const Point2d& c, double m) : center(c), metric(m) {}
};

/**
 * @brief Spacing of doubles at value (distance to the next larger double)
 */
double DoubleSpacing(double value);

/**
 * @brief Smooth the accumulator magnitude for peak detection
 *
 * 5x5 median with zero padding if min(width, height) > 5, otherwise a copy.
 */
QImage SmoothAccumulatorMagnitude(const QImage& magnitude);

/**
 * @brief Find circle centers in the accumulator
 *
 * @param accumulator Phase-coded accumulator
 * @param suppressionThreshold Peaks lower than this above their surroundings
 *        are suppressed; must be in [0, 1]
 * @return Candidates sorted by metric, descending (stable)
 *
 * @throws InvalidArgumentException if suppressionThreshold is outside [0, 1]
 */
std::vector<CircleCandidate> FindCircleCenters(const CircleAccumulator& accumulator,
                                               double suppressionThreshold);

} // namespace Cht::Vision::Internal
