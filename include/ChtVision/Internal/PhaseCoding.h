#pragma once

/**
 * @file PhaseCoding.h
 * @brief Radius recovery from the phase of the circle accumulator
 *
 * Inverse of the log-linear phase ramp used for voting:
 * r = exp(ln rMin + (phi + pi) / (2 * pi) * (ln rMax - ln rMin)).
 */

#include <ChtVision/Core/Types.h>
#include <ChtVision/Internal/CircleAccumulator.h>

#include <vector>

namespace Cht::Vision::Internal {

/**
 * @brief Radius encoded by a phase angle in (-pi, pi]
 *
 * Returns rMin when rMin == rMax.
 */
double PhaseToRadius(double phase, double rMin, double rMax);

/**
 * @brief Estimate one radius per center
 *
 * The phase is read at the accumulator cell nearest to each center.
 *
 * @param centers Circle centers (0-based, inside the accumulator)
 * @param accumulator Accumulator the centers were detected in
 * @param rMin Minimum radius of the search range
 * @param rMax Maximum radius of the search range
 * @return Radii in [rMin, rMax], same order as centers
 *
 * @throws InvalidArgumentException on invalid range or a center outside the accumulator
 */
std::vector<double> EstimateRadii(const std::vector<Point2d>& centers,
                                  const CircleAccumulator& accumulator,
                                  double rMin, double rMax);

} // namespace Cht::Vision::Internal
