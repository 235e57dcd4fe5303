#pragma once

#include <ChtVision/Core/Export.h>

/**
 * @file CircleFinder.h
 * @brief Circle detection with the phase-coded Circular Hough Transform
 *
 * Finds circles whose radius lies in a given range. Edge pixels vote for
 * candidate centers at every sampled radius; the radius is encoded in the
 * phase of the vote, so the accumulator stays two-dimensional and the radius
 * of each detected circle is read back from the phase at its center.
 *
 * API Style: Result Func(const QImage& image, params...)
 *            void Func(const QImage& image, std::vector<T>& out, params...)
 *
 * Example:
 * @code
 * QImage image = QImage::FromFile("coins.png");
 * CircleFinderParams params;
 * params.sensitivity = 0.9;
 * CircleDetectionResult result = FindCircles(image, 20.0, 40.0, params);
 * for (size_t i = 0; i < result.centers.size(); ++i) {
 *     // result.centers[i], result.radii[i], result.metric[i]
 * }
 * @endcode
 */

#include <ChtVision/Core/Constants.h>
#include <ChtVision/Core/QImage.h>
#include <ChtVision/Core/Types.h>

#include <complex>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Cht::Vision::Hough {

// =============================================================================
// Parameters and Results
// =============================================================================

/**
 * @brief Circle detection parameters
 */
struct CHTVISION_API CircleFinderParams {
    /// Detection sensitivity in [0, 1]. Candidates with metric >= 1 - sensitivity
    /// are accepted; higher values find more (and weaker) circles.
    double sensitivity = CHT_DEFAULT_SENSITIVITY;

    /// Fixed gradient threshold in [0, 1] relative to the strongest gradient.
    /// Unset: chosen automatically (Otsu).
    std::optional<double> edgeThreshold;

    /// Bright circles on dark background, or the opposite
    ObjectPolarity polarity = ObjectPolarity::Bright;

    /// Estimate radii from the accumulator phase
    bool computeRadii = true;

    /// Upper bound of (edge pixels x radius samples) handled per voting chunk
    size_t maxChunkElements = CHT_MAX_CHUNK_ELEMENTS;

    /// Voting threads (used only in OpenMP builds)
    int numThreads = 1;
};

/**
 * @brief Circle detection result
 *
 * All vectors are co-indexed and sorted by metric, descending.
 * radii is empty when CircleFinderParams::computeRadii is false.
 */
struct CHTVISION_API CircleDetectionResult {
    std::vector<Point2d> centers;       ///< Sub-pixel centers (x = column, y = row, 0-based)
    std::vector<double> radii;          ///< Estimated radii
    std::vector<double> metric;         ///< Accumulator strength
    std::vector<std::string> warnings;  ///< Non-fatal diagnostics

    size_t Size() const { return centers.size(); }
    bool Empty() const { return centers.empty(); }
};

// =============================================================================
// Circle Detection
// =============================================================================

/**
 * @brief Find circles with radius in [minRadius, maxRadius]
 *
 * @param image Input image (gray or color, any pixel type)
 * @param minRadius Minimum radius (>= 1)
 * @param maxRadius Maximum radius (>= minRadius)
 * @param params Detection parameters
 * @return Detected circles; empty for an empty image or when nothing passes
 *         the acceptance threshold
 *
 * @throws InvalidArgumentException on invalid radius range or parameters
 *
 * A warning is added to the result (and logged) when minRadius <= 5, since
 * small radii are estimated less accurately.
 */
CHTVISION_API CircleDetectionResult FindCircles(const QImage& image,
                                                double minRadius, double maxRadius,
                                                const CircleFinderParams& params = CircleFinderParams());

/**
 * @brief Find circles (Halcon-style output parameters)
 *
 * @param image Input image
 * @param[out] circles Detected circles, sorted by metric descending
 * @param[out] metric Accumulator strength per circle
 * @param minRadius Minimum radius (>= 1)
 * @param maxRadius Maximum radius (>= minRadius)
 * @param sensitivity Detection sensitivity in [0, 1]
 */
CHTVISION_API void FindCircles(const QImage& image,
                               std::vector<Circle2d>& circles,
                               std::vector<double>& metric,
                               double minRadius, double maxRadius,
                               double sensitivity = CHT_DEFAULT_SENSITIVITY);

// =============================================================================
// Accumulator Access
// =============================================================================

/**
 * @brief Complex accumulator of an image, for inspection
 *
 * @return Row-major array of width x height cells; magnitude is vote
 *         strength, phase encodes the radius
 */
CHTVISION_API std::vector<std::complex<double>> GetCircleAccumulator(
    const QImage& image,
    double minRadius, double maxRadius,
    const CircleFinderParams& params = CircleFinderParams());

/**
 * @brief Accumulator magnitude as a Float64 gray image
 */
CHTVISION_API QImage GetCircleAccumulatorMagnitude(
    const QImage& image,
    double minRadius, double maxRadius,
    const CircleFinderParams& params = CircleFinderParams());

} // namespace Cht::Vision::Hough
