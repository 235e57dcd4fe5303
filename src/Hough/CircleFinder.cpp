/**
 * @file CircleFinder.cpp
 * @brief Circle detection public API implementation
 *
 * Wraps the Internal voting, peak and phase-decoding stages
 */

#include <ChtVision/Hough/CircleFinder.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Core/Validate.h>
#include <ChtVision/Internal/CircleAccumulator.h>
#include <ChtVision/Internal/CirclePeaks.h>
#include <ChtVision/Internal/Gradient.h>
#include <ChtVision/Internal/PhaseCoding.h>
#include <ChtVision/Platform/Logger.h>

#include <cmath>
#include <utility>

namespace Cht::Vision::Hough {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

Internal::AccumulatorParams BuildInternalAccumulatorParams(const CircleFinderParams& params,
                                                           const char* funcName) {
    Validate::RequireUnitInterval(params.sensitivity, "sensitivity", funcName);
    if (params.edgeThreshold) {
        Validate::RequireUnitInterval(*params.edgeThreshold, "edgeThreshold", funcName);
    }
    if (params.maxChunkElements == 0) {
        throw InvalidArgumentException(std::string(funcName) + ": maxChunkElements must be > 0");
    }
    Validate::RequireMin(params.numThreads, 1, "numThreads", funcName);

#ifndef _OPENMP
    if (params.numThreads > 1) {
        Platform::GetLogger()->debug("{}: built without OpenMP, voting on one thread", funcName);
    }
#endif

    Internal::AccumulatorParams accParams;
    accParams.polarity = params.polarity;
    accParams.maxChunkElements = params.maxChunkElements;
    accParams.numThreads = params.numThreads;
    return accParams;
}

/// Normalize, extract edges and vote. Returns an empty accumulator for an empty image.
Internal::CircleAccumulator ComputeAccumulator(const QImage& image,
                                               double minRadius, double maxRadius,
                                               const CircleFinderParams& params,
                                               const Internal::AccumulatorParams& accParams) {
    auto logger = Platform::GetLogger();

    QImage gray = Internal::NormalizeToDouble(image);
    Internal::GradientField field = Internal::ComputeGradientField(gray);
    std::vector<Internal::EdgePixel> edges = Internal::ExtractEdgePixels(field, params.edgeThreshold);
    logger->debug("CHT: {}x{} image, {} edge pixels", image.Width(), image.Height(), edges.size());

    if (edges.empty()) {
        return Internal::CircleAccumulator(image.Width(), image.Height());
    }

    size_t numRadii = Internal::ComputeRadiusSamples(minRadius, maxRadius).size();
    size_t chunkSize = Internal::ComputeChunkSize(accParams.maxChunkElements, numRadii);
    logger->debug("CHT: {} radius samples in [{}, {}], {} chunk(s) of <= {} edge pixels",
                  numRadii, minRadius, maxRadius,
                  (edges.size() + chunkSize - 1) / chunkSize, chunkSize);

    return Internal::BuildCircleAccumulator(image.Width(), image.Height(), edges,
                                            minRadius, maxRadius, accParams);
}

} // anonymous namespace

// =============================================================================
// Circle Detection
// =============================================================================

CircleDetectionResult FindCircles(const QImage& image,
                                  double minRadius, double maxRadius,
                                  const CircleFinderParams& params) {
    Validate::RequireRadiusRange(minRadius, maxRadius, "FindCircles");
    Internal::AccumulatorParams accParams = BuildInternalAccumulatorParams(params, "FindCircles");

    CircleDetectionResult result;
    auto logger = Platform::GetLogger();

    if (minRadius <= CHT_SMALL_RADIUS_WARNING) {
        std::string msg = "FindCircles: minRadius " + Validate::Detail::FormatValue(minRadius) +
                          " <= " + Validate::Detail::FormatValue(CHT_SMALL_RADIUS_WARNING) +
                          ", radius estimates for small circles are less accurate";
        logger->warn("{}", msg);
        result.warnings.push_back(msg);
    }

    if (!Validate::RequireImageValid(image, "FindCircles")) return result;

    Internal::CircleAccumulator acc = ComputeAccumulator(image, minRadius, maxRadius,
                                                         params, accParams);
    if (acc.Empty() || acc.IsAllZero()) {
        logger->debug("FindCircles: accumulator has no votes");
        return result;
    }

    const double acceptanceThreshold = 1.0 - params.sensitivity;
    std::vector<Internal::CircleCandidate> candidates =
        Internal::FindCircleCenters(acc, acceptanceThreshold);

    for (const auto& c : candidates) {
        if (c.metric >= acceptanceThreshold) {
            result.centers.push_back(c.center);
            result.metric.push_back(c.metric);
        }
    }
    logger->debug("FindCircles: {} candidate(s), {} accepted at threshold {}",
                  candidates.size(), result.centers.size(), acceptanceThreshold);

    if (params.computeRadii && !result.centers.empty()) {
        result.radii = Internal::EstimateRadii(result.centers, acc, minRadius, maxRadius);
    }
    return result;
}

void FindCircles(const QImage& image,
                 std::vector<Circle2d>& circles,
                 std::vector<double>& metric,
                 double minRadius, double maxRadius,
                 double sensitivity) {
    CircleFinderParams params;
    params.sensitivity = sensitivity;

    CircleDetectionResult result = FindCircles(image, minRadius, maxRadius, params);

    circles.clear();
    circles.reserve(result.Size());
    for (size_t i = 0; i < result.Size(); ++i) {
        circles.emplace_back(result.centers[i], result.radii[i]);
    }
    metric = std::move(result.metric);
}

// =============================================================================
// Accumulator Access
// =============================================================================

std::vector<std::complex<double>> GetCircleAccumulator(const QImage& image,
                                                       double minRadius, double maxRadius,
                                                       const CircleFinderParams& params) {
    Validate::RequireRadiusRange(minRadius, maxRadius, "GetCircleAccumulator");
    Internal::AccumulatorParams accParams =
        BuildInternalAccumulatorParams(params, "GetCircleAccumulator");
    if (!Validate::RequireImageValid(image, "GetCircleAccumulator")) return {};

    return ComputeAccumulator(image, minRadius, maxRadius, params, accParams).data;
}

QImage GetCircleAccumulatorMagnitude(const QImage& image,
                                     double minRadius, double maxRadius,
                                     const CircleFinderParams& params) {
    Validate::RequireRadiusRange(minRadius, maxRadius, "GetCircleAccumulatorMagnitude");
    Internal::AccumulatorParams accParams =
        BuildInternalAccumulatorParams(params, "GetCircleAccumulatorMagnitude");
    if (!Validate::RequireImageValid(image, "GetCircleAccumulatorMagnitude")) return QImage();

    return ComputeAccumulator(image, minRadius, maxRadius, params, accParams).Magnitude();
}

} // namespace Cht::Vision::Hough
