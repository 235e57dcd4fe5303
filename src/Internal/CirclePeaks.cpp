/**
 * @file CirclePeaks.cpp
 * @brief Circle center detection implementation
 */

#include <ChtVision/Internal/CirclePeaks.h>
#include <ChtVision/Internal/ConnectedComponent.h>
#include <ChtVision/Internal/MorphGray.h>
#include <ChtVision/Internal/RankFilter.h>
#include <ChtVision/Core/Constants.h>
#include <ChtVision/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <limits>

namespace Cht::Vision::Internal {

double DoubleSpacing(double value) {
    double a = std::fabs(value);
    return std::nextafter(a, std::numeric_limits<double>::infinity()) - a;
}

QImage SmoothAccumulatorMagnitude(const QImage& magnitude) {
    CHTVISION_REQUIRE_IMAGE_DOUBLE(magnitude);

    if (std::min(magnitude.Width(), magnitude.Height()) > CHT_MEDIAN_FILTER_SIZE) {
        return MedianFilter(magnitude, CHT_MEDIAN_FILTER_SIZE, CHT_MEDIAN_FILTER_SIZE,
                            BorderMode::Constant);
    }
    return magnitude.Clone();
}

std::vector<CircleCandidate> FindCircleCenters(const CircleAccumulator& accumulator,
                                               double suppressionThreshold) {
    Validate::RequireUnitInterval(suppressionThreshold, "suppressionThreshold",
                                  "FindCircleCenters");
    if (accumulator.Empty()) return {};

    QImage magnitude = accumulator.Magnitude();
    QImage smoothed = SmoothAccumulatorMagnitude(magnitude);

    double h = std::max(suppressionThreshold - DoubleSpacing(suppressionThreshold), 0.0);
    QImage suppressed = HMaxima(smoothed, h, Connectivity::Eight);

    QImage maxima = RegionalMaxima(suppressed, Connectivity::Eight);
    LabelImage labels = LabelConnectedComponents(maxima, Connectivity::Eight);
    if (labels.numLabels == 0) return {};

    std::vector<Point2d> centroids = ComputeWeightedCentroids(labels, magnitude);

    std::vector<CircleCandidate> candidates;
    candidates.reserve(centroids.size());
    for (const auto& c : centroids) {
        if (std::isnan(c.x) || std::isnan(c.y)) continue;
        int32_t col = static_cast<int32_t>(std::round(c.x));
        int32_t row = static_cast<int32_t>(std::round(c.y));
        double metric = suppressed.Row<double>(row)[col];
        candidates.emplace_back(c, metric);
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const CircleCandidate& a, const CircleCandidate& b) {
                         return a.metric > b.metric;
                     });
    return candidates;
}

} // namespace Cht::Vision::Internal
