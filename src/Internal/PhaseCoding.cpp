/**
 * @file PhaseCoding.cpp
 * @brief Radius decoding implementation
 */

#include <ChtVision/Internal/PhaseCoding.h>
#include <ChtVision/Core/Constants.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Core/Validate.h>

#include <algorithm>
#include <cmath>

namespace Cht::Vision::Internal {

double PhaseToRadius(double phase, double rMin, double rMax) {
    if (rMin == rMax) return rMin;
    double lnMin = std::log(rMin);
    double lnMax = std::log(rMax);
    double r = std::exp(lnMin + (phase + PI) / TWO_PI * (lnMax - lnMin));
    // Round-off at phase = +-pi must not leave the range
    return std::clamp(r, rMin, rMax);
}

std::vector<double> EstimateRadii(const std::vector<Point2d>& centers,
                                  const CircleAccumulator& accumulator,
                                  double rMin, double rMax) {
    Validate::RequireRadiusRange(rMin, rMax, "EstimateRadii");

    std::vector<double> radii;
    radii.reserve(centers.size());

    if (rMin == rMax) {
        radii.assign(centers.size(), rMin);
        return radii;
    }

    // Phase ramp ends at the last radius sample, which is always rMax
    const double rLast = ComputeRadiusSamples(rMin, rMax).back();

    for (const auto& c : centers) {
        int32_t col = static_cast<int32_t>(std::round(c.x));
        int32_t row = static_cast<int32_t>(std::round(c.y));
        if (!c.IsValid() || col < 0 || col >= accumulator.width ||
            row < 0 || row >= accumulator.height) {
            throw InvalidArgumentException("EstimateRadii: center (" +
                                           Validate::Detail::FormatValue(c.x) + ", " +
                                           Validate::Detail::FormatValue(c.y) +
                                           ") outside accumulator");
        }
        double phase = std::arg(accumulator.At(col, row));
        radii.push_back(PhaseToRadius(phase, rMin, rLast));
    }
    return radii;
}

} // namespace Cht::Vision::Internal
