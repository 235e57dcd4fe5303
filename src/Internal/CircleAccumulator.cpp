/**
 * @file CircleAccumulator.cpp
 * @brief Phase-coded circle voting implementation
 */

#include <ChtVision/Internal/CircleAccumulator.h>
#include <ChtVision/Internal/Histogram.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Core/Validate.h>

#include <algorithm>
#include <cmath>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace Cht::Vision::Internal {

namespace {

/// Vote one chunk of edge pixels into dst
void VoteChunk(const EdgePixel* edges, size_t count,
               const std::vector<double>& radii,
               const std::vector<std::complex<double>>& weights,
               double sign, int32_t width, int32_t height,
               std::complex<double>* dst) {
    const size_t numRadii = radii.size();
    // Valid centers: 0 <= cx <= width - 1, 0 <= cy <= height - 2
    const double maxX = static_cast<double>(width - 1);
    const double maxY = static_cast<double>(height - 2);

    for (size_t i = 0; i < count; ++i) {
        const EdgePixel& e = edges[i];
        if (!(e.magnitude > 0.0)) continue;
        const double ux = sign * e.gx / e.magnitude;
        const double uy = sign * e.gy / e.magnitude;

        for (size_t k = 0; k < numRadii; ++k) {
            double cx = std::round(e.x - radii[k] * ux);
            double cy = std::round(e.y - radii[k] * uy);
            if (cx < 0.0 || cx > maxX || cy < 0.0 || cy > maxY) continue;
            dst[static_cast<size_t>(cy) * width + static_cast<size_t>(cx)] += weights[k];
        }
    }
}

/// Partial accumulators in use: one per group, at most one per available thread
int EffectiveGroupCount(int numThreads, size_t numChunks) {
#ifdef _OPENMP
    int maxThreads = std::max(1, omp_get_max_threads());
#else
    int maxThreads = 1;
#endif
    size_t groups = std::min<size_t>(static_cast<size_t>(std::min(numThreads, maxThreads)),
                                     numChunks);
    return static_cast<int>(std::max<size_t>(groups, 1));
}

} // anonymous namespace

// =============================================================================
// CircleAccumulator
// =============================================================================

bool CircleAccumulator::IsAllZero() const {
    return std::all_of(data.begin(), data.end(),
                       [](const std::complex<double>& v) { return v == std::complex<double>(); });
}

QImage CircleAccumulator::Magnitude() const {
    if (Empty()) return QImage();
    QImage mag(width, height, PixelType::Float64, ChannelType::Gray);
    for (int32_t y = 0; y < height; ++y) {
        double* row = mag.Row<double>(y);
        for (int32_t x = 0; x < width; ++x) {
            row[x] = std::abs(At(x, y));
        }
    }
    return mag;
}

// =============================================================================
// Edge Extraction
// =============================================================================

double ComputeEdgeThresholdLevel(const QImage& magnitude, double maxMagnitude) {
    if (!(maxMagnitude > 0.0)) return 0.0;
    if (!Validate::RequireImageDoubleGray(magnitude, "ComputeEdgeThresholdLevel")) return 0.0;

    std::vector<double> normalized;
    normalized.reserve(static_cast<size_t>(magnitude.Width()) * magnitude.Height());
    for (int32_t y = 0; y < magnitude.Height(); ++y) {
        const double* row = magnitude.Row<double>(y);
        for (int32_t x = 0; x < magnitude.Width(); ++x) {
            normalized.push_back(row[x] / maxMagnitude);
        }
    }

    Histogram hist = ComputeHistogram(normalized.data(), normalized.size(),
                                      HISTOGRAM_BINS_8BIT, 0.0, 1.0);
    return ComputeOtsuLevel(hist);
}

std::vector<EdgePixel> ExtractEdgePixels(const GradientField& field,
                                         std::optional<double> edgeThreshold) {
    if (edgeThreshold) {
        Validate::RequireUnitInterval(*edgeThreshold, "edgeThreshold", "ExtractEdgePixels");
    }
    if (field.Empty()) return {};

    const int32_t width = field.Width();
    const int32_t height = field.Height();
    Validate::RequireSameSize(field.gx, field.magnitude, "ExtractEdgePixels");
    Validate::RequireSameSize(field.gy, field.magnitude, "ExtractEdgePixels");

    double gMax = 0.0;
    for (int32_t y = 0; y < height; ++y) {
        const double* row = field.magnitude.Row<double>(y);
        for (int32_t x = 0; x < width; ++x) {
            gMax = std::max(gMax, row[x]);
        }
    }
    if (gMax == 0.0) return {};

    double level = edgeThreshold ? *edgeThreshold
                                 : ComputeEdgeThresholdLevel(field.magnitude, gMax);
    double threshold = level * gMax;

    std::vector<EdgePixel> edges;
    for (int32_t y = 0; y < height; ++y) {
        const double* magRow = field.magnitude.Row<double>(y);
        const double* gxRow = field.gx.Row<double>(y);
        const double* gyRow = field.gy.Row<double>(y);
        for (int32_t x = 0; x < width; ++x) {
            if (magRow[x] > threshold) {
                edges.emplace_back(x, y, gxRow[x], gyRow[x], magRow[x]);
            }
        }
    }
    return edges;
}

// =============================================================================
// Radius Sampling and Phase Coding
// =============================================================================

std::vector<double> ComputeRadiusSamples(double rMin, double rMax, double step) {
    Validate::RequireRadiusRange(rMin, rMax, "ComputeRadiusSamples");
    Validate::RequireFinite(step, "step", "ComputeRadiusSamples");
    Validate::RequirePositive(step, "step", "ComputeRadiusSamples");

    std::vector<double> radii;
    const size_t count = static_cast<size_t>(std::floor((rMax - rMin) / step)) + 1;
    radii.reserve(count + 1);
    for (size_t i = 0; i < count; ++i) {
        radii.push_back(rMin + static_cast<double>(i) * step);
    }

    if (radii.back() != rMax) {
        // Absorb round-off in the stepping, otherwise append the end point
        if (rMax - radii.back() <= EPSILON * rMax) {
            radii.back() = rMax;
        } else {
            radii.push_back(rMax);
        }
    }
    return radii;
}

double RadiusToPhase(double radius, double rMin, double rMax) {
    if (rMax == rMin) return -PI;
    double t = (std::log(radius) - std::log(rMin)) / (std::log(rMax) - std::log(rMin));
    return TWO_PI * t - PI;
}

std::vector<std::complex<double>> ComputePhaseWeights(const std::vector<double>& radii) {
    std::vector<std::complex<double>> weights;
    if (radii.empty()) return weights;

    const double rFirst = radii.front();
    const double rLast = radii.back();
    weights.reserve(radii.size());
    for (double r : radii) {
        double phi = RadiusToPhase(r, rFirst, rLast);
        weights.push_back(std::polar(1.0, phi) / (TWO_PI * r));
    }
    return weights;
}

size_t ComputeChunkSize(size_t maxChunkElements, size_t numRadii) {
    if (numRadii == 0) return std::max<size_t>(1, maxChunkElements);
    return std::max<size_t>(1, maxChunkElements / numRadii);
}

// =============================================================================
// Voting
// =============================================================================

CircleAccumulator BuildCircleAccumulator(int32_t width, int32_t height,
                                         const std::vector<EdgePixel>& edges,
                                         double rMin, double rMax,
                                         const AccumulatorParams& params) {
    Validate::RequireRadiusRange(rMin, rMax, "BuildCircleAccumulator");
    if (width < 0 || height < 0) {
        throw InvalidArgumentException("BuildCircleAccumulator: image size must be >= 0, got " +
                                       std::to_string(width) + "x" + std::to_string(height));
    }
    if (params.maxChunkElements == 0) {
        throw InvalidArgumentException("BuildCircleAccumulator: maxChunkElements must be > 0");
    }
    Validate::RequireMin(params.numThreads, 1, "numThreads", "BuildCircleAccumulator");

    CircleAccumulator acc(width, height);
    if (acc.Empty() || edges.empty()) return acc;

    for (const auto& e : edges) {
        if (e.x < 0 || e.x >= width || e.y < 0 || e.y >= height) {
            throw InvalidArgumentException("BuildCircleAccumulator: edge pixel (" +
                                           std::to_string(e.x) + ", " + std::to_string(e.y) +
                                           ") outside image");
        }
    }

    const std::vector<double> radii = ComputeRadiusSamples(rMin, rMax);
    const std::vector<std::complex<double>> weights = ComputePhaseWeights(radii);
    const double sign = (params.polarity == ObjectPolarity::Bright) ? 1.0 : -1.0;

    const size_t chunkSize = ComputeChunkSize(params.maxChunkElements, radii.size());
    const size_t numChunks = (edges.size() + chunkSize - 1) / chunkSize;
    const int numGroups = EffectiveGroupCount(params.numThreads, numChunks);

    if (numGroups <= 1) {
        for (size_t c = 0; c < numChunks; ++c) {
            size_t begin = c * chunkSize;
            size_t count = std::min(chunkSize, edges.size() - begin);
            VoteChunk(edges.data() + begin, count, radii, weights, sign,
                      width, height, acc.data.data());
        }
        return acc;
    }

    // Contiguous chunk groups, one private partial accumulator per group
    std::vector<std::vector<std::complex<double>>> partials(
        numGroups, std::vector<std::complex<double>>(acc.data.size()));

    #pragma omp parallel for schedule(static) num_threads(numGroups)
    for (int g = 0; g < numGroups; ++g) {
        size_t firstChunk = numChunks * static_cast<size_t>(g) / numGroups;
        size_t lastChunk = numChunks * static_cast<size_t>(g + 1) / numGroups;
        for (size_t c = firstChunk; c < lastChunk; ++c) {
            size_t begin = c * chunkSize;
            size_t count = std::min(chunkSize, edges.size() - begin);
            VoteChunk(edges.data() + begin, count, radii, weights, sign,
                      width, height, partials[g].data());
        }
    }

    for (const auto& partial : partials) {
        for (size_t i = 0; i < partial.size(); ++i) {
            acc.data[i] += partial[i];
        }
    }
    return acc;
}

} // namespace Cht::Vision::Internal
