/**
 * @file Histogram.cpp
 * @brief Histogram and Otsu threshold implementation
 */

#include <ChtVision/Internal/Histogram.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Core/Validate.h>

#include <algorithm>
#include <cmath>

namespace Cht::Vision::Internal {

int32_t Histogram::GetBinIndex(double value) const {
    if (maxValue <= minValue || numBins <= 1) return 0;
    double normalized = (value - minValue) / (maxValue - minValue);
    double pos = std::round(normalized * (numBins - 1));
    if (pos < 0.0) return 0;
    if (pos > numBins - 1) return numBins - 1;
    return static_cast<int32_t>(pos);
}

// ============================================================================
// Histogram Computation
// ============================================================================

Histogram ComputeHistogram(const double* data, size_t count,
                           int32_t numBins, double minVal, double maxVal) {
    if (numBins < 1) {
        throw InvalidArgumentException("ComputeHistogram: numBins must be >= 1, got " +
                                       std::to_string(numBins));
    }

    Histogram hist(numBins, minVal, maxVal);
    for (size_t i = 0; i < count; ++i) {
        double v = data[i];
        if (std::isnan(v)) continue;
        hist.bins[hist.GetBinIndex(v)]++;
        hist.totalCount++;
    }
    return hist;
}

Histogram ComputeHistogram(const QImage& image, int32_t numBins,
                           double minVal, double maxVal) {
    if (!Validate::RequireImageDoubleGray(image, "ComputeHistogram")) {
        return Histogram(numBins, minVal, maxVal);
    }

    Histogram hist(numBins, minVal, maxVal);
    for (int32_t y = 0; y < image.Height(); ++y) {
        Histogram rowHist = ComputeHistogram(image.Row<double>(y),
                                             static_cast<size_t>(image.Width()),
                                             numBins, minVal, maxVal);
        for (int32_t i = 0; i < numBins; ++i) {
            hist.bins[i] += rowHist.bins[i];
        }
        hist.totalCount += rowHist.totalCount;
    }
    return hist;
}

// ============================================================================
// Threshold Selection
// ============================================================================

double ComputeOtsuLevel(const Histogram& hist) {
    if (hist.totalCount == 0 || hist.numBins <= 1) {
        return 0.0;
    }

    const int32_t n = hist.numBins;
    const double total = static_cast<double>(hist.totalCount);

    // Cumulative class probability and first moment (1-based bin index)
    std::vector<double> omega(n);
    std::vector<double> mu(n);
    double cumP = 0.0;
    double cumMu = 0.0;
    for (int32_t i = 0; i < n; ++i) {
        double p = hist.bins[i] / total;
        cumP += p;
        cumMu += p * (i + 1);
        omega[i] = cumP;
        mu[i] = cumMu;
    }
    const double muT = mu[n - 1];

    std::vector<double> sigmaB(n);
    double maxVal = -1.0;
    bool anyValue = false;
    for (int32_t i = 0; i < n; ++i) {
        double diff = muT * omega[i] - mu[i];
        sigmaB[i] = diff * diff / (omega[i] * (1.0 - omega[i]));
        if (std::isnan(sigmaB[i])) continue;
        if (!anyValue || sigmaB[i] > maxVal) {
            maxVal = sigmaB[i];
            anyValue = true;
        }
    }

    if (!anyValue || !std::isfinite(maxVal)) {
        return 0.0;
    }

    double idxSum = 0.0;
    int32_t idxCount = 0;
    for (int32_t i = 0; i < n; ++i) {
        if (sigmaB[i] == maxVal) {
            idxSum += i + 1;
            ++idxCount;
        }
    }
    double idx = idxSum / idxCount;
    return (idx - 1.0) / (n - 1);
}

} // namespace Cht::Vision::Internal
