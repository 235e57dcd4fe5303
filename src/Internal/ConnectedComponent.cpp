#include <ChtVision/Internal/ConnectedComponent.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Core/Validate.h>

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace Cht::Vision::Internal {

// =============================================================================
// Union-Find Data Structure
// =============================================================================

namespace {

class UnionFind {
public:
    UnionFind() = default;

    int32_t Add() {
        int32_t id = static_cast<int32_t>(parent_.size());
        parent_.push_back(id);
        rank_.push_back(0);
        return id;
    }

    int32_t Find(int32_t x) {
        while (parent_[x] != x) {
            parent_[x] = parent_[parent_[x]];  // Path halving
            x = parent_[x];
        }
        return x;
    }

    void Union(int32_t x, int32_t y) {
        int32_t px = Find(x);
        int32_t py = Find(y);
        if (px == py) return;

        // Union by rank
        if (rank_[px] < rank_[py]) {
            parent_[px] = py;
        } else if (rank_[px] > rank_[py]) {
            parent_[py] = px;
        } else {
            parent_[py] = px;
            rank_[px]++;
        }
    }

private:
    std::vector<int32_t> parent_;
    std::vector<int32_t> rank_;
};

} // anonymous namespace

// =============================================================================
// Labeling
// =============================================================================

LabelImage LabelConnectedComponents(const QImage& binary, Connectivity connectivity) {
    if (!Validate::RequireImageValid(binary, "LabelConnectedComponents")) return {};
    Validate::RequireImageType(binary, PixelType::UInt8, "LabelConnectedComponents");
    Validate::RequireSingleChannel(binary, "LabelConnectedComponents");

    const int32_t width = binary.Width();
    const int32_t height = binary.Height();

    LabelImage result;
    result.width = width;
    result.height = height;
    result.labels.assign(static_cast<size_t>(width) * height, 0);

    // First pass: provisional labels, label 0 reserved for background
    UnionFind uf;
    uf.Add();
    std::vector<int32_t>& labelMap = result.labels;

    for (int32_t r = 0; r < height; ++r) {
        const uint8_t* srcRow = binary.Row<uint8_t>(r);
        const uint8_t* prevRow = (r > 0) ? binary.Row<uint8_t>(r - 1) : nullptr;

        for (int32_t c = 0; c < width; ++c) {
            if (srcRow[c] == 0) continue;  // Background

            size_t idx = static_cast<size_t>(r) * width + c;
            int32_t neighbors[4];
            int count = 0;

            // West
            if (c > 0 && srcRow[c - 1] != 0) {
                neighbors[count++] = labelMap[idx - 1];
            }
            if (prevRow) {
                size_t up = idx - width;
                // North
                if (prevRow[c] != 0) {
                    neighbors[count++] = labelMap[up];
                }
                if (connectivity == Connectivity::Eight) {
                    // Northwest
                    if (c > 0 && prevRow[c - 1] != 0) {
                        neighbors[count++] = labelMap[up - 1];
                    }
                    // Northeast
                    if (c < width - 1 && prevRow[c + 1] != 0) {
                        neighbors[count++] = labelMap[up + 1];
                    }
                }
            }

            if (count == 0) {
                labelMap[idx] = uf.Add();
            } else {
                int32_t minLabel = *std::min_element(neighbors, neighbors + count);
                labelMap[idx] = minLabel;
                for (int i = 0; i < count; ++i) {
                    if (neighbors[i] != minLabel) {
                        uf.Union(minLabel, neighbors[i]);
                    }
                }
            }
        }
    }

    // Second pass: flatten to consecutive labels in raster order
    std::unordered_map<int32_t, int32_t> labelRemap;
    int32_t finalLabel = 0;

    for (auto& lbl : labelMap) {
        if (lbl == 0) continue;
        int32_t root = uf.Find(lbl);
        auto it = labelRemap.find(root);
        if (it == labelRemap.end()) {
            it = labelRemap.emplace(root, ++finalLabel).first;
        }
        lbl = it->second;
    }

    result.numLabels = finalLabel;
    return result;
}

// =============================================================================
// Statistics
// =============================================================================

std::vector<Point2d> ComputeWeightedCentroids(const LabelImage& labels,
                                              const QImage& weights) {
    if (labels.Empty() || labels.numLabels <= 0) return {};
    if (!Validate::RequireImageDoubleGray(weights, "ComputeWeightedCentroids")) {
        throw InvalidArgumentException("ComputeWeightedCentroids: weights image is empty");
    }
    if (weights.Width() != labels.width || weights.Height() != labels.height) {
        throw InvalidArgumentException("ComputeWeightedCentroids: label/weight size mismatch");
    }

    const int32_t numLabels = labels.numLabels;
    std::vector<double> sumW(numLabels, 0.0);
    std::vector<double> sumX(numLabels, 0.0);
    std::vector<double> sumY(numLabels, 0.0);

    for (int32_t r = 0; r < labels.height; ++r) {
        const double* wRow = weights.Row<double>(r);
        for (int32_t c = 0; c < labels.width; ++c) {
            int32_t lbl = labels.At(c, r);
            if (lbl <= 0 || lbl > numLabels) continue;
            double w = wRow[c];
            sumW[lbl - 1] += w;
            sumX[lbl - 1] += w * c;
            sumY[lbl - 1] += w * r;
        }
    }

    std::vector<Point2d> centroids(numLabels);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    for (int32_t i = 0; i < numLabels; ++i) {
        if (sumW[i] == 0.0) {
            centroids[i] = Point2d(nan, nan);
        } else {
            centroids[i] = Point2d(sumX[i] / sumW[i], sumY[i] / sumW[i]);
        }
    }
    return centroids;
}

} // namespace Cht::Vision::Internal
