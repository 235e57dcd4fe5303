/**
 * @file test_connected_component.cpp
 * @brief Unit tests for ConnectedComponent module
 */

#include <gtest/gtest.h>
#include <ChtVision/Internal/ConnectedComponent.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Core/QImage.h>

#include <cmath>
#include <utility>
#include <vector>

using namespace Cht::Vision;
using namespace Cht::Vision::Internal;

// =============================================================================
// Test Fixtures and Helpers
// =============================================================================

class ConnectedComponentTest : public ::testing::Test {
protected:
    // Create a binary image with specific foreground pixels given as (row, col)
    QImage CreateBinaryImage(int32_t width, int32_t height,
                             const std::vector<std::pair<int32_t, int32_t>>& foreground) {
        QImage img(width, height, PixelType::UInt8, ChannelType::Gray);
        for (const auto& [r, c] : foreground) {
            if (r >= 0 && r < height && c >= 0 && c < width) {
                img.SetAt(c, r, 1);
            }
        }
        return img;
    }
};

// =============================================================================
// Labeling
// =============================================================================

TEST_F(ConnectedComponentTest, EmptyImage) {
    LabelImage labels = LabelConnectedComponents(QImage());
    EXPECT_TRUE(labels.Empty());
    EXPECT_EQ(labels.numLabels, 0);
}

TEST_F(ConnectedComponentTest, NoForeground) {
    LabelImage labels = LabelConnectedComponents(CreateBinaryImage(5, 5, {}));
    EXPECT_EQ(labels.numLabels, 0);
    EXPECT_TRUE(ComputeWeightedCentroids(labels, QImage(5, 5, PixelType::Float64)).empty());
}

TEST_F(ConnectedComponentTest, LabelsInRasterOrder) {
    // Component starting at row 0 is labeled before the one starting at row 2,
    // even though the latter has a smaller column
    QImage img = CreateBinaryImage(8, 5, {{0, 6}, {1, 6}, {2, 1}, {3, 1}});
    LabelImage labels = LabelConnectedComponents(img);
    ASSERT_EQ(labels.numLabels, 2);
    EXPECT_EQ(labels.At(6, 0), 1);
    EXPECT_EQ(labels.At(6, 1), 1);
    EXPECT_EQ(labels.At(1, 2), 2);
    EXPECT_EQ(labels.At(0, 0), 0);
}

TEST_F(ConnectedComponentTest, DiagonalConnectivity) {
    QImage img = CreateBinaryImage(4, 4, {{0, 0}, {1, 1}, {2, 2}});
    EXPECT_EQ(LabelConnectedComponents(img, Connectivity::Eight).numLabels, 1);
    EXPECT_EQ(LabelConnectedComponents(img, Connectivity::Four).numLabels, 3);
}

TEST_F(ConnectedComponentTest, UShapeMergesLabels) {
    // Two arms joined at the bottom row
    QImage img = CreateBinaryImage(5, 4, {{0, 0}, {1, 0}, {2, 0}, {3, 0},
                                          {0, 4}, {1, 4}, {2, 4}, {3, 4},
                                          {3, 1}, {3, 2}, {3, 3}});
    LabelImage labels = LabelConnectedComponents(img, Connectivity::Four);
    ASSERT_EQ(labels.numLabels, 1);
    EXPECT_EQ(labels.At(0, 0), 1);
    EXPECT_EQ(labels.At(4, 0), 1);
}

TEST_F(ConnectedComponentTest, ManyComponentsBeyond255) {
    // 300 isolated pixels on a 40x40 grid (every other pixel on even rows)
    std::vector<std::pair<int32_t, int32_t>> pixels;
    for (int32_t r = 0; r < 40 && pixels.size() < 300; r += 2) {
        for (int32_t c = 0; c < 40 && pixels.size() < 300; c += 2) {
            pixels.emplace_back(r, c);
        }
    }
    LabelImage labels = LabelConnectedComponents(CreateBinaryImage(40, 40, pixels));
    EXPECT_EQ(labels.numLabels, 300);
    EXPECT_EQ(labels.At(pixels.back().second, pixels.back().first), 300);
}

TEST_F(ConnectedComponentTest, WrongTypeThrows) {
    EXPECT_THROW(LabelConnectedComponents(QImage(3, 3, PixelType::Float64)),
                 UnsupportedException);
}

// =============================================================================
// Statistics
// =============================================================================

TEST_F(ConnectedComponentTest, UniformWeightsGiveGeometricCentroid) {
    QImage img = CreateBinaryImage(10, 10, {{2, 3}, {2, 4}, {3, 3}, {3, 4}, {3, 5}});
    QImage weights(10, 10, PixelType::Float64);
    for (int32_t y = 0; y < 10; ++y) {
        for (int32_t x = 0; x < 10; ++x) {
            weights.SetValue(x, y, 2.0);
        }
    }
    auto centroids = ComputeWeightedCentroids(LabelConnectedComponents(img), weights);
    ASSERT_EQ(centroids.size(), 1u);
    EXPECT_NEAR(centroids[0].x, (3 + 4 + 3 + 4 + 5) / 5.0, 1e-12);
    EXPECT_NEAR(centroids[0].y, (2 + 2 + 3 + 3 + 3) / 5.0, 1e-12);
}

TEST_F(ConnectedComponentTest, WeightedCentroid) {
    QImage img = CreateBinaryImage(5, 3, {{1, 1}, {1, 2}});
    QImage weights(5, 3, PixelType::Float64);
    weights.SetValue(1, 1, 1.0);
    weights.SetValue(2, 1, 3.0);
    weights.SetValue(4, 2, 100.0);   // background, ignored

    LabelImage labels = LabelConnectedComponents(img);
    auto centroids = ComputeWeightedCentroids(labels, weights);
    ASSERT_EQ(centroids.size(), 1u);
    EXPECT_NEAR(centroids[0].x, 1.75, 1e-12);
    EXPECT_NEAR(centroids[0].y, 1.0, 1e-12);
}

TEST_F(ConnectedComponentTest, ZeroWeightGivesNaN) {
    QImage img = CreateBinaryImage(4, 4, {{0, 0}, {3, 3}});
    QImage weights(4, 4, PixelType::Float64);
    weights.SetValue(3, 3, 2.0);

    auto centroids = ComputeWeightedCentroids(LabelConnectedComponents(img), weights);
    ASSERT_EQ(centroids.size(), 2u);
    EXPECT_TRUE(std::isnan(centroids[0].x));
    EXPECT_TRUE(std::isnan(centroids[0].y));
    EXPECT_DOUBLE_EQ(centroids[1].x, 3.0);
}

TEST_F(ConnectedComponentTest, WeightSizeMismatchThrows) {
    LabelImage labels = LabelConnectedComponents(CreateBinaryImage(4, 4, {{1, 1}}));
    EXPECT_THROW(ComputeWeightedCentroids(labels, QImage(5, 4, PixelType::Float64)),
                 InvalidArgumentException);
}
