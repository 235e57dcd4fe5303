/**
 * @file test_circle_accumulator.cpp
 * @brief Unit tests for Internal/CircleAccumulator.h
 */

#include <ChtVision/Internal/CircleAccumulator.h>
#include <ChtVision/Internal/Gradient.h>
#include <ChtVision/Core/Constants.h>
#include <ChtVision/Core/Exception.h>
#include <gtest/gtest.h>

#include <cmath>
#include <complex>
#include <vector>

using namespace Cht::Vision;
using namespace Cht::Vision::Internal;

namespace {

constexpr double TOLERANCE = 1e-12;

QImage CreateDiskImage(int32_t size, double cx, double cy, double r) {
    QImage img(size, size, PixelType::Float64);
    for (int32_t y = 0; y < size; ++y) {
        for (int32_t x = 0; x < size; ++x) {
            double dx = x - cx;
            double dy = y - cy;
            img.SetValue(x, y, (dx * dx + dy * dy <= r * r) ? 0.9 : 0.1);
        }
    }
    return img;
}

} // anonymous namespace

// ============================================================================
// Radius sampling and phase coding
// ============================================================================

TEST(CircleAccumulatorTest, RadiusSamplesAppendMax) {
    std::vector<double> radii = ComputeRadiusSamples(10.0, 11.2);
    ASSERT_EQ(radii.size(), 4u);
    EXPECT_DOUBLE_EQ(radii[0], 10.0);
    EXPECT_DOUBLE_EQ(radii[1], 10.5);
    EXPECT_DOUBLE_EQ(radii[2], 11.0);
    EXPECT_DOUBLE_EQ(radii[3], 11.2);
}

TEST(CircleAccumulatorTest, RadiusSamplesExactEnd) {
    std::vector<double> radii = ComputeRadiusSamples(20.0, 40.0);
    ASSERT_EQ(radii.size(), 41u);
    EXPECT_DOUBLE_EQ(radii.front(), 20.0);
    EXPECT_DOUBLE_EQ(radii.back(), 40.0);
    for (size_t i = 1; i < radii.size(); ++i) {
        EXPECT_NEAR(radii[i] - radii[i - 1], CHT_RADIUS_STEP, TOLERANCE);
    }
}

TEST(CircleAccumulatorTest, RadiusSamplesSingle) {
    std::vector<double> radii = ComputeRadiusSamples(7.0, 7.0);
    ASSERT_EQ(radii.size(), 1u);
    EXPECT_DOUBLE_EQ(radii[0], 7.0);
}

TEST(CircleAccumulatorTest, RadiusSamplesInvalid) {
    EXPECT_THROW(ComputeRadiusSamples(0.5, 10.0), InvalidArgumentException);
    EXPECT_THROW(ComputeRadiusSamples(10.0, 5.0), InvalidArgumentException);
    EXPECT_THROW(ComputeRadiusSamples(5.0, 10.0, 0.0), InvalidArgumentException);
}

TEST(CircleAccumulatorTest, PhaseSpansFullCircle) {
    EXPECT_NEAR(RadiusToPhase(10.0, 10.0, 20.0), -PI, TOLERANCE);
    EXPECT_NEAR(RadiusToPhase(20.0, 10.0, 20.0), PI, TOLERANCE);
    EXPECT_NEAR(RadiusToPhase(std::sqrt(200.0), 10.0, 20.0), 0.0, TOLERANCE);
    EXPECT_DOUBLE_EQ(RadiusToPhase(8.0, 8.0, 8.0), -PI);
}

TEST(CircleAccumulatorTest, PhaseWeightsScaleWithRadius) {
    std::vector<double> radii = {10.0, 15.0, 20.0};
    auto w = ComputePhaseWeights(radii);
    ASSERT_EQ(w.size(), 3u);
    for (size_t i = 0; i < radii.size(); ++i) {
        EXPECT_NEAR(std::abs(w[i]), 1.0 / (TWO_PI * radii[i]), TOLERANCE);
    }
    EXPECT_NEAR(std::arg(w[1]), RadiusToPhase(15.0, 10.0, 20.0), 1e-9);
    EXPECT_TRUE(ComputePhaseWeights({}).empty());
}

TEST(CircleAccumulatorTest, ChunkSize) {
    EXPECT_EQ(ComputeChunkSize(1000000, 41), 24390u);
    EXPECT_EQ(ComputeChunkSize(5, 41), 1u);
    EXPECT_EQ(ComputeChunkSize(100, 1), 100u);
}

// ============================================================================
// Voting
// ============================================================================

TEST(CircleAccumulatorTest, BrightVotesAgainstGradient) {
    std::vector<EdgePixel> edges = {EdgePixel(5, 5, 1.0, 0.0, 1.0)};
    CircleAccumulator acc = BuildCircleAccumulator(10, 10, edges, 3.0, 3.0);

    EXPECT_NEAR(std::abs(acc.At(2, 5)), 1.0 / (TWO_PI * 3.0), TOLERANCE);
    EXPECT_EQ(acc.At(8, 5), std::complex<double>());
}

TEST(CircleAccumulatorTest, DarkVotesAlongGradient) {
    std::vector<EdgePixel> edges = {EdgePixel(5, 5, 1.0, 0.0, 1.0)};
    AccumulatorParams params;
    params.polarity = ObjectPolarity::Dark;
    CircleAccumulator acc = BuildCircleAccumulator(10, 10, edges, 3.0, 3.0, params);

    EXPECT_NEAR(std::abs(acc.At(8, 5)), 1.0 / (TWO_PI * 3.0), TOLERANCE);
    EXPECT_EQ(acc.At(2, 5), std::complex<double>());
}

TEST(CircleAccumulatorTest, VotesOutsideImageDropped) {
    std::vector<EdgePixel> edges = {EdgePixel(2, 5, 1.0, 0.0, 1.0)};
    CircleAccumulator acc = BuildCircleAccumulator(10, 10, edges, 3.0, 3.0);
    EXPECT_TRUE(acc.IsAllZero());
}

TEST(CircleAccumulatorTest, LastRowNeverVoted) {
    // Gradient pointing up: centers lie below the edge
    std::vector<EdgePixel> edges = {EdgePixel(5, 5, 0.0, -1.0, 1.0)};

    CircleAccumulator acc4 = BuildCircleAccumulator(10, 10, edges, 4.0, 4.0);
    EXPECT_TRUE(acc4.IsAllZero());

    CircleAccumulator acc3 = BuildCircleAccumulator(10, 10, edges, 3.0, 3.0);
    EXPECT_GT(std::abs(acc3.At(5, 8)), 0.0);
}

TEST(CircleAccumulatorTest, CentersRoundHalfAwayFromZero) {
    std::vector<EdgePixel> edges = {EdgePixel(5, 5, 1.0, 0.0, 1.0)};
    CircleAccumulator acc = BuildCircleAccumulator(10, 10, edges, 2.5, 2.5);
    EXPECT_GT(std::abs(acc.At(3, 5)), 0.0);
    EXPECT_EQ(acc.At(2, 5), std::complex<double>());
}

TEST(CircleAccumulatorTest, FourEdgesAgreeOnCenter) {
    std::vector<EdgePixel> edges = {
        EdgePixel(30, 20, 1.0, 0.0, 1.0),
        EdgePixel(10, 20, -1.0, 0.0, 1.0),
        EdgePixel(20, 30, 0.0, 1.0, 1.0),
        EdgePixel(20, 10, 0.0, -1.0, 1.0),
    };
    CircleAccumulator acc = BuildCircleAccumulator(40, 40, edges, 5.0, 15.0);
    QImage mag = acc.Magnitude();

    double best = -1.0;
    int32_t bestX = -1;
    int32_t bestY = -1;
    for (int32_t y = 0; y < 40; ++y) {
        for (int32_t x = 0; x < 40; ++x) {
            if (mag.GetValue(x, y) > best) {
                best = mag.GetValue(x, y);
                bestX = x;
                bestY = y;
            }
        }
    }
    EXPECT_EQ(bestX, 20);
    EXPECT_EQ(bestY, 20);
}

TEST(CircleAccumulatorTest, ChunkingDoesNotChangeResult) {
    QImage img = CreateDiskImage(48, 23.0, 22.0, 12.0);
    auto edges = ExtractEdgePixels(ComputeGradientField(img));
    ASSERT_FALSE(edges.empty());

    AccumulatorParams whole;
    AccumulatorParams chunked;
    chunked.maxChunkElements = 5;
    AccumulatorParams threaded;
    threaded.maxChunkElements = 100;
    threaded.numThreads = 4;

    CircleAccumulator a = BuildCircleAccumulator(48, 48, edges, 8.0, 16.0, whole);
    CircleAccumulator b = BuildCircleAccumulator(48, 48, edges, 8.0, 16.0, chunked);
    CircleAccumulator c = BuildCircleAccumulator(48, 48, edges, 8.0, 16.0, threaded);
    ASSERT_EQ(a.data.size(), b.data.size());
    ASSERT_EQ(a.data.size(), c.data.size());
    for (size_t i = 0; i < a.data.size(); ++i) {
        EXPECT_NEAR(std::abs(a.data[i] - b.data[i]), 0.0, 1e-9);
        EXPECT_NEAR(std::abs(a.data[i] - c.data[i]), 0.0, 1e-9);
    }
}

TEST(CircleAccumulatorTest, ManyThreadsTinyChunksBoundedMemory) {
    // One edge pixel per chunk and far more threads than any machine has:
    // the partial accumulators must stay capped by the available threads
    QImage img = CreateDiskImage(256, 128.0, 128.0, 60.0);
    auto edges = ExtractEdgePixels(ComputeGradientField(img));
    ASSERT_GT(edges.size(), 200u);

    AccumulatorParams serial;
    AccumulatorParams oversubscribed;
    oversubscribed.maxChunkElements = 1;
    oversubscribed.numThreads = 1 << 20;

    CircleAccumulator a = BuildCircleAccumulator(256, 256, edges, 58.0, 62.0, serial);
    CircleAccumulator b = BuildCircleAccumulator(256, 256, edges, 58.0, 62.0, oversubscribed);
    ASSERT_EQ(a.data.size(), b.data.size());
    for (size_t i = 0; i < a.data.size(); ++i) {
        EXPECT_NEAR(std::abs(a.data[i] - b.data[i]), 0.0, 1e-9);
    }
}

TEST(CircleAccumulatorTest, InvalidArguments) {
    std::vector<EdgePixel> edges = {EdgePixel(5, 5, 1.0, 0.0, 1.0)};
    EXPECT_THROW(BuildCircleAccumulator(10, 10, edges, 0.0, 3.0), InvalidArgumentException);
    EXPECT_THROW(BuildCircleAccumulator(10, 10, edges, 5.0, 3.0), InvalidArgumentException);

    std::vector<EdgePixel> outside = {EdgePixel(12, 5, 1.0, 0.0, 1.0)};
    EXPECT_THROW(BuildCircleAccumulator(10, 10, outside, 3.0, 3.0), InvalidArgumentException);

    AccumulatorParams params;
    params.maxChunkElements = 0;
    EXPECT_THROW(BuildCircleAccumulator(10, 10, edges, 3.0, 3.0, params), InvalidArgumentException);
}

TEST(CircleAccumulatorTest, NoEdgesGivesZeroAccumulator) {
    CircleAccumulator acc = BuildCircleAccumulator(6, 4, {}, 3.0, 5.0);
    EXPECT_EQ(acc.width, 6);
    EXPECT_EQ(acc.height, 4);
    EXPECT_TRUE(acc.IsAllZero());
}

// ============================================================================
// Edge extraction
// ============================================================================

TEST(CircleAccumulatorTest, StepEdgePixels) {
    QImage img(8, 8, PixelType::Float64);
    for (int32_t y = 0; y < 8; ++y) {
        for (int32_t x = 0; x < 4; ++x) {
            img.SetValue(x, y, 1.0);
        }
    }
    auto edges = ExtractEdgePixels(ComputeGradientField(img));
    ASSERT_EQ(edges.size(), 16u);
    EXPECT_EQ(edges[0].x, 3);
    EXPECT_EQ(edges[0].y, 0);
    EXPECT_EQ(edges[1].x, 4);
    EXPECT_EQ(edges[1].y, 0);
    for (const auto& e : edges) {
        EXPECT_TRUE(e.x == 3 || e.x == 4);
        EXPECT_GT(e.gx, 0.0);
        EXPECT_GT(e.magnitude, 0.0);
    }
}

TEST(CircleAccumulatorTest, FixedEdgeThreshold) {
    QImage img = CreateDiskImage(32, 16.0, 16.0, 8.0);
    GradientField field = ComputeGradientField(img);

    EXPECT_TRUE(ExtractEdgePixels(field, 1.0).empty());
    auto all = ExtractEdgePixels(field, 0.0);
    auto otsu = ExtractEdgePixels(field);
    EXPECT_GE(all.size(), otsu.size());
    EXPECT_FALSE(otsu.empty());

    EXPECT_THROW(ExtractEdgePixels(field, 1.5), InvalidArgumentException);
}

TEST(CircleAccumulatorTest, FlatImageHasNoEdges) {
    QImage img(10, 10, PixelType::Float64);
    EXPECT_TRUE(ExtractEdgePixels(ComputeGradientField(img)).empty());
    EXPECT_TRUE(ExtractEdgePixels(GradientField()).empty());
}
