/**
 * @file test_circle_peaks.cpp
 * @brief Unit tests for Internal/CirclePeaks.h
 */

#include <ChtVision/Internal/CirclePeaks.h>
#include <ChtVision/Core/Exception.h>
#include <gtest/gtest.h>

#include <cfloat>
#include <complex>

using namespace Cht::Vision;
using namespace Cht::Vision::Internal;

class CirclePeaksTest : public ::testing::Test {
protected:
    // 30x30 accumulator with a strong square peak around (8, 8) and a weaker
    // one around (21, 20)
    CircleAccumulator acc_{30, 30};

    void FillSquare(int32_t cx, int32_t cy, int32_t half, double value) {
        for (int32_t y = cy - half; y <= cy + half; ++y) {
            for (int32_t x = cx - half; x <= cx + half; ++x) {
                acc_.At(x, y) = std::polar(value, 0.5);
            }
        }
    }

    void SetUp() override {
        FillSquare(8, 8, 3, 0.8);
        FillSquare(21, 20, 3, 0.5);
    }
};

TEST_F(CirclePeaksTest, DoubleSpacing) {
    EXPECT_DOUBLE_EQ(DoubleSpacing(1.0), DBL_EPSILON);
    EXPECT_DOUBLE_EQ(DoubleSpacing(-1.0), DBL_EPSILON);
    EXPECT_GT(DoubleSpacing(0.0), 0.0);
}

TEST_F(CirclePeaksTest, FindsBothPeaksSorted) {
    auto candidates = FindCircleCenters(acc_, 0.15);
    ASSERT_EQ(candidates.size(), 2u);

    EXPECT_NEAR(candidates[0].center.x, 8.0, 1e-9);
    EXPECT_NEAR(candidates[0].center.y, 8.0, 1e-9);
    EXPECT_NEAR(candidates[0].metric, 0.65, 1e-9);

    EXPECT_NEAR(candidates[1].center.x, 21.0, 1e-9);
    EXPECT_NEAR(candidates[1].center.y, 20.0, 1e-9);
    EXPECT_NEAR(candidates[1].metric, 0.35, 1e-9);
    EXPECT_GT(candidates[0].metric, candidates[1].metric);
}

TEST_F(CirclePeaksTest, HighThresholdSuppressesWeakPeak) {
    auto candidates = FindCircleCenters(acc_, 0.6);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_NEAR(candidates[0].center.x, 8.0, 1e-9);
    EXPECT_NEAR(candidates[0].metric, 0.2, 1e-9);
}

TEST_F(CirclePeaksTest, MedianRemovesIsolatedSpike) {
    CircleAccumulator acc(20, 20);
    acc.At(10, 10) = 5.0;
    EXPECT_TRUE(FindCircleCenters(acc, 0.1).empty());
}

TEST_F(CirclePeaksTest, SmallAccumulatorSkipsMedian) {
    CircleAccumulator acc(5, 5);
    acc.At(2, 1) = 1.0;
    auto candidates = FindCircleCenters(acc, 0.5);
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_DOUBLE_EQ(candidates[0].center.x, 2.0);
    EXPECT_DOUBLE_EQ(candidates[0].center.y, 1.0);

    QImage mag = acc.Magnitude();
    QImage smoothed = SmoothAccumulatorMagnitude(mag);
    EXPECT_DOUBLE_EQ(smoothed.GetValue(2, 1), 1.0);
}

TEST_F(CirclePeaksTest, ZeroAccumulatorHasNoCenters) {
    EXPECT_TRUE(FindCircleCenters(CircleAccumulator(12, 12), 0.15).empty());
    EXPECT_TRUE(FindCircleCenters(CircleAccumulator(), 0.15).empty());
}

TEST_F(CirclePeaksTest, InvalidThreshold) {
    EXPECT_THROW(FindCircleCenters(acc_, -0.1), InvalidArgumentException);
    EXPECT_THROW(FindCircleCenters(acc_, 1.5), InvalidArgumentException);
}
