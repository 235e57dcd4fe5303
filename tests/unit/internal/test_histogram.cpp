/**
 * @file test_histogram.cpp
 * @brief Unit tests for Internal/Histogram.h
 */

#include <ChtVision/Internal/Histogram.h>
#include <ChtVision/Core/Exception.h>
#include <gtest/gtest.h>

#include <limits>
#include <vector>

using namespace Cht::Vision;
using namespace Cht::Vision::Internal;

TEST(HistogramTest, BinIndexRoundsToNearest) {
    Histogram hist;
    EXPECT_EQ(hist.GetBinIndex(0.0), 0);
    EXPECT_EQ(hist.GetBinIndex(1.0), 255);
    EXPECT_EQ(hist.GetBinIndex(0.2), 51);
    EXPECT_EQ(hist.GetBinIndex(0.002), 1);    // 0.51 -> 1
    EXPECT_EQ(hist.GetBinIndex(-0.3), 0);
    EXPECT_EQ(hist.GetBinIndex(1.7), 255);
}

TEST(HistogramTest, ComputeSkipsNaN) {
    std::vector<double> data = {0.0, 0.5, 1.0, std::numeric_limits<double>::quiet_NaN()};
    Histogram hist = ComputeHistogram(data.data(), data.size());
    EXPECT_EQ(hist.totalCount, 3u);
    EXPECT_EQ(hist.At(0), 1u);
    EXPECT_EQ(hist.At(128), 1u);   // round(127.5)
    EXPECT_EQ(hist.At(255), 1u);
}

TEST(HistogramTest, ComputeFromImage) {
    QImage img(4, 3, PixelType::Float64);
    img.SetValue(2, 1, 1.0);
    Histogram hist = ComputeHistogram(img);
    EXPECT_EQ(hist.totalCount, 12u);
    EXPECT_EQ(hist.At(0), 11u);
    EXPECT_EQ(hist.At(255), 1u);
}

TEST(HistogramTest, OtsuTwoClusters) {
    // Split anywhere between the clusters maximizes the variance equally;
    // the level is the mean of all maximizing bins
    std::vector<double> data(100, 0.2);
    data.resize(200, 0.8);
    Histogram hist = ComputeHistogram(data.data(), data.size());
    // 1-based maximizing indices 52..204, mean 128
    EXPECT_NEAR(ComputeOtsuLevel(hist), 127.0 / 255.0, 1e-12);
}

TEST(HistogramTest, OtsuSeparatesUnequalClusters) {
    std::vector<double> data(900, 0.1);
    data.resize(1000, 0.9);
    double level = ComputeOtsuLevel(ComputeHistogram(data.data(), data.size()));
    EXPECT_GT(level, 0.1);
    EXPECT_LT(level, 0.9);
}

TEST(HistogramTest, OtsuDegenerateIsZero) {
    std::vector<double> constant(50, 0.4);
    EXPECT_EQ(ComputeOtsuLevel(ComputeHistogram(constant.data(), constant.size())), 0.0);
    EXPECT_EQ(ComputeOtsuLevel(Histogram()), 0.0);
}

TEST(HistogramTest, InvalidBinCount) {
    std::vector<double> data = {0.5};
    EXPECT_THROW(ComputeHistogram(data.data(), data.size(), 0), InvalidArgumentException);
}
