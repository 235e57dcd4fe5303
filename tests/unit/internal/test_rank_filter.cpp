/**
 * @file test_rank_filter.cpp
 * @brief Unit tests for Internal/RankFilter.h
 */

#include <ChtVision/Internal/RankFilter.h>
#include <ChtVision/Core/Exception.h>
#include <gtest/gtest.h>

using namespace Cht::Vision;
using namespace Cht::Vision::Internal;

class RankFilterTest : public ::testing::Test {
protected:
    QImage ones7x7_;

    void SetUp() override {
        ones7x7_ = QImage(7, 7, PixelType::Float64);
        for (int y = 0; y < 7; ++y) {
            for (int x = 0; x < 7; ++x) {
                ones7x7_.SetValue(x, y, 1.0);
            }
        }
    }
};

TEST_F(RankFilterTest, MedianRemovesImpulse) {
    QImage img(7, 7, PixelType::Float64);
    img.SetValue(3, 3, 10.0);
    QImage out = MedianFilter(img, 5, 5);
    for (int y = 0; y < 7; ++y) {
        for (int x = 0; x < 7; ++x) {
            EXPECT_EQ(out.GetValue(x, y), 0.0);
        }
    }
}

TEST_F(RankFilterTest, MedianZeroPadding) {
    QImage out = MedianFilter(ones7x7_, 5, 5, BorderMode::Constant);
    EXPECT_EQ(out.GetValue(0, 0), 0.0);   // 9 ones, 16 zeros
    EXPECT_EQ(out.GetValue(0, 3), 1.0);   // 15 ones, 10 zeros
    EXPECT_EQ(out.GetValue(3, 3), 1.0);
}

TEST_F(RankFilterTest, MedianReplicateKeepsConstant) {
    QImage out = MedianFilter(ones7x7_, 5, 5, BorderMode::Replicate);
    EXPECT_EQ(out.GetValue(0, 0), 1.0);
    EXPECT_EQ(out.GetValue(6, 6), 1.0);
}

TEST_F(RankFilterTest, MinAndMaxRanks) {
    QImage img(3, 3, PixelType::Float64);
    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 3; ++x) {
            img.SetValue(x, y, y * 3 + x);
        }
    }
    EXPECT_EQ(RankFilter(img, 3, 3, 0, BorderMode::Replicate).GetValue(1, 1), 0.0);
    EXPECT_EQ(RankFilter(img, 3, 3, 8, BorderMode::Replicate).GetValue(1, 1), 8.0);
    EXPECT_EQ(MedianFilter(img, 3, 3).GetValue(1, 1), 4.0);
}

TEST_F(RankFilterTest, InvalidArguments) {
    EXPECT_THROW(MedianFilter(ones7x7_, 4, 5), InvalidArgumentException);
    EXPECT_THROW(RankFilter(ones7x7_, 3, 3, 9), InvalidArgumentException);
    EXPECT_THROW(MedianFilter(QImage(3, 3, PixelType::UInt8), 3, 3), UnsupportedException);
    EXPECT_TRUE(MedianFilter(QImage(), 3, 3).Empty());
}
