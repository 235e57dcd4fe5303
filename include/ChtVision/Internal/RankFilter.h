#pragma once

/**
 * @file RankFilter.h
 * @brief Rectangular rank (order-statistic) filters on Float64 images
 *
 * Used by:
 * - CirclePeaks (5x5 median denoising of the accumulator magnitude)
 */

#include <ChtVision/Core/QImage.h>
#include <ChtVision/Internal/Convolution.h>

#include <cstdint>

namespace Cht::Vision::Internal {

/**
 * @brief Rank filter over a width x height window
 *
 * Each output pixel is the rank-th smallest value (0-based) of its window.
 * Samples outside the image follow borderMode; BorderMode::Constant
 * contributes zeros.
 *
 * @param image Float64 gray image
 * @param width Window width (odd, > 0)
 * @param height Window height (odd, > 0)
 * @param rank Order statistic in [0, width * height)
 * @param borderMode Border handling (default: zero padding)
 *
 * @throws InvalidArgumentException on invalid window or rank
 * @throws UnsupportedException if image is not Float64 gray
 */
QImage RankFilter(const QImage& image, int32_t width, int32_t height, int32_t rank,
                  BorderMode borderMode = BorderMode::Constant);

/**
 * @brief Median filter over a width x height window (odd sizes)
 */
QImage MedianFilter(const QImage& image, int32_t width, int32_t height,
                    BorderMode borderMode = BorderMode::Constant);

} // namespace Cht::Vision::Internal
