/**
 * @file RankFilter.cpp
 * @brief Rank filter implementation
 */

#include <ChtVision/Internal/RankFilter.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Core/Validate.h>

#include <algorithm>
#include <vector>

namespace Cht::Vision::Internal {

QImage RankFilter(const QImage& image, int32_t width, int32_t height, int32_t rank,
                  BorderMode borderMode) {
    if (width <= 0 || height <= 0 || width % 2 == 0 || height % 2 == 0) {
        throw InvalidArgumentException("RankFilter: window must be odd and > 0, got " +
                                       std::to_string(width) + "x" + std::to_string(height));
    }
    const int32_t windowSize = width * height;
    if (rank < 0 || rank >= windowSize) {
        throw InvalidArgumentException("RankFilter: rank must be in [0, " +
                                       std::to_string(windowSize - 1) + "], got " +
                                       std::to_string(rank));
    }
    CHTVISION_REQUIRE_IMAGE_DOUBLE(image);

    int32_t w = image.Width();
    int32_t h = image.Height();
    int32_t halfW = width / 2;
    int32_t halfH = height / 2;

    QImage output(w, h, PixelType::Float64, ChannelType::Gray);
    std::vector<double> neighborhood(windowSize);

    for (int32_t y = 0; y < h; ++y) {
        double* dstRow = output.Row<double>(y);

        for (int32_t x = 0; x < w; ++x) {
            int32_t count = 0;
            for (int32_t ky = -halfH; ky <= halfH; ++ky) {
                int32_t sy = HandleBorder(y + ky, h, borderMode);
                const double* srcRow = (sy >= 0) ? image.Row<double>(sy) : nullptr;

                for (int32_t kx = -halfW; kx <= halfW; ++kx) {
                    int32_t sx = HandleBorder(x + kx, w, borderMode);
                    neighborhood[count++] = (srcRow && sx >= 0) ? srcRow[sx] : 0.0;
                }
            }

            std::nth_element(neighborhood.begin(), neighborhood.begin() + rank,
                             neighborhood.begin() + count);
            dstRow[x] = neighborhood[rank];
        }
    }
    return output;
}

QImage MedianFilter(const QImage& image, int32_t width, int32_t height,
                    BorderMode borderMode) {
    return RankFilter(image, width, height, (width * height) / 2, borderMode);
}

} // namespace Cht::Vision::Internal
