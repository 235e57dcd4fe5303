/**
 * @file Convolution.cpp
 * @brief Linear filtering implementation
 */

#include <ChtVision/Internal/Convolution.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Core/Validate.h>

#include <algorithm>
#include <cstring>

namespace Cht::Vision::Internal {

namespace {

void RequireOddKernel(size_t size, const char* name, const char* funcName) {
    if (size == 0 || size % 2 == 0) {
        throw InvalidArgumentException(std::string(funcName) + ": " + name +
                                       " must have odd, non-zero length, got " +
                                       std::to_string(size));
    }
}

} // anonymous namespace

// =============================================================================
// Raw Buffer Filtering
// =============================================================================

template<typename SrcT, typename DstT>
void ConvolveRow(const SrcT* src, DstT* dst,
                 int32_t width, int32_t height,
                 const double* kernel, int32_t kernelSize,
                 BorderMode borderMode) {
    int32_t halfK = kernelSize / 2;

    for (int32_t y = 0; y < height; ++y) {
        const SrcT* srcRow = src + static_cast<size_t>(y) * width;
        DstT* dstRow = dst + static_cast<size_t>(y) * width;

        for (int32_t x = 0; x < width; ++x) {
            double sum = 0.0;
            for (int32_t k = -halfK; k <= halfK; ++k) {
                int32_t srcX = HandleBorder(x + k, width, borderMode);
                if (srcX < 0) continue;
                sum += static_cast<double>(srcRow[srcX]) * kernel[k + halfK];
            }
            dstRow[x] = static_cast<DstT>(sum);
        }
    }
}

template<typename SrcT, typename DstT>
void ConvolveCol(const SrcT* src, DstT* dst,
                 int32_t width, int32_t height,
                 const double* kernel, int32_t kernelSize,
                 BorderMode borderMode) {
    int32_t halfK = kernelSize / 2;

    for (int32_t y = 0; y < height; ++y) {
        DstT* dstRow = dst + static_cast<size_t>(y) * width;

        for (int32_t x = 0; x < width; ++x) {
            double sum = 0.0;
            for (int32_t k = -halfK; k <= halfK; ++k) {
                int32_t srcY = HandleBorder(y + k, height, borderMode);
                if (srcY < 0) continue;
                sum += static_cast<double>(src[static_cast<size_t>(srcY) * width + x]) *
                       kernel[k + halfK];
            }
            dstRow[x] = static_cast<DstT>(sum);
        }
    }
}

template<typename SrcT, typename DstT>
void ConvolveSeparable(const SrcT* src, DstT* dst,
                       int32_t width, int32_t height,
                       const double* kernelX, int32_t sizeX,
                       const double* kernelY, int32_t sizeY,
                       BorderMode borderMode) {
    std::vector<double> temp(static_cast<size_t>(width) * height);
    ConvolveRow(src, temp.data(), width, height, kernelX, sizeX, borderMode);
    ConvolveCol(temp.data(), dst, width, height, kernelY, sizeY, borderMode);
}

template<typename SrcT, typename DstT>
void Convolve2D(const SrcT* src, DstT* dst,
                int32_t width, int32_t height,
                const double* kernel, int32_t kernelWidth, int32_t kernelHeight,
                BorderMode borderMode) {
    int32_t halfW = kernelWidth / 2;
    int32_t halfH = kernelHeight / 2;

    for (int32_t y = 0; y < height; ++y) {
        for (int32_t x = 0; x < width; ++x) {
            double sum = 0.0;
            for (int32_t ky = -halfH; ky <= halfH; ++ky) {
                int32_t srcY = HandleBorder(y + ky, height, borderMode);
                if (srcY < 0) continue;
                const SrcT* srcRow = src + static_cast<size_t>(srcY) * width;
                const double* kRow = kernel + static_cast<size_t>(ky + halfH) * kernelWidth;

                for (int32_t kx = -halfW; kx <= halfW; ++kx) {
                    int32_t srcX = HandleBorder(x + kx, width, borderMode);
                    if (srcX < 0) continue;
                    sum += static_cast<double>(srcRow[srcX]) * kRow[kx + halfW];
                }
            }
            dst[static_cast<size_t>(y) * width + x] = static_cast<DstT>(sum);
        }
    }
}

// Explicit instantiations
template void ConvolveRow<double, double>(const double*, double*, int32_t, int32_t, const double*, int32_t, BorderMode);
template void ConvolveRow<float, double>(const float*, double*, int32_t, int32_t, const double*, int32_t, BorderMode);
template void ConvolveCol<double, double>(const double*, double*, int32_t, int32_t, const double*, int32_t, BorderMode);
template void ConvolveCol<float, double>(const float*, double*, int32_t, int32_t, const double*, int32_t, BorderMode);
template void ConvolveSeparable<double, double>(const double*, double*, int32_t, int32_t, const double*, int32_t, const double*, int32_t, BorderMode);
template void ConvolveSeparable<float, double>(const float*, double*, int32_t, int32_t, const double*, int32_t, const double*, int32_t, BorderMode);
template void Convolve2D<double, double>(const double*, double*, int32_t, int32_t, const double*, int32_t, int32_t, BorderMode);
template void Convolve2D<float, double>(const float*, double*, int32_t, int32_t, const double*, int32_t, int32_t, BorderMode);

// =============================================================================
// QImage Interface
// =============================================================================

std::vector<double> ToPackedBuffer(const QImage& image) {
    if (!Validate::RequireImageDoubleGray(image, "ToPackedBuffer")) return {};

    int32_t width = image.Width();
    int32_t height = image.Height();
    std::vector<double> data(static_cast<size_t>(width) * height);
    for (int32_t y = 0; y < height; ++y) {
        std::memcpy(data.data() + static_cast<size_t>(y) * width,
                    image.RowPtr(y), sizeof(double) * width);
    }
    return data;
}

QImage FromPackedBuffer(const std::vector<double>& data, int32_t width, int32_t height) {
    if (data.size() != static_cast<size_t>(width) * static_cast<size_t>(height)) {
        throw InvalidArgumentException("FromPackedBuffer: buffer size does not match " +
                                       std::to_string(width) + "x" + std::to_string(height));
    }
    return QImage::FromData(data.data(), width, height, PixelType::Float64, ChannelType::Gray);
}

QImage ConvolveSeparable(const QImage& image,
                         const std::vector<double>& kernelX,
                         const std::vector<double>& kernelY,
                         BorderMode borderMode) {
    CHTVISION_REQUIRE_IMAGE_DOUBLE(image);
    RequireOddKernel(kernelX.size(), "kernelX", "ConvolveSeparable");
    RequireOddKernel(kernelY.size(), "kernelY", "ConvolveSeparable");

    int32_t width = image.Width();
    int32_t height = image.Height();
    std::vector<double> src = ToPackedBuffer(image);
    std::vector<double> dst(src.size());

    ConvolveSeparable(src.data(), dst.data(), width, height,
                      kernelX.data(), static_cast<int32_t>(kernelX.size()),
                      kernelY.data(), static_cast<int32_t>(kernelY.size()),
                      borderMode);
    return FromPackedBuffer(dst, width, height);
}

QImage Convolve2D(const QImage& image,
                  const std::vector<double>& kernel,
                  int32_t kernelWidth, int32_t kernelHeight,
                  BorderMode borderMode) {
    CHTVISION_REQUIRE_IMAGE_DOUBLE(image);
    RequireOddKernel(static_cast<size_t>(std::max(kernelWidth, 0)), "kernelWidth", "Convolve2D");
    RequireOddKernel(static_cast<size_t>(std::max(kernelHeight, 0)), "kernelHeight", "Convolve2D");
    if (kernel.size() != static_cast<size_t>(kernelWidth) * static_cast<size_t>(kernelHeight)) {
        throw InvalidArgumentException("Convolve2D: kernel size does not match " +
                                       std::to_string(kernelWidth) + "x" +
                                       std::to_string(kernelHeight));
    }

    int32_t width = image.Width();
    int32_t height = image.Height();
    std::vector<double> src = ToPackedBuffer(image);
    std::vector<double> dst(src.size());

    Convolve2D(src.data(), dst.data(), width, height,
               kernel.data(), kernelWidth, kernelHeight, borderMode);
    return FromPackedBuffer(dst, width, height);
}

} // namespace Cht::Vision::Internal
