/**
 * @file Gradient.cpp
 * @brief Sobel gradient field implementation
 */

#include <ChtVision/Internal/Gradient.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Core/Validate.h>

#include <cmath>

namespace Cht::Vision::Internal {

namespace {

double ScaleFor(PixelType type, double& offset) {
    offset = 0.0;
    switch (type) {
        case PixelType::UInt8:
            return 1.0 / 255.0;
        case PixelType::UInt16:
            return 1.0 / 65535.0;
        case PixelType::Int16:
            offset = 32768.0;
            return 1.0 / 65535.0;
        case PixelType::Float32:
        case PixelType::Float64:
            return 1.0;
    }
    return 1.0;
}

} // anonymous namespace

// =============================================================================
// Normalization
// =============================================================================

QImage NormalizeToDouble(const QImage& image) {
    CHTVISION_REQUIRE_IMAGE(image);

    QImage gray = (image.Channels() == 1) ? image : image.ToGray();
    int32_t width = gray.Width();
    int32_t height = gray.Height();

    double offset = 0.0;
    double scale = ScaleFor(gray.Type(), offset);

    QImage result(width, height, PixelType::Float64, ChannelType::Gray);
    for (int32_t y = 0; y < height; ++y) {
        double* dst = result.Row<double>(y);
        for (int32_t x = 0; x < width; ++x) {
            dst[x] = (gray.GetValue(x, y) + offset) * scale;
        }
    }
    return result;
}

// =============================================================================
// Sobel Kernels
// =============================================================================

std::vector<double> SobelDerivativeKernel() {
    return {1.0, 0.0, -1.0};
}

std::vector<double> SobelSmoothingKernel() {
    return {1.0, 2.0, 1.0};
}

// =============================================================================
// Gradient Computation
// =============================================================================

GradientField ComputeGradientField(const QImage& image, BorderMode borderMode) {
    CHTVISION_REQUIRE_IMAGE_DOUBLE(image);

    const std::vector<double> deriv = SobelDerivativeKernel();
    const std::vector<double> smooth = SobelSmoothingKernel();

    GradientField field;
    // Gx: derivative along rows, smoothing along columns
    field.gx = ConvolveSeparable(image, deriv, smooth, borderMode);
    // Gy: smoothing along rows, derivative along columns
    field.gy = ConvolveSeparable(image, smooth, deriv, borderMode);

    int32_t width = image.Width();
    int32_t height = image.Height();
    field.magnitude = QImage(width, height, PixelType::Float64, ChannelType::Gray);

    for (int32_t y = 0; y < height; ++y) {
        const double* gxRow = field.gx.Row<double>(y);
        const double* gyRow = field.gy.Row<double>(y);
        double* magRow = field.magnitude.Row<double>(y);
        for (int32_t x = 0; x < width; ++x) {
            magRow[x] = std::sqrt(gxRow[x] * gxRow[x] + gyRow[x] * gyRow[x]);
        }
    }
    return field;
}

} // namespace Cht::Vision::Internal
