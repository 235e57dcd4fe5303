#pragma once

/**
 * @file Convolution.h
 * @brief Linear filtering with border handling
 *
 * Provides:
 * - Border index mapping (constant, replicate, reflect, reflect101, wrap)
 * - 1D row/column filtering
 * - Separable and general 2D filtering
 *
 * All filters are correlations: dst(x) = sum_k kernel[k] * src(x + k - half).
 * A true convolution is obtained by passing the reversed kernel.
 *
 * Used by:
 * - Gradient (Sobel field for circle voting)
 */

#include <ChtVision/Core/QImage.h>
#include <ChtVision/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Cht::Vision::Internal {

// =============================================================================
// Border Handling
// =============================================================================

/**
 * @brief Out-of-image sample policy
 */
enum class BorderMode {
    Constant,       ///< 000|abcd|000
    Replicate,      ///< aaa|abcd|ddd
    Reflect,        ///< cba|abcd|dcb  (symmetric)
    Reflect101,     ///< dcb|abcd|cba
    Wrap            ///< bcd|abcd|abc
};

/**
 * @brief Map an out-of-range index into [0, size)
 *
 * @param idx Index, may be outside [0, size)
 * @param size Dimension length (> 0)
 * @param mode Border mode
 * @return Mapped index, or -1 for BorderMode::Constant (caller uses zero)
 */
inline int32_t HandleBorder(int32_t idx, int32_t size, BorderMode mode) {
    if (idx >= 0 && idx < size) return idx;

    switch (mode) {
        case BorderMode::Constant:
            return -1;
        case BorderMode::Replicate:
            return idx < 0 ? 0 : size - 1;
        case BorderMode::Reflect: {
            if (size == 1) return 0;
            int32_t period = 2 * size;
            int32_t m = idx % period;
            if (m < 0) m += period;
            return m < size ? m : period - 1 - m;
        }
        case BorderMode::Reflect101: {
            if (size == 1) return 0;
            int32_t period = 2 * size - 2;
            int32_t m = idx % period;
            if (m < 0) m += period;
            return m < size ? m : period - m;
        }
        case BorderMode::Wrap: {
            int32_t m = idx % size;
            return m < 0 ? m + size : m;
        }
    }
    return -1;
}

// =============================================================================
// Raw Buffer Filtering (row-major, tightly packed)
// =============================================================================

/**
 * @brief Filter each row with a 1D kernel (odd size, centered)
 */
template<typename SrcT, typename DstT>
void ConvolveRow(const SrcT* src, DstT* dst,
                 int32_t width, int32_t height,
                 const double* kernel, int32_t kernelSize,
                 BorderMode borderMode);

/**
 * @brief Filter each column with a 1D kernel (odd size, centered)
 */
template<typename SrcT, typename DstT>
void ConvolveCol(const SrcT* src, DstT* dst,
                 int32_t width, int32_t height,
                 const double* kernel, int32_t kernelSize,
                 BorderMode borderMode);

/**
 * @brief Separable filter: rows with kernelX, then columns with kernelY
 */
template<typename SrcT, typename DstT>
void ConvolveSeparable(const SrcT* src, DstT* dst,
                       int32_t width, int32_t height,
                       const double* kernelX, int32_t sizeX,
                       const double* kernelY, int32_t sizeY,
                       BorderMode borderMode);

/**
 * @brief General 2D filter with a row-major kernel of kernelWidth x kernelHeight
 */
template<typename SrcT, typename DstT>
void Convolve2D(const SrcT* src, DstT* dst,
                int32_t width, int32_t height,
                const double* kernel, int32_t kernelWidth, int32_t kernelHeight,
                BorderMode borderMode);

// =============================================================================
// QImage Interface (Float64 gray)
// =============================================================================

/**
 * @brief Separable filter on a Float64 gray image
 *
 * @throws UnsupportedException if image is not Float64 gray
 * @throws InvalidArgumentException if a kernel is empty or of even length
 */
QImage ConvolveSeparable(const QImage& image,
                         const std::vector<double>& kernelX,
                         const std::vector<double>& kernelY,
                         BorderMode borderMode = BorderMode::Replicate);

/**
 * @brief General 2D filter on a Float64 gray image
 *
 * @param kernel Row-major kernel values (kernelWidth * kernelHeight)
 */
QImage Convolve2D(const QImage& image,
                  const std::vector<double>& kernel,
                  int32_t kernelWidth, int32_t kernelHeight,
                  BorderMode borderMode = BorderMode::Replicate);

/**
 * @brief Copy a Float64 gray image into a tightly packed buffer
 */
std::vector<double> ToPackedBuffer(const QImage& image);

/**
 * @brief Create a Float64 gray image from a tightly packed buffer
 */
QImage FromPackedBuffer(const std::vector<double>& data, int32_t width, int32_t height);

} // namespace Cht::Vision::Internal
