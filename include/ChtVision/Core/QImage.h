#pragma once

/**
 * @file QImage.h
 * @brief Image class
 */

#include <ChtVision/Core/Types.h>
#include <ChtVision/Core/Constants.h>

#include <memory>
#include <string>

namespace Cht::Vision {

/**
 * @brief Image container
 *
 * Key features:
 * - Multiple pixel types (UInt8, UInt16, Int16, Float32, Float64)
 * - 64-byte row alignment for SIMD
 * - Shallow copy by default, Clone() for deep copy
 */
class QImage {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty image)
    QImage();

    /// Create zero-filled image with specified dimensions and type
    QImage(int32_t width, int32_t height,
           PixelType type = PixelType::UInt8,
           ChannelType channels = ChannelType::Gray);

    /// Copy constructor (shallow copy)
    QImage(const QImage& other);

    /// Move constructor
    QImage(QImage&& other) noexcept;

    ~QImage();

    /// Copy assignment (shallow copy)
    QImage& operator=(const QImage& other);

    /// Move assignment
    QImage& operator=(QImage&& other) noexcept;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /// Load image from file (requires stb_image at build time)
    static QImage FromFile(const std::string& path);

    /// Create from tightly packed raw data (copies data)
    static QImage FromData(const void* data, int32_t width, int32_t height,
                           PixelType type = PixelType::UInt8,
                           ChannelType channels = ChannelType::Gray);

    // =========================================================================
    // Basic Properties
    // =========================================================================

    int32_t Width() const;
    int32_t Height() const;
    int Channels() const;
    PixelType Type() const;
    ChannelType GetChannelType() const;

    /// Row stride in bytes (includes alignment padding)
    size_t Stride() const;

    /// Bytes per pixel (all channels)
    size_t BytesPerPixel() const;

    bool Empty() const;

    /// Check if image is valid (allocated)
    bool IsValid() const;

    // =========================================================================
    // Data Access
    // =========================================================================

    void* Data();
    const void* Data() const;

    void* RowPtr(int32_t row);
    const void* RowPtr(int32_t row) const;

    /// Typed row access, no type check
    template<typename T>
    T* Row(int32_t row) { return static_cast<T*>(RowPtr(row)); }

    template<typename T>
    const T* Row(int32_t row) const { return static_cast<const T*>(RowPtr(row)); }

    /// Get pixel value at (x, y) - for single channel UInt8
    uint8_t At(int32_t x, int32_t y) const;

    /// Set pixel value at (x, y) - for single channel UInt8
    void SetAt(int32_t x, int32_t y, uint8_t value);

    /// Read any single-channel pixel as double
    double GetValue(int32_t x, int32_t y) const;

    /// Write any single-channel pixel from double (saturating for integer types)
    void SetValue(int32_t x, int32_t y, double value);

    // =========================================================================
    // Image Operations
    // =========================================================================

    /// Deep copy
    QImage Clone() const;

    /// Save image to file (UInt8 only, requires stb_image at build time)
    bool SaveToFile(const std::string& path) const;

    /// Convert to different pixel type (value cast, saturating for integers)
    QImage ConvertTo(PixelType targetType) const;

    /// Convert to grayscale (luma 0.2989 R + 0.5870 G + 0.1140 B)
    QImage ToGray() const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace Cht::Vision
