#include <ChtVision/Core/QImage.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Platform/Memory.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>
#include <vector>

#ifdef CHTVISION_HAS_STB
// stb_image for file I/O
#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image.h>
#include <stb/stb_image_write.h>
#endif

namespace Cht::Vision {

namespace {

size_t ChannelSize(PixelType type) {
    switch (type) {
        case PixelType::UInt8: return 1;
        case PixelType::UInt16:
        case PixelType::Int16: return 2;
        case PixelType::Float32: return 4;
        case PixelType::Float64: return 8;
    }
    return 1;
}

int ChannelCount(ChannelType type) {
    switch (type) {
        case ChannelType::Gray: return 1;
        case ChannelType::RGB:
        case ChannelType::BGR: return 3;
        case ChannelType::RGBA:
        case ChannelType::BGRA: return 4;
    }
    return 1;
}

// Read channel value at element index from a typed row
double ReadElement(const void* row, PixelType type, size_t idx) {
    switch (type) {
        case PixelType::UInt8: return static_cast<const uint8_t*>(row)[idx];
        case PixelType::UInt16: return static_cast<const uint16_t*>(row)[idx];
        case PixelType::Int16: return static_cast<const int16_t*>(row)[idx];
        case PixelType::Float32: return static_cast<const float*>(row)[idx];
        case PixelType::Float64: return static_cast<const double*>(row)[idx];
    }
    return 0.0;
}

template<typename T>
T Saturate(double value) {
    double lo = static_cast<double>(std::numeric_limits<T>::lowest());
    double hi = static_cast<double>(std::numeric_limits<T>::max());
    return static_cast<T>(std::round(std::clamp(value, lo, hi)));
}

void WriteElement(void* row, PixelType type, size_t idx, double value) {
    switch (type) {
        case PixelType::UInt8: static_cast<uint8_t*>(row)[idx] = Saturate<uint8_t>(value); break;
        case PixelType::UInt16: static_cast<uint16_t*>(row)[idx] = Saturate<uint16_t>(value); break;
        case PixelType::Int16: static_cast<int16_t*>(row)[idx] = Saturate<int16_t>(value); break;
        case PixelType::Float32: static_cast<float*>(row)[idx] = static_cast<float>(value); break;
        case PixelType::Float64: static_cast<double*>(row)[idx] = value; break;
    }
}

} // anonymous namespace

// =============================================================================
// Implementation class
// =============================================================================

class QImage::Impl {
public:
    int32_t width_ = 0;
    int32_t height_ = 0;
    PixelType type_ = PixelType::UInt8;
    ChannelType channelType_ = ChannelType::Gray;
    size_t stride_ = 0;
    std::shared_ptr<uint8_t> data_;

    size_t BytesPerPixel() const {
        return ChannelSize(type_) * static_cast<size_t>(ChannelCount(channelType_));
    }

    void Allocate(int32_t w, int32_t h) {
        width_ = w;
        height_ = h;
        stride_ = Platform::AlignedStride(static_cast<size_t>(w) * BytesPerPixel());
        data_ = Platform::AllocatePixelBuffer(stride_ * static_cast<size_t>(h));
    }
};

// =============================================================================
// Constructors
// =============================================================================

QImage::QImage() : impl_(std::make_shared<Impl>()) {}

QImage::QImage(int32_t width, int32_t height, PixelType type, ChannelType channels)
    : impl_(std::make_shared<Impl>())
{
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException("Image dimensions must be positive");
    }

    impl_->type_ = type;
    impl_->channelType_ = channels;
    impl_->Allocate(width, height);
}

QImage::QImage(const QImage& other) = default;
QImage::QImage(QImage&& other) noexcept = default;
QImage::~QImage() = default;
QImage& QImage::operator=(const QImage& other) = default;
QImage& QImage::operator=(QImage&& other) noexcept = default;

// =============================================================================
// Factory Methods
// =============================================================================

QImage QImage::FromFile(const std::string& path) {
#ifdef CHTVISION_HAS_STB
    int w, h, channels;
    uint8_t* data = stbi_load(path.c_str(), &w, &h, &channels, 0);

    if (!data) {
        throw IOException("Failed to load image: " + path);
    }

    ChannelType channelType = ChannelType::Gray;
    switch (channels) {
        case 1: channelType = ChannelType::Gray; break;
        case 3: channelType = ChannelType::RGB; break;
        case 4: channelType = ChannelType::RGBA; break;
        default:
            stbi_image_free(data);
            throw UnsupportedException("Unsupported channel count: " +
                                       std::to_string(channels));
    }

    QImage img = FromData(data, w, h, PixelType::UInt8, channelType);
    stbi_image_free(data);
    return img;
#else
    throw UnsupportedException("QImage::FromFile: built without stb_image (" + path + ")");
#endif
}

QImage QImage::FromData(const void* data, int32_t width, int32_t height,
                        PixelType type, ChannelType channels) {
    if (data == nullptr) {
        throw InvalidArgumentException("QImage::FromData: data is null");
    }

    QImage img(width, height, type, channels);

    size_t srcStride = static_cast<size_t>(width) * img.impl_->BytesPerPixel();
    const uint8_t* src = static_cast<const uint8_t*>(data);
    for (int32_t y = 0; y < height; ++y) {
        std::memcpy(img.RowPtr(y), src + y * srcStride, srcStride);
    }

    return img;
}

// =============================================================================
// Basic Properties
// =============================================================================

int32_t QImage::Width() const { return impl_->width_; }
int32_t QImage::Height() const { return impl_->height_; }
PixelType QImage::Type() const { return impl_->type_; }
ChannelType QImage::GetChannelType() const { return impl_->channelType_; }
size_t QImage::Stride() const { return impl_->stride_; }
size_t QImage::BytesPerPixel() const { return impl_->BytesPerPixel(); }
bool QImage::Empty() const { return impl_->width_ == 0 || impl_->height_ == 0; }
bool QImage::IsValid() const { return impl_->data_ != nullptr && !Empty(); }
int QImage::Channels() const { return ChannelCount(impl_->channelType_); }

// =============================================================================
// Data Access
// =============================================================================

void* QImage::Data() { return impl_->data_.get(); }
const void* QImage::Data() const { return impl_->data_.get(); }

void* QImage::RowPtr(int32_t row) {
    return impl_->data_.get() + row * impl_->stride_;
}

const void* QImage::RowPtr(int32_t row) const {
    return impl_->data_.get() + row * impl_->stride_;
}

uint8_t QImage::At(int32_t x, int32_t y) const {
    if (impl_->type_ != PixelType::UInt8 ||
        impl_->channelType_ != ChannelType::Gray) {
        throw UnsupportedException("At() only supports UInt8 grayscale");
    }
    return static_cast<const uint8_t*>(RowPtr(y))[x];
}

void QImage::SetAt(int32_t x, int32_t y, uint8_t value) {
    if (impl_->type_ != PixelType::UInt8 ||
        impl_->channelType_ != ChannelType::Gray) {
        throw UnsupportedException("SetAt() only supports UInt8 grayscale");
    }
    static_cast<uint8_t*>(RowPtr(y))[x] = value;
}

double QImage::GetValue(int32_t x, int32_t y) const {
    if (impl_->channelType_ != ChannelType::Gray) {
        throw UnsupportedException("GetValue() only supports single channel images");
    }
    return ReadElement(RowPtr(y), impl_->type_, static_cast<size_t>(x));
}

void QImage::SetValue(int32_t x, int32_t y, double value) {
    if (impl_->channelType_ != ChannelType::Gray) {
        throw UnsupportedException("SetValue() only supports single channel images");
    }
    WriteElement(RowPtr(y), impl_->type_, static_cast<size_t>(x), value);
}

// =============================================================================
// Image Operations
// =============================================================================

QImage QImage::Clone() const {
    if (Empty()) return QImage();

    QImage copy(impl_->width_, impl_->height_,
                impl_->type_, impl_->channelType_);

    for (int32_t y = 0; y < impl_->height_; ++y) {
        std::memcpy(copy.RowPtr(y), RowPtr(y),
                    impl_->width_ * impl_->BytesPerPixel());
    }
    return copy;
}

bool QImage::SaveToFile(const std::string& path) const {
    if (Empty()) return false;

    // Only support UInt8 for now
    if (impl_->type_ != PixelType::UInt8) {
        return false;
    }

#ifdef CHTVISION_HAS_STB
    int channels = Channels();

    // Create contiguous buffer
    std::vector<uint8_t> buffer(static_cast<size_t>(impl_->width_) * impl_->height_ * channels);
    size_t srcStride = static_cast<size_t>(impl_->width_) * channels;

    for (int32_t y = 0; y < impl_->height_; ++y) {
        std::memcpy(buffer.data() + y * srcStride, RowPtr(y), srcStride);
    }

    // Determine format from extension
    if (path.size() >= 4) {
        std::string ext = path.substr(path.size() - 4);
        std::transform(ext.begin(), ext.end(), ext.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (ext == ".jpg" || ext == "jpeg") {
            return stbi_write_jpg(path.c_str(), impl_->width_, impl_->height_,
                                  channels, buffer.data(), 95) != 0;
        } else if (ext == ".bmp") {
            return stbi_write_bmp(path.c_str(), impl_->width_, impl_->height_,
                                  channels, buffer.data()) != 0;
        }
    }

    // Default to PNG
    return stbi_write_png(path.c_str(), impl_->width_, impl_->height_,
                          channels, buffer.data(), static_cast<int>(srcStride)) != 0;
#else
    throw UnsupportedException("QImage::SaveToFile: built without stb_image (" + path + ")");
#endif
}

QImage QImage::ConvertTo(PixelType targetType) const {
    if (Empty()) return QImage();
    if (targetType == impl_->type_) return Clone();

    QImage dst(impl_->width_, impl_->height_, targetType, impl_->channelType_);
    size_t elements = static_cast<size_t>(impl_->width_) * Channels();

    for (int32_t y = 0; y < impl_->height_; ++y) {
        const void* srcRow = RowPtr(y);
        void* dstRow = dst.RowPtr(y);
        for (size_t i = 0; i < elements; ++i) {
            WriteElement(dstRow, targetType, i, ReadElement(srcRow, impl_->type_, i));
        }
    }
    return dst;
}

QImage QImage::ToGray() const {
    if (Empty()) return QImage();
    if (impl_->channelType_ == ChannelType::Gray) return Clone();

    // Channel order of the color planes
    int rIdx = 0, bIdx = 2;
    if (impl_->channelType_ == ChannelType::BGR ||
        impl_->channelType_ == ChannelType::BGRA) {
        rIdx = 2;
        bIdx = 0;
    }

    int channels = Channels();
    QImage gray(impl_->width_, impl_->height_, impl_->type_, ChannelType::Gray);

    for (int32_t y = 0; y < impl_->height_; ++y) {
        const void* srcRow = RowPtr(y);
        void* dstRow = gray.RowPtr(y);
        for (int32_t x = 0; x < impl_->width_; ++x) {
            size_t base = static_cast<size_t>(x) * channels;
            double r = ReadElement(srcRow, impl_->type_, base + rIdx);
            double g = ReadElement(srcRow, impl_->type_, base + 1);
            double b = ReadElement(srcRow, impl_->type_, base + bIdx);
            WriteElement(dstRow, impl_->type_, static_cast<size_t>(x),
                         0.298936021293775 * r + 0.587043074451121 * g +
                         0.114020904255103 * b);
        }
    }
    return gray;
}

} // namespace Cht::Vision
