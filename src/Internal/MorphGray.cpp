/**
 * @file MorphGray.cpp
 * @brief Gray-level reconstruction and extrema implementation
 */

#include <ChtVision/Internal/MorphGray.h>
#include <ChtVision/Core/Exception.h>
#include <ChtVision/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <deque>
#include <vector>

namespace Cht::Vision::Internal {

namespace {

struct Offset {
    int32_t dx;
    int32_t dy;
};

// Neighbors visited before the current pixel in raster order
const Offset kForward8[] = {{-1, -1}, {0, -1}, {1, -1}, {-1, 0}};
const Offset kForward4[] = {{0, -1}, {-1, 0}};
// Neighbors visited before the current pixel in anti-raster order
const Offset kBackward8[] = {{1, 1}, {0, 1}, {-1, 1}, {1, 0}};
const Offset kBackward4[] = {{0, 1}, {1, 0}};

const Offset kAll8[] = {{-1, -1}, {0, -1}, {1, -1}, {-1, 0},
                        {1, 0}, {-1, 1}, {0, 1}, {1, 1}};
const Offset kAll4[] = {{0, -1}, {-1, 0}, {1, 0}, {0, 1}};

struct Neighborhood {
    const Offset* offsets;
    int count;
};

Neighborhood Forward(Connectivity c) {
    return c == Connectivity::Eight ? Neighborhood{kForward8, 4} : Neighborhood{kForward4, 2};
}

Neighborhood Backward(Connectivity c) {
    return c == Connectivity::Eight ? Neighborhood{kBackward8, 4} : Neighborhood{kBackward4, 2};
}

Neighborhood All(Connectivity c) {
    return c == Connectivity::Eight ? Neighborhood{kAll8, 8} : Neighborhood{kAll4, 4};
}

inline bool Inside(int32_t x, int32_t y, int32_t w, int32_t h) {
    return x >= 0 && x < w && y >= 0 && y < h;
}

std::vector<double> Pack(const QImage& image) {
    int32_t w = image.Width();
    int32_t h = image.Height();
    std::vector<double> data(static_cast<size_t>(w) * h);
    for (int32_t y = 0; y < h; ++y) {
        std::copy_n(image.Row<double>(y), w, data.begin() + static_cast<size_t>(y) * w);
    }
    return data;
}

QImage Unpack(const std::vector<double>& data, int32_t w, int32_t h) {
    QImage image(w, h, PixelType::Float64, ChannelType::Gray);
    for (int32_t y = 0; y < h; ++y) {
        std::copy_n(data.begin() + static_cast<size_t>(y) * w, w, image.Row<double>(y));
    }
    return image;
}

} // anonymous namespace

// =============================================================================
// Geodesic Operations
// =============================================================================

QImage GrayReconstructByDilation(const QImage& marker, const QImage& mask,
                                 Connectivity connectivity) {
    if (!Validate::RequireImageDoubleGray(marker, "GrayReconstructByDilation")) return QImage();
    if (!Validate::RequireImageDoubleGray(mask, "GrayReconstructByDilation")) return QImage();
    Validate::RequireSameSize(marker, mask, "GrayReconstructByDilation");

    const int32_t w = mask.Width();
    const int32_t h = mask.Height();
    const std::vector<double> I = Pack(mask);
    std::vector<double> J = Pack(marker);

    for (size_t i = 0; i < J.size(); ++i) {
        J[i] = std::min(J[i], I[i]);
    }

    const Neighborhood fwd = Forward(connectivity);
    const Neighborhood bwd = Backward(connectivity);
    const Neighborhood all = All(connectivity);

    // Raster scan
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            size_t p = static_cast<size_t>(y) * w + x;
            double v = J[p];
            for (int k = 0; k < fwd.count; ++k) {
                int32_t nx = x + fwd.offsets[k].dx;
                int32_t ny = y + fwd.offsets[k].dy;
                if (!Inside(nx, ny, w, h)) continue;
                v = std::max(v, J[static_cast<size_t>(ny) * w + nx]);
            }
            J[p] = std::min(v, I[p]);
        }
    }

    // Anti-raster scan, seeding the queue with pixels that can still propagate
    std::deque<size_t> fifo;
    for (int32_t y = h - 1; y >= 0; --y) {
        for (int32_t x = w - 1; x >= 0; --x) {
            size_t p = static_cast<size_t>(y) * w + x;
            double v = J[p];
            for (int k = 0; k < bwd.count; ++k) {
                int32_t nx = x + bwd.offsets[k].dx;
                int32_t ny = y + bwd.offsets[k].dy;
                if (!Inside(nx, ny, w, h)) continue;
                v = std::max(v, J[static_cast<size_t>(ny) * w + nx]);
            }
            J[p] = std::min(v, I[p]);

            for (int k = 0; k < bwd.count; ++k) {
                int32_t nx = x + bwd.offsets[k].dx;
                int32_t ny = y + bwd.offsets[k].dy;
                if (!Inside(nx, ny, w, h)) continue;
                size_t q = static_cast<size_t>(ny) * w + nx;
                if (J[q] < J[p] && J[q] < I[q]) {
                    fifo.push_back(p);
                    break;
                }
            }
        }
    }

    // Propagation
    while (!fifo.empty()) {
        size_t p = fifo.front();
        fifo.pop_front();
        int32_t x = static_cast<int32_t>(p % w);
        int32_t y = static_cast<int32_t>(p / w);

        for (int k = 0; k < all.count; ++k) {
            int32_t nx = x + all.offsets[k].dx;
            int32_t ny = y + all.offsets[k].dy;
            if (!Inside(nx, ny, w, h)) continue;
            size_t q = static_cast<size_t>(ny) * w + nx;
            if (J[q] < J[p] && I[q] != J[q]) {
                J[q] = std::min(J[p], I[q]);
                fifo.push_back(q);
            }
        }
    }

    return Unpack(J, w, h);
}

// =============================================================================
// Extrema
// =============================================================================

QImage HMaxima(const QImage& src, double h, Connectivity connectivity) {
    Validate::RequireFinite(h, "h", "HMaxima");
    Validate::RequireMin(h, 0.0, "h", "HMaxima");
    CHTVISION_REQUIRE_IMAGE_DOUBLE(src);

    QImage marker(src.Width(), src.Height(), PixelType::Float64, ChannelType::Gray);
    for (int32_t y = 0; y < src.Height(); ++y) {
        const double* s = src.Row<double>(y);
        double* m = marker.Row<double>(y);
        for (int32_t x = 0; x < src.Width(); ++x) {
            m[x] = s[x] - h;
        }
    }
    return GrayReconstructByDilation(marker, src, connectivity);
}

QImage RegionalMaxima(const QImage& src, Connectivity connectivity) {
    CHTVISION_REQUIRE_IMAGE_DOUBLE(src);

    const int32_t w = src.Width();
    const int32_t h = src.Height();
    const std::vector<double> data = Pack(src);
    const Neighborhood all = All(connectivity);

    QImage result(w, h, PixelType::UInt8, ChannelType::Gray);
    std::vector<uint8_t> visited(data.size(), 0);
    std::vector<size_t> plateau;
    std::vector<size_t> stack;

    for (size_t seed = 0; seed < data.size(); ++seed) {
        if (visited[seed]) continue;

        const double value = data[seed];
        bool hasOutside = false;
        bool isMaximum = true;

        plateau.clear();
        stack.clear();
        stack.push_back(seed);
        visited[seed] = 1;

        // Flood fill the equal-valued plateau containing seed
        while (!stack.empty()) {
            size_t p = stack.back();
            stack.pop_back();
            plateau.push_back(p);
            int32_t x = static_cast<int32_t>(p % w);
            int32_t y = static_cast<int32_t>(p / w);

            for (int k = 0; k < all.count; ++k) {
                int32_t nx = x + all.offsets[k].dx;
                int32_t ny = y + all.offsets[k].dy;
                if (!Inside(nx, ny, w, h)) continue;
                size_t q = static_cast<size_t>(ny) * w + nx;
                double nv = data[q];
                if (nv == value) {
                    if (!visited[q]) {
                        visited[q] = 1;
                        stack.push_back(q);
                    }
                } else {
                    hasOutside = true;
                    if (!(nv < value)) isMaximum = false;
                }
            }
        }

        if (isMaximum && hasOutside && !std::isnan(value)) {
            for (size_t p : plateau) {
                result.Row<uint8_t>(static_cast<int32_t>(p / w))[p % w] = 1;
            }
        }
    }
    return result;
}

} // namespace Cht::Vision::Internal
