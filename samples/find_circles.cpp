/**
 * @file find_circles.cpp
 * @brief 示例：圆检测 / Example: Circle detection with the phase-coded Hough transform
 *
 * Usage:
 *   chtvision_find_circles <image> <minRadius> <maxRadius> [sensitivity] [overlay.png]
 *
 * Prints one line per detected circle (x y radius metric) and optionally
 * writes an RGB overlay with the circles drawn in red.
 */

#include <ChtVision/ChtVision.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

using namespace Cht::Vision;
using namespace Cht::Vision::Hough;

namespace {

// Gray or color image -> 8-bit RGB for drawing
QImage ToRgb8(const QImage& image) {
    QImage gray = image.ToGray();
    if (gray.Type() != PixelType::UInt8) {
        // Stretch non-8-bit data to [0, 255]
        double lo = gray.GetValue(0, 0), hi = lo;
        for (int32_t y = 0; y < gray.Height(); ++y) {
            for (int32_t x = 0; x < gray.Width(); ++x) {
                double v = gray.GetValue(x, y);
                lo = std::min(lo, v);
                hi = std::max(hi, v);
            }
        }
        QImage stretched(gray.Width(), gray.Height(), PixelType::UInt8);
        double scale = (hi > lo) ? 255.0 / (hi - lo) : 0.0;
        for (int32_t y = 0; y < gray.Height(); ++y) {
            for (int32_t x = 0; x < gray.Width(); ++x) {
                stretched.SetValue(x, y, (gray.GetValue(x, y) - lo) * scale);
            }
        }
        gray = stretched;
    }

    QImage rgb(gray.Width(), gray.Height(), PixelType::UInt8, ChannelType::RGB);
    for (int32_t y = 0; y < gray.Height(); ++y) {
        const uint8_t* src = gray.Row<uint8_t>(y);
        uint8_t* dst = rgb.Row<uint8_t>(y);
        for (int32_t x = 0; x < gray.Width(); ++x) {
            dst[x * 3 + 0] = src[x];
            dst[x * 3 + 1] = src[x];
            dst[x * 3 + 2] = src[x];
        }
    }
    return rgb;
}

void DrawCircle(QImage& rgb, const Circle2d& circle) {
    // About two samples per pixel of circumference
    int steps = std::max(16, static_cast<int>(2.0 * circle.Circumference()));
    for (int i = 0; i < steps; ++i) {
        Point2d p = circle.PointAt(TWO_PI * i / steps);
        int32_t x = static_cast<int32_t>(std::round(p.x));
        int32_t y = static_cast<int32_t>(std::round(p.y));
        if (x < 0 || x >= rgb.Width() || y < 0 || y >= rgb.Height()) continue;
        uint8_t* px = rgb.Row<uint8_t>(y) + x * 3;
        px[0] = 255;
        px[1] = 0;
        px[2] = 0;
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 4) {
        printf("Usage: %s <image> <minRadius> <maxRadius> [sensitivity] [overlay.png]\n", argv[0]);
        return 1;
    }

    const std::string imagePath = argv[1];
    const double minRadius = std::atof(argv[2]);
    const double maxRadius = std::atof(argv[3]);
    CircleFinderParams params;
    if (argc >= 5) params.sensitivity = std::atof(argv[4]);
    const char* overlayPath = (argc >= 6) ? argv[5] : nullptr;

    printf("=== ChtVision %s: Find Circles ===\n\n", GetVersion());

    try {
        // 1. 加载图像 / Load image
        QImage image = QImage::FromFile(imagePath);
        printf("Image: %s (%dx%d, %d channel(s))\n", imagePath.c_str(),
               image.Width(), image.Height(), image.Channels());

        // 2. 检测 / Detect
        CircleDetectionResult result = FindCircles(image, minRadius, maxRadius, params);
        for (const auto& w : result.warnings) {
            printf("Warning: %s\n", w.c_str());
        }

        // 3. 输出结果 / Print results
        printf("Found %zu circle(s), radius [%.1f, %.1f], sensitivity %.2f\n\n",
               result.Size(), minRadius, maxRadius, params.sensitivity);
        printf("%4s %10s %10s %10s %10s\n", "#", "x", "y", "radius", "metric");
        for (size_t i = 0; i < result.Size(); ++i) {
            printf("%4zu %10.3f %10.3f %10.3f %10.4f\n", i,
                   result.centers[i].x, result.centers[i].y,
                   result.radii[i], result.metric[i]);
        }

        // 4. 保存叠加图 / Save overlay
        if (overlayPath != nullptr) {
            QImage overlay = ToRgb8(image);
            for (size_t i = 0; i < result.Size(); ++i) {
                DrawCircle(overlay, Circle2d(result.centers[i], result.radii[i]));
            }
            if (overlay.SaveToFile(overlayPath)) {
                printf("\nOverlay saved to '%s'\n", overlayPath);
            } else {
                printf("\nFailed to save overlay '%s'\n", overlayPath);
            }
        }
    } catch (const Exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    printf("\n=== Done ===\n");
    return 0;
}
