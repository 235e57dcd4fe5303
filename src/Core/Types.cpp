#include <ChtVision/Core/Types.h>
#include <ChtVision/Core/Constants.h>

namespace Cht::Vision {

double Circle2d::Circumference() const {
    return TWO_PI * radius;
}

Point2d Circle2d::PointAt(double angle) const {
    return {center.x + radius * std::cos(angle), center.y + radius * std::sin(angle)};
}

} // namespace Cht::Vision
