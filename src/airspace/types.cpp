#include "airspace/types.hpp"

#include <cmath>

#include <fmt/format.h>

namespace airspace {

namespace {
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
}  // namespace

GeoPoint OperationArea::center() const {
    return std::visit(
        overloaded{
            [](const Circle& circle) { return circle.center; },
            [](const Rectangle& rectangle) {
                return GeoPoint{
                    (rectangle.north_deg + rectangle.south_deg) / 2.0,
                    (rectangle.east_deg + rectangle.west_deg) / 2.0
                };
            },
        },
        shape
    );
}

bool OperationArea::is_circle() const noexcept {
    return std::holds_alternative<Circle>(shape);
}

void require_valid_point(const GeoPoint& point, const std::string& context) {
    if (!std::isfinite(point.latitude_deg) || !std::isfinite(point.longitude_deg)) {
        throw InputError(fmt::format("{} has non-finite coordinates", context));
    }
    if (point.latitude_deg < -90.0 || point.latitude_deg > 90.0) {
        throw InputError(fmt::format("{} latitude {} is out of range", context, point.latitude_deg));
    }
    if (point.longitude_deg < -180.0 || point.longitude_deg > 180.0) {
        throw InputError(fmt::format("{} longitude {} is out of range", context, point.longitude_deg));
    }
}

void require_valid_area(const OperationArea& area) {
    if (const auto* circle = std::get_if<Circle>(&area.shape)) {
        require_valid_point(circle->center, "Operation area center");
        if (!(circle->radius_m > 0.0)) {
            throw InputError(fmt::format("Operation area radius must be positive, got {}", circle->radius_m));
        }
        return;
    }
    const auto& rectangle = std::get<Rectangle>(area.shape);
    require_valid_point(GeoPoint{rectangle.north_deg, rectangle.east_deg}, "Operation area north-east corner");
    require_valid_point(GeoPoint{rectangle.south_deg, rectangle.west_deg}, "Operation area south-west corner");
    if (!(rectangle.north_deg > rectangle.south_deg)) {
        throw InputError("Operation area north bound must exceed south bound");
    }
    if (!(rectangle.east_deg > rectangle.west_deg)) {
        throw InputError("Operation area east bound must exceed west bound");
    }
}

}  // namespace airspace
