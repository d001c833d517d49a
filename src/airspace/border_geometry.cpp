#include "airspace/border_geometry.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace airspace {

namespace {
constexpr std::size_t k_min_ring_vertices{3};

GeoBounds bounds_of(const Polygon& ring) {
    const auto [min_lat, max_lat] = std::minmax_element(ring.begin(), ring.end(), [](const GeoPoint& lhs, const GeoPoint& rhs) {
        return lhs.latitude_deg < rhs.latitude_deg;
    });
    const auto [min_lng, max_lng] = std::minmax_element(ring.begin(), ring.end(), [](const GeoPoint& lhs, const GeoPoint& rhs) {
        return lhs.longitude_deg < rhs.longitude_deg;
    });
    return GeoBounds{max_lat->latitude_deg, min_lat->latitude_deg, max_lng->longitude_deg, min_lng->longitude_deg};
}
}  // namespace

BorderGeometry::BorderGeometry(Polygon ring)
    : mode_(BorderMode::Polygon),
      ring_(std::move(ring)) {
    if (ring_.size() < k_min_ring_vertices) {
        throw InputError(fmt::format("Border polygon requires at least {} vertices, got {}", k_min_ring_vertices, ring_.size()));
    }
    for (std::size_t index = 0; index < ring_.size(); ++index) {
        require_valid_point(ring_[index], fmt::format("Border vertex {}", index));
    }
    bounds_ = bounds_of(ring_);
}

BorderGeometry::BorderGeometry(BorderMode mode, Polygon ring, GeoBounds bounds)
    : mode_(mode),
      ring_(std::move(ring)),
      bounds_(bounds) {}

BorderGeometry BorderGeometry::bounding_box_fallback(const GeoBounds& bounds) {
    if (!(bounds.north_deg > bounds.south_deg) || !(bounds.east_deg > bounds.west_deg)) {
        throw InputError("Border fallback box must have north > south and east > west");
    }
    get_logger()->warn(
        R"({{"component":"border","mode":"bounding_box_fallback","north":{},"south":{},"east":{},"west":{}}})",
        bounds.north_deg,
        bounds.south_deg,
        bounds.east_deg,
        bounds.west_deg
    );
    return BorderGeometry{BorderMode::BoundingBoxFallback, Polygon{}, bounds};
}

bool BorderGeometry::is_inside(const GeoPoint& point) const noexcept {
    if (mode_ == BorderMode::BoundingBoxFallback) {
        return bounds_.contains(point);
    }
    return ray_cast(point);
}

BorderMode BorderGeometry::mode() const noexcept {
    return mode_;
}

const GeoBounds& BorderGeometry::bounds() const noexcept {
    return bounds_;
}

const Polygon& BorderGeometry::ring() const noexcept {
    return ring_;
}

bool BorderGeometry::ray_cast(const GeoPoint& point) const noexcept {
    bool inside = false;
    const std::size_t count = ring_.size();
    for (std::size_t i = 0, j = count - 1; i < count; j = i++) {
        const double xi = ring_[i].longitude_deg;
        const double yi = ring_[i].latitude_deg;
        const double xj = ring_[j].longitude_deg;
        const double yj = ring_[j].latitude_deg;

        // Half-open on latitude: a vertex level with the ray counts for exactly one of its edges.
        if ((yi > point.latitude_deg) != (yj > point.latitude_deg)) {
            const double crossing_lng = xi + (point.latitude_deg - yi) * (xj - xi) / (yj - yi);
            if (point.longitude_deg < crossing_lng) {
                inside = !inside;
            }
        }
    }
    return inside;
}

}  // namespace airspace
