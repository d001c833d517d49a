#include "airspace/path_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace airspace {

namespace {
constexpr int k_perimeter_points{8};
}  // namespace

PathSampler::PathSampler(const BorderGeometry& border)
    : border_(border) {}

std::vector<GeoPoint> PathSampler::sample_segment(const GeoPoint& from, const GeoPoint& to, double spacing_m) const {
    if (!(spacing_m > 0.0)) {
        throw InputError("Sample spacing must be positive");
    }
    const double length_m = haversine_distance_m(from, to);
    const auto interior_count = static_cast<std::size_t>(std::ceil(length_m / spacing_m));
    if (interior_count == 0) {
        return {from};
    }

    std::vector<GeoPoint> samples;
    samples.reserve(interior_count + 2);
    samples.push_back(from);
    for (std::size_t index = 1; index <= interior_count; ++index) {
        const double t = static_cast<double>(index) / static_cast<double>(interior_count + 1);
        samples.push_back(interpolate(from, to, t));
    }
    samples.push_back(to);
    return samples;
}

std::vector<GeoPoint> PathSampler::sample_path(const std::vector<Waypoint>& waypoints, double spacing_m) const {
    std::vector<GeoPoint> samples;
    if (waypoints.empty()) {
        return samples;
    }
    samples.push_back(waypoints.front().point);
    for (std::size_t index = 1; index < waypoints.size(); ++index) {
        const std::vector<GeoPoint> segment = sample_segment(waypoints[index - 1].point, waypoints[index].point, spacing_m);
        samples.insert(samples.end(), std::next(segment.begin()), segment.end());
    }
    return samples;
}

std::vector<GeoPoint> PathSampler::sample_area(const OperationArea& area) const {
    std::vector<GeoPoint> samples;
    samples.reserve(k_perimeter_points + 1);

    if (const auto* circle = std::get_if<Circle>(&area.shape)) {
        samples.push_back(circle->center);
        const double lat_offset_deg = meters_to_latitude_degrees(circle->radius_m);
        const double lng_offset_deg = meters_to_longitude_degrees(circle->radius_m, circle->center.latitude_deg);
        for (int index = 0; index < k_perimeter_points; ++index) {
            const double angle = (static_cast<double>(index) / k_perimeter_points) * 2.0 * std::numbers::pi;
            samples.push_back(GeoPoint{
                circle->center.latitude_deg + lat_offset_deg * std::cos(angle),
                circle->center.longitude_deg + lng_offset_deg * std::sin(angle)
            });
        }
        return samples;
    }

    const auto& rectangle = std::get<Rectangle>(area.shape);
    const double mid_lat = (rectangle.north_deg + rectangle.south_deg) / 2.0;
    const double mid_lng = (rectangle.east_deg + rectangle.west_deg) / 2.0;
    samples.push_back(GeoPoint{mid_lat, mid_lng});
    samples.push_back(GeoPoint{rectangle.north_deg, rectangle.west_deg});
    samples.push_back(GeoPoint{rectangle.north_deg, rectangle.east_deg});
    samples.push_back(GeoPoint{rectangle.south_deg, rectangle.east_deg});
    samples.push_back(GeoPoint{rectangle.south_deg, rectangle.west_deg});
    samples.push_back(GeoPoint{mid_lat, rectangle.west_deg});
    samples.push_back(GeoPoint{mid_lat, rectangle.east_deg});
    samples.push_back(GeoPoint{rectangle.north_deg, mid_lng});
    samples.push_back(GeoPoint{rectangle.south_deg, mid_lng});
    return samples;
}

std::optional<GeoPoint> PathSampler::crosses_border(const GeoPoint& from, const GeoPoint& to) const {
    for (int step = 1; step < k_border_crossing_steps; ++step) {
        const double t = static_cast<double>(step) / k_border_crossing_steps;
        const GeoPoint sample = interpolate(from, to, t);
        if (!border_.is_inside(sample)) {
            return sample;
        }
    }
    return std::nullopt;
}

bool PathSampler::is_point_in_area(const GeoPoint& point, const OperationArea& area) {
    if (const auto* circle = std::get_if<Circle>(&area.shape)) {
        return haversine_distance_m(point, circle->center) <= circle->radius_m;
    }
    const auto& rectangle = std::get<Rectangle>(area.shape);
    return point.latitude_deg >= rectangle.south_deg && point.latitude_deg <= rectangle.north_deg
        && point.longitude_deg >= rectangle.west_deg && point.longitude_deg <= rectangle.east_deg;
}

GeoBounds PathSampler::flight_bounds(const FlightPlan& plan) {
    if (plan.operation_area.has_value()) {
        if (const auto* circle = std::get_if<Circle>(&plan.operation_area->shape)) {
            const double lat_span = meters_to_latitude_degrees(circle->radius_m);
            const double lng_span = meters_to_longitude_degrees(circle->radius_m, circle->center.latitude_deg);
            return GeoBounds{
                circle->center.latitude_deg + lat_span,
                circle->center.latitude_deg - lat_span,
                circle->center.longitude_deg + lng_span,
                circle->center.longitude_deg - lng_span
            };
        }
        const auto& rectangle = std::get<Rectangle>(plan.operation_area->shape);
        return GeoBounds{rectangle.north_deg, rectangle.south_deg, rectangle.east_deg, rectangle.west_deg};
    }

    if (plan.waypoints.empty()) {
        throw InputError("Flight plan " + plan.flight_id + " has no geometry");
    }
    GeoBounds bounds{
        plan.waypoints.front().point.latitude_deg,
        plan.waypoints.front().point.latitude_deg,
        plan.waypoints.front().point.longitude_deg,
        plan.waypoints.front().point.longitude_deg
    };
    for (const Waypoint& waypoint : plan.waypoints) {
        bounds.north_deg = std::max(bounds.north_deg, waypoint.point.latitude_deg);
        bounds.south_deg = std::min(bounds.south_deg, waypoint.point.latitude_deg);
        bounds.east_deg = std::max(bounds.east_deg, waypoint.point.longitude_deg);
        bounds.west_deg = std::min(bounds.west_deg, waypoint.point.longitude_deg);
    }
    return bounds;
}

}  // namespace airspace
