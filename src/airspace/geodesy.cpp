#include "airspace/geodesy.hpp"

#include <cmath>
#include <numbers>

namespace airspace {

double degrees_to_radians(double degrees) noexcept {
    return degrees * std::numbers::pi / 180.0;
}

double haversine_distance_m(const GeoPoint& from, const GeoPoint& to) noexcept {
    const double lat1 = degrees_to_radians(from.latitude_deg);
    const double lat2 = degrees_to_radians(to.latitude_deg);
    const double delta_lat = lat2 - lat1;
    const double delta_lon = degrees_to_radians(to.longitude_deg - from.longitude_deg);

    const double a = std::pow(std::sin(delta_lat / 2.0), 2)
        + std::cos(lat1) * std::cos(lat2) * std::pow(std::sin(delta_lon / 2.0), 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return k_earth_radius_m * c;
}

double meters_to_latitude_degrees(double meters) noexcept {
    return meters / k_meters_per_degree;
}

double meters_to_longitude_degrees(double meters, double latitude_deg) noexcept {
    return meters / (k_meters_per_degree * std::cos(degrees_to_radians(latitude_deg)));
}

GeoPoint interpolate(const GeoPoint& from, const GeoPoint& to, double t) noexcept {
    return GeoPoint{
        from.latitude_deg + t * (to.latitude_deg - from.latitude_deg),
        from.longitude_deg + t * (to.longitude_deg - from.longitude_deg)
    };
}

bool GeoBounds::contains(const GeoPoint& point) const noexcept {
    return point.latitude_deg >= south_deg && point.latitude_deg <= north_deg
        && point.longitude_deg >= west_deg && point.longitude_deg <= east_deg;
}

bool GeoBounds::overlaps(const GeoBounds& other, double buffer_deg) const noexcept {
    return !(east_deg + buffer_deg < other.west_deg - buffer_deg
             || west_deg - buffer_deg > other.east_deg + buffer_deg
             || north_deg + buffer_deg < other.south_deg - buffer_deg
             || south_deg - buffer_deg > other.north_deg + buffer_deg);
}

}  // namespace airspace
