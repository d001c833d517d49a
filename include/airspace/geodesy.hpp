// === Geodesy =================================================================
//
// Distance and projection helpers shared by every geometry component. Great
// circle (haversine) distances are used for anything compared against a metre
// threshold; degree projections are the planar approximation valid for an
// operating region a few hundred kilometres across.

#pragma once

#include "airspace/types.hpp"

namespace airspace {

inline constexpr double k_earth_radius_m{6'371'000.0};   /**< Mean Earth radius. */
inline constexpr double k_meters_per_degree{111'320.0};  /**< Metres per degree of latitude. */

[[nodiscard]] double degrees_to_radians(double degrees) noexcept;

/** @brief Great-circle distance between two points in metres. */
[[nodiscard]] double haversine_distance_m(const GeoPoint& from, const GeoPoint& to) noexcept;

[[nodiscard]] double meters_to_latitude_degrees(double meters) noexcept;
/** @brief Longitude span of @p meters at @p latitude_deg, corrected by cos(latitude). */
[[nodiscard]] double meters_to_longitude_degrees(double meters, double latitude_deg) noexcept;

/** @brief Linear lat/lng interpolation; @p t in [0, 1]. Not geodesically exact. */
[[nodiscard]] GeoPoint interpolate(const GeoPoint& from, const GeoPoint& to, double t) noexcept;

/** @brief Latitude/longitude bounding box. */
struct GeoBounds final {
    double north_deg{};
    double south_deg{};
    double east_deg{};
    double west_deg{};

    /** @brief Inclusive containment test. */
    [[nodiscard]] bool contains(const GeoPoint& point) const noexcept;
    /** @brief Overlap test with @p buffer_deg added around each box. */
    [[nodiscard]] bool overlaps(const GeoBounds& other, double buffer_deg) const noexcept;
};

}  // namespace airspace
