// === Path Sampler ============================================================
//
// Discretizes waypoint paths and operation areas into point samples consumed by
// containment and proximity checks. Interpolation is linear in lat/lng, which
// is only acceptable because the operating region spans a few hundred km.

#pragma once

#include <optional>
#include <vector>

#include "airspace/border_geometry.hpp"
#include "airspace/flight_plan.hpp"
#include "airspace/geodesy.hpp"
#include "airspace/types.hpp"

namespace airspace {

inline constexpr double k_default_sample_spacing_m{50.0};
inline constexpr int k_border_crossing_steps{20};

/** @brief Point samplers bound to the border used for crossing detection. */
class PathSampler final {
  public:
    explicit PathSampler(const BorderGeometry& border);

    /**
     * @brief Samples from @p from to @p to, both endpoints included.
     *
     * Inserts ceil(length / spacing) evenly spaced interior points; a
     * zero-length segment yields only @p from. Throws InputError for a
     * non-positive spacing.
     */
    [[nodiscard]] std::vector<GeoPoint> sample_segment(
        const GeoPoint& from,
        const GeoPoint& to,
        double spacing_m = k_default_sample_spacing_m
    ) const;

    /** @brief Chain of segment samples over an ordered path, joints not repeated. */
    [[nodiscard]] std::vector<GeoPoint> sample_path(
        const std::vector<Waypoint>& waypoints,
        double spacing_m = k_default_sample_spacing_m
    ) const;

    /** @brief Center plus 8 perimeter points (circle) or 4 corners and 4 edge midpoints (rectangle). */
    [[nodiscard]] std::vector<GeoPoint> sample_area(const OperationArea& area) const;

    /** @brief First of the 19 interior samples of the segment lying outside the border. */
    [[nodiscard]] std::optional<GeoPoint> crosses_border(const GeoPoint& from, const GeoPoint& to) const;

    [[nodiscard]] static bool is_point_in_area(const GeoPoint& point, const OperationArea& area);

    /** @brief Bounding box of a plan's geometry (area projected to degrees, or waypoint extents). */
    [[nodiscard]] static GeoBounds flight_bounds(const FlightPlan& plan);

  private:
    const BorderGeometry& border_;
};

}  // namespace airspace
