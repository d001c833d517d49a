// === Border Geometry =========================================================
//
// Immutable national boundary used to decide whether a point lies inside the
// governed airspace. Two explicit modes exist: the polygon ring, and a
// bounding-box fallback selected deliberately when no ring is available.

#pragma once

#include <memory>
#include <vector>

#include "airspace/geodesy.hpp"
#include "airspace/logging.hpp"
#include "airspace/types.hpp"

namespace airspace {

/** @brief Ordered ring of vertices; the closing edge back to the first vertex is implicit. */
using Polygon = std::vector<GeoPoint>;

enum class BorderMode {
    Polygon,             /**< Ray casting over the loaded ring. */
    BoundingBoxFallback  /**< Degraded mode: inclusive lat/lng box test. */
};

/**
 * @brief Point-in-border test over the national boundary.
 *
 * Points exactly on a polygon edge are inside when the edge faces west or
 * south and outside when it faces east or north. The answer does not depend on
 * the vertex the ring starts from.
 */
class BorderGeometry final {
  public:
    /** @brief Build the polygon mode; throws InputError for fewer than 3 vertices. */
    explicit BorderGeometry(Polygon ring);

    /** @brief Build the degraded bounding-box mode explicitly. */
    [[nodiscard]] static BorderGeometry bounding_box_fallback(const GeoBounds& bounds);

    [[nodiscard]] bool is_inside(const GeoPoint& point) const noexcept;
    [[nodiscard]] BorderMode mode() const noexcept;
    /** @brief Bounding box of the ring, or the fallback box. */
    [[nodiscard]] const GeoBounds& bounds() const noexcept;
    [[nodiscard]] const Polygon& ring() const noexcept;

  private:
    BorderGeometry(BorderMode mode, Polygon ring, GeoBounds bounds);

    [[nodiscard]] bool ray_cast(const GeoPoint& point) const noexcept;

    BorderMode mode_;
    Polygon ring_;
    GeoBounds bounds_;
};

}  // namespace airspace
