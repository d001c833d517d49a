// === Region Data =============================================================
//
// Compiled-in static airspace for the default operating region: the national
// border ring, its expected bounding box, airports and restricted zones.

#pragma once

#include <vector>

#include "airspace/border_geometry.hpp"
#include "airspace/geodesy.hpp"
#include "airspace/zone_registry.hpp"

namespace airspace {

/** @brief Border ring of the default region, vertices as (lat, lng). */
[[nodiscard]] Polygon default_border_ring();

/** @brief Expected region box used when the border runs in fallback mode. */
[[nodiscard]] GeoBounds default_region_bounds() noexcept;

[[nodiscard]] std::vector<AirportDefinition> default_airports();

[[nodiscard]] std::vector<ZoneDefinition> default_restricted_zones();

}  // namespace airspace
