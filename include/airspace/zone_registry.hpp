// === Zone Registry ===========================================================
//
// Immutable catalogue of restricted zones and airports. Classifies a point as
// clear, caution (altitude-capped) or no-fly using haversine distances.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "airspace/types.hpp"

namespace airspace {

/** @brief Circular restricted zone; a zero altitude cap makes it a full no-fly zone. */
struct ZoneDefinition final {
    std::string name{};
    std::string type{};        /**< Free-form category, e.g. "military" or "cultural". */
    GeoPoint center{};
    double radius_m{};
    double max_altitude_m{};   /**< 0 means no-fly; otherwise the caution altitude cap. */
};

/** @brief Airport with a no-fly core and a wider caution ring. */
struct AirportDefinition final {
    std::string name{};
    std::string icao_code{};
    GeoPoint center{};
    double restricted_radius_m{};
    double caution_radius_m{};
};

enum class ZoneSeverity {
    None,
    Caution,
    NoFly
};

/** @brief Outcome of ZoneRegistry::classify. */
struct ZoneClassification final {
    bool restricted{};                           /**< True only for no-fly. */
    ZoneSeverity severity{ZoneSeverity::None};
    std::string zone_name{};
    std::string zone_type{};                     /**< "airport" for airports. */
    std::optional<double> altitude_cap_m{};      /**< Present for altitude-capped zones. */
    double distance_m{};                         /**< Distance to the matched zone center. */
};

/** @brief Airport nearest to a point. */
struct NearestAirport final {
    AirportDefinition airport{};
    double distance_m{};
};

[[nodiscard]] const char* to_string(ZoneSeverity severity) noexcept;

/**
 * @brief First-match classification over airports, then zones.
 *
 * Scans are linear, which is adequate for tens of zones; a spatial grid would
 * be required for hundreds.
 */
class ZoneRegistry final {
  public:
    /** @brief Throws InputError for any malformed definition. */
    ZoneRegistry(std::vector<ZoneDefinition> zones, std::vector<AirportDefinition> airports);

    [[nodiscard]] ZoneClassification classify(const GeoPoint& point) const;
    [[nodiscard]] std::optional<NearestAirport> nearest_airport(const GeoPoint& point) const;

    [[nodiscard]] const std::vector<ZoneDefinition>& zones() const noexcept;
    [[nodiscard]] const std::vector<AirportDefinition>& airports() const noexcept;

  private:
    std::vector<ZoneDefinition> list_zones_;
    std::vector<AirportDefinition> list_airports_;
};

}  // namespace airspace
