// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed at startup: static region
// data, regulatory limits, separation minima, logging and runtime knobs.
// `ConfigurationLoader` translates environment variables into these structures
// so downstream modules never touch `std::getenv` directly.

#pragma once

#include <string>
#include <vector>

#include "airspace/admission_validator.hpp"
#include "airspace/border_geometry.hpp"
#include "airspace/conflict_index.hpp"
#include "airspace/zone_registry.hpp"

namespace airspace {

/**
 * @brief Immutable bundle of startup settings for the admission engine.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative for the process lifetime.
 */
struct Configuration final {
    std::string log_directory{};                    /**< Destination directory for structured logs. */
    std::string log_level{};                        /**< spdlog level name applied at startup. */
    BorderMode border_mode{BorderMode::Polygon};    /**< Polygon, or the explicit bounding-box fallback. */
    Polygon border_ring{};                          /**< National boundary ring. */
    GeoBounds region_bounds{};                      /**< Box used by the fallback mode. */
    std::vector<ZoneDefinition> restricted_zones{}; /**< Static restricted zones. */
    std::vector<AirportDefinition> airports{};      /**< Static airports. */
    RegulatoryLimits limits{};                      /**< Altitude ceiling and daylight window. */
    SeparationConfig separation{};                  /**< Conflict minima and sampling. */
    std::string flight_number_prefix{};             /**< Prefix of generated flight numbers. */
    double tick_hz{};                               /**< Maintenance sweep cadence in Hertz. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static BorderMode load_border_mode();
    static RegulatoryLimits load_limits();
    static SeparationConfig load_separation();
};

/** @brief Build the border geometry in the mode the configuration selects. */
[[nodiscard]] BorderGeometry make_border_geometry(const Configuration& configuration);

}  // namespace airspace
