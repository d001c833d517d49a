#include "airspace/zone_registry.hpp"

#include <utility>

#include <fmt/format.h>

#include "airspace/geodesy.hpp"
#include "airspace/logging.hpp"

namespace airspace {

namespace {
constexpr char k_airport_zone_type[] = "airport";

void validate_zone(const ZoneDefinition& zone) {
    if (zone.name.empty()) {
        throw InputError("Restricted zone requires a name");
    }
    require_valid_point(zone.center, fmt::format("Zone {} center", zone.name));
    if (!(zone.radius_m > 0.0)) {
        throw InputError(fmt::format("Zone {} radius must be positive", zone.name));
    }
    if (zone.max_altitude_m < 0.0) {
        throw InputError(fmt::format("Zone {} altitude cap cannot be negative", zone.name));
    }
}

void validate_airport(const AirportDefinition& airport) {
    if (airport.name.empty()) {
        throw InputError("Airport requires a name");
    }
    require_valid_point(airport.center, fmt::format("Airport {} center", airport.name));
    if (!(airport.restricted_radius_m > 0.0)) {
        throw InputError(fmt::format("Airport {} restricted radius must be positive", airport.name));
    }
    if (airport.caution_radius_m < airport.restricted_radius_m) {
        throw InputError(fmt::format("Airport {} caution radius is smaller than its restricted radius", airport.name));
    }
}
}  // namespace

const char* to_string(ZoneSeverity severity) noexcept {
    switch (severity) {
        case ZoneSeverity::None:
            return "none";
        case ZoneSeverity::Caution:
            return "caution";
        case ZoneSeverity::NoFly:
            return "no-fly";
    }
    return "none";
}

ZoneRegistry::ZoneRegistry(std::vector<ZoneDefinition> zones, std::vector<AirportDefinition> airports)
    : list_zones_(std::move(zones)),
      list_airports_(std::move(airports)) {
    for (const auto& zone : list_zones_) {
        validate_zone(zone);
    }
    for (const auto& airport : list_airports_) {
        validate_airport(airport);
    }
    get_logger()->info("Zone registry loaded {} restricted zones and {} airports", list_zones_.size(), list_airports_.size());
}

ZoneClassification ZoneRegistry::classify(const GeoPoint& point) const {
    for (const auto& airport : list_airports_) {
        const double distance_m = haversine_distance_m(point, airport.center);
        if (distance_m <= airport.restricted_radius_m) {
            return ZoneClassification{true, ZoneSeverity::NoFly, airport.name, k_airport_zone_type, std::nullopt, distance_m};
        }
    }

    for (const auto& zone : list_zones_) {
        const double distance_m = haversine_distance_m(point, zone.center);
        if (distance_m > zone.radius_m) {
            continue;
        }
        if (zone.max_altitude_m == 0.0) {
            return ZoneClassification{true, ZoneSeverity::NoFly, zone.name, zone.type, std::nullopt, distance_m};
        }
        return ZoneClassification{false, ZoneSeverity::Caution, zone.name, zone.type, zone.max_altitude_m, distance_m};
    }

    // Caution rings are checked last so they never mask a no-fly zone inside them.
    for (const auto& airport : list_airports_) {
        const double distance_m = haversine_distance_m(point, airport.center);
        if (distance_m <= airport.caution_radius_m) {
            return ZoneClassification{false, ZoneSeverity::Caution, airport.name, k_airport_zone_type, std::nullopt, distance_m};
        }
    }

    return ZoneClassification{};
}

std::optional<NearestAirport> ZoneRegistry::nearest_airport(const GeoPoint& point) const {
    std::optional<NearestAirport> optional_nearest;
    for (const auto& airport : list_airports_) {
        const double distance_m = haversine_distance_m(point, airport.center);
        if (!optional_nearest.has_value() || distance_m < optional_nearest->distance_m) {
            optional_nearest = NearestAirport{airport, distance_m};
        }
    }
    return optional_nearest;
}

const std::vector<ZoneDefinition>& ZoneRegistry::zones() const noexcept {
    return list_zones_;
}

const std::vector<AirportDefinition>& ZoneRegistry::airports() const noexcept {
    return list_airports_;
}

}  // namespace airspace
