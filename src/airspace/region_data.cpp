#include "airspace/region_data.hpp"

#include <array>
#include <utility>

namespace airspace {

namespace {

constexpr std::array<std::pair<double, double>, 22> k_border_vertices{{
    {42.8500, 20.3500},
    {43.0300, 20.5000},
    {43.2100, 20.6200},
    {43.2700, 20.8000},
    {43.1500, 21.0500},
    {43.0800, 21.2500},
    {42.9000, 21.4000},
    {42.8000, 21.5800},
    {42.6800, 21.7800},
    {42.4600, 21.7000},
    {42.3200, 21.5800},
    {42.2400, 21.4000},
    {42.1900, 21.2500},
    {42.1000, 21.0500},
    {41.8600, 20.7500},
    {42.0000, 20.5900},
    {42.2200, 20.5300},
    {42.3300, 20.3000},
    {42.5000, 20.0800},
    {42.5600, 20.1000},
    {42.6500, 20.0300},
    {42.7800, 20.2100},
}}; /**< Simplified national boundary, clockwise from the north-west. */

constexpr GeoBounds k_region_bounds{43.27, 41.85, 21.80, 19.91};

}  // namespace

Polygon default_border_ring() {
    Polygon ring;
    ring.reserve(k_border_vertices.size());
    for (const auto& [latitude, longitude] : k_border_vertices) {
        ring.push_back(GeoPoint{latitude, longitude});
    }
    return ring;
}

GeoBounds default_region_bounds() noexcept {
    return k_region_bounds;
}

std::vector<AirportDefinition> default_airports() {
    return {
        AirportDefinition{"Pristina International Airport", "BKPR", GeoPoint{42.5728, 21.0358}, 5'000.0, 8'000.0},
        AirportDefinition{"Gjakova Airport", "BKGJ", GeoPoint{42.4336, 20.4219}, 3'000.0, 5'000.0},
    };
}

std::vector<ZoneDefinition> default_restricted_zones() {
    return {
        ZoneDefinition{"Camp Bondsteel", "military", GeoPoint{42.3617, 21.2500}, 3'000.0, 0.0},
        ZoneDefinition{"Film City KFOR Headquarters", "military", GeoPoint{42.6694, 21.1364}, 1'500.0, 0.0},
        ZoneDefinition{"Government District Pristina", "government", GeoPoint{42.6629, 21.1655}, 1'000.0, 0.0},
        ZoneDefinition{"Gracanica Monastery", "cultural", GeoPoint{42.5997, 21.1936}, 1'000.0, 50.0},
        ZoneDefinition{"Visoki Decani Monastery", "cultural", GeoPoint{42.5467, 20.2661}, 1'000.0, 0.0},
        ZoneDefinition{"Patriarchate of Pec", "cultural", GeoPoint{42.6611, 20.2658}, 800.0, 50.0},
        ZoneDefinition{"Gazivoda Dam", "infrastructure", GeoPoint{42.9333, 20.6125}, 1'200.0, 60.0},
        ZoneDefinition{"Kosovo B Power Plant", "infrastructure", GeoPoint{42.7047, 21.0536}, 1'500.0, 0.0},
    };
}

}  // namespace airspace
