#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "airspace/geodesy.hpp"
#include "airspace/region_data.hpp"
#include "airspace/zone_registry.hpp"

using namespace airspace;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    airspace::test::ensure_logger_initialized();
    return true;
}();

ZoneRegistry make_default_registry() {
    return ZoneRegistry{default_restricted_zones(), default_airports()};
}
}  // namespace

TEST_CASE("ZoneRegistry marks zero-cap zones as no-fly") {
    const ZoneRegistry registry = make_default_registry();
    const ZoneClassification classification = registry.classify(GeoPoint{42.6694, 21.1364});

    REQUIRE(classification.restricted);
    REQUIRE(classification.severity == ZoneSeverity::NoFly);
    REQUIRE(classification.zone_name == "Film City KFOR Headquarters");
    REQUIRE(classification.zone_type == "military");
    REQUIRE_FALSE(classification.altitude_cap_m.has_value());
}

TEST_CASE("ZoneRegistry reports altitude caps for caution zones") {
    const ZoneRegistry registry = make_default_registry();
    const ZoneClassification classification = registry.classify(GeoPoint{42.5997, 21.1936});

    REQUIRE_FALSE(classification.restricted);
    REQUIRE(classification.severity == ZoneSeverity::Caution);
    REQUIRE(classification.zone_name == "Gracanica Monastery");
    REQUIRE(classification.altitude_cap_m.has_value());
    REQUIRE(*classification.altitude_cap_m == Approx(50.0));
}

TEST_CASE("ZoneRegistry distinguishes airport core and caution ring") {
    const ZoneRegistry registry = make_default_registry();
    const GeoPoint airport_center{42.5728, 21.0358};

    const ZoneClassification core = registry.classify(airport_center);
    REQUIRE(core.severity == ZoneSeverity::NoFly);
    REQUIRE(core.zone_type == "airport");
    REQUIRE(core.distance_m == Approx(0.0).margin(1e-6));

    const GeoPoint ring_point{airport_center.latitude_deg + meters_to_latitude_degrees(6'000.0), airport_center.longitude_deg};
    const ZoneClassification ring = registry.classify(ring_point);
    REQUIRE(ring.severity == ZoneSeverity::Caution);
    REQUIRE(ring.zone_name == "Pristina International Airport");
    REQUIRE_FALSE(ring.altitude_cap_m.has_value());
    REQUIRE(ring.distance_m > 5'000.0);
    REQUIRE(ring.distance_m < 8'000.0);
}

TEST_CASE("ZoneRegistry leaves open country unrestricted") {
    const ZoneRegistry registry = make_default_registry();
    const ZoneClassification classification = registry.classify(GeoPoint{42.60, 20.90});

    REQUIRE(classification.severity == ZoneSeverity::None);
    REQUIRE_FALSE(classification.restricted);
    REQUIRE(std::string{to_string(classification.severity)} == "none");
}

TEST_CASE("ZoneRegistry finds the nearest airport") {
    const ZoneRegistry registry = make_default_registry();
    const auto nearest = registry.nearest_airport(GeoPoint{42.60, 20.90});

    REQUIRE(nearest.has_value());
    REQUIRE(nearest->airport.icao_code == "BKPR");
    REQUIRE(nearest->distance_m > 8'000.0);

    const ZoneRegistry empty_registry{{}, {}};
    REQUIRE_FALSE(empty_registry.nearest_airport(GeoPoint{42.60, 20.90}).has_value());
}

TEST_CASE("ZoneRegistry rejects malformed definitions") {
    REQUIRE_THROWS_AS(
        (ZoneRegistry{{ZoneDefinition{"Bad", "military", GeoPoint{42.0, 21.0}, 0.0, 0.0}}, {}}),
        InputError
    );
    REQUIRE_THROWS_AS(
        (ZoneRegistry{{}, {AirportDefinition{"Tiny", "XXXX", GeoPoint{42.0, 21.0}, 5'000.0, 1'000.0}}}),
        InputError
    );
}
