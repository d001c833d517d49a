#include <algorithm>

#include <catch2/catch.hpp>

#include "flight_fixtures.hpp"
#include "logging_test_fixture.hpp"
#include "airspace/flight_registry.hpp"

using namespace airspace;
using airspace::test::at;
using airspace::test::k_open_country;
using airspace::test::make_path_request;
using airspace::test::make_plan;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    airspace::test::ensure_logger_initialized();
    return true;
}();

FlightRequest make_window_request(TimePoint start, TimePoint end) {
    return make_path_request({k_open_country, GeoPoint{42.61, 20.90}}, 80.0, start, end);
}
}  // namespace

TEST_CASE("FlightRegistry enforces unique identifiers") {
    FlightRegistry registry{};
    registry.insert(make_plan("flight-1", make_window_request(at(10), at(11))));

    REQUIRE(registry.size() == 1);
    REQUIRE_THROWS_AS(registry.insert(make_plan("flight-1", make_window_request(at(12), at(13)))), InputError);
    REQUIRE_THROWS_AS(registry.insert(make_plan("", make_window_request(at(12), at(13)))), InputError);
    REQUIRE(registry.size() == 1);
}

TEST_CASE("FlightRegistry seeds the status history on insert") {
    FlightRegistry registry{};
    registry.insert(make_plan("flight-1", make_window_request(at(10), at(11))));

    const auto plan = registry.find("flight-1");
    REQUIRE(plan.has_value());
    REQUIRE(plan->status_history.size() == 1);
    REQUIRE(plan->status_history.front().status == FlightStatus::Pending);
    REQUIRE_FALSE(registry.find("flight-404").has_value());
}

TEST_CASE("FlightRegistry only applies lifecycle transitions") {
    FlightRegistry registry{};
    registry.insert(make_plan("flight-1", make_window_request(at(10), at(11))));
    registry.insert(make_plan("flight-2", make_window_request(at(10), at(11)), FlightStatus::Rejected));

    SECTION("pending can be approved but not activated") {
        REQUIRE_FALSE(registry.update_status("flight-1", FlightStatus::Active, at(1), "skip"));
        REQUIRE(registry.update_status("flight-1", FlightStatus::Approved, at(1), "approved"));
        REQUIRE(registry.find("flight-1")->status == FlightStatus::Approved);
        REQUIRE(registry.find("flight-1")->status_history.size() == 2);
    }

    SECTION("terminal states are final") {
        REQUIRE(registry.update_status("flight-1", FlightStatus::Cancelled, at(1), "owner"));
        REQUIRE_FALSE(registry.update_status("flight-1", FlightStatus::Cancelled, at(2), "again"));
        REQUIRE_FALSE(registry.update_status("flight-1", FlightStatus::Approved, at(2), "late"));
        REQUIRE_FALSE(registry.update_status("flight-2", FlightStatus::Cancelled, at(2), "owner"));
        REQUIRE(registry.find("flight-2")->status == FlightStatus::Rejected);
    }

    SECTION("unknown flights are reported") {
        REQUIRE_FALSE(registry.update_status("flight-404", FlightStatus::Cancelled, at(1), "owner"));
    }
}

TEST_CASE("FlightRegistry returns live flights overlapping a half-open window") {
    FlightRegistry registry{};
    registry.insert(make_plan("morning", make_window_request(at(9), at(10))));
    registry.insert(make_plan("overlap", make_window_request(at(10, 15), at(10, 45))));
    registry.insert(make_plan("rejected", make_window_request(at(10), at(11)), FlightStatus::Rejected));
    registry.insert(make_plan("cancelled", make_window_request(at(10), at(11)), FlightStatus::Cancelled));
    registry.insert(make_plan("active", make_window_request(at(10, 50), at(12)), FlightStatus::Active));

    const std::vector<FlightPlan> candidates = registry.active_conflict_candidates(TimeWindow{at(10), at(11)});

    std::vector<std::string> identifiers;
    for (const FlightPlan& plan : candidates) {
        identifiers.push_back(plan.flight_id);
    }
    std::sort(identifiers.begin(), identifiers.end());
    REQUIRE(identifiers == std::vector<std::string>{"active", "overlap"});
}

TEST_CASE("FlightRegistry lifecycle sweep advances approved and active flights") {
    FlightRegistry registry{};
    registry.insert(make_plan("pending", make_window_request(at(10), at(11))));
    registry.insert(make_plan("approved", make_window_request(at(10), at(11)), FlightStatus::Approved));
    registry.insert(make_plan("finished", make_window_request(at(8), at(9)), FlightStatus::Approved));
    registry.insert(make_plan("active", make_window_request(at(9), at(10)), FlightStatus::Active));
    registry.insert(make_plan("later", make_window_request(at(12), at(13)), FlightStatus::Approved));

    const std::size_t transitioned = registry.advance_lifecycle(at(10, 30));

    REQUIRE(transitioned == 3);
    REQUIRE(registry.find("pending")->status == FlightStatus::Pending);
    REQUIRE(registry.find("approved")->status == FlightStatus::Active);
    REQUIRE(registry.find("finished")->status == FlightStatus::Completed);
    REQUIRE(registry.find("finished")->status_history.size() == 3);
    REQUIRE(registry.find("active")->status == FlightStatus::Completed);
    REQUIRE(registry.find("later")->status == FlightStatus::Approved);
    REQUIRE(registry.count_with_status(FlightStatus::Completed) == 2);

    REQUIRE(registry.advance_lifecycle(at(10, 30)) == 0);
}

TEST_CASE("FlightRegistry removes flights") {
    FlightRegistry registry{};
    registry.insert(make_plan("flight-1", make_window_request(at(10), at(11))));
    REQUIRE(registry.remove("flight-1"));
    REQUIRE_FALSE(registry.remove("flight-1"));
    REQUIRE(registry.size() == 0);
}
