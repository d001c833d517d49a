#include <algorithm>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "flight_fixtures.hpp"
#include "logging_test_fixture.hpp"
#include "airspace/admission_service.hpp"

using namespace airspace;
using airspace::test::at;
using airspace::test::k_open_country;
using airspace::test::make_area_request;
using airspace::test::make_default_service;
using airspace::test::make_path_request;
using airspace::test::north_offset_deg;
using airspace::test::submission_time;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    airspace::test::ensure_logger_initialized();
    return true;
}();

GeoPoint north_of(const GeoPoint& point, double meters) {
    return GeoPoint{point.latitude_deg + north_offset_deg(meters), point.longitude_deg};
}

/** @brief Short path starting at @p start_point; a single waypoint when hovering. */
FlightRequest make_hover(const GeoPoint& start_point, double altitude_m, TimePoint start, TimePoint end) {
    return make_path_request({start_point}, altitude_m, start, end);
}

bool has_traffic_conflict(const ValidationReport& report) {
    return std::any_of(report.checks.begin(), report.checks.end(), [](const ValidationCheck& check) {
        return check.name == "traffic_conflict" && !check.passed;
    });
}
}  // namespace

TEST_CASE("AdmissionService admits a clear flight as pending") {
    AdmissionService service = make_default_service();
    const SubmissionResult result = service.submit_flight(make_hover(k_open_country, 100.0, at(10), at(10, 30)), submission_time());

    REQUIRE(result.status == FlightStatus::Pending);
    REQUIRE(result.validation_report.is_valid);
    REQUIRE(result.flight_id == "flight-1");
    REQUIRE(result.flight_number.rfind("KS-", 0) == 0);
    REQUIRE(result.flight_number.size() == 13);

    const auto stored = service.find_flight(result.flight_id);
    REQUIRE(stored.has_value());
    REQUIRE(stored->status == FlightStatus::Pending);
    REQUIRE(stored->flight_number == result.flight_number);
    REQUIRE(stored->created_at == submission_time());
}

TEST_CASE("AdmissionService rejects a conflicting submission and keeps it out of the live set") {
    AdmissionService service = make_default_service();
    const SubmissionResult first = service.submit_flight(make_hover(k_open_country, 100.0, at(10), at(10, 30)), submission_time());
    REQUIRE(first.status == FlightStatus::Pending);

    const SubmissionResult second = service.submit_flight(
        make_hover(north_of(k_open_country, 150.0), 110.0, at(10, 15), at(10, 45)),
        submission_time()
    );

    REQUIRE(second.status == FlightStatus::Rejected);
    REQUIRE_FALSE(second.validation_report.is_valid);
    REQUIRE(has_traffic_conflict(second.validation_report));

    const auto rejected = service.find_flight(second.flight_id);
    REQUIRE(rejected.has_value());
    REQUIRE(rejected->status == FlightStatus::Rejected);

    const std::vector<FlightPlan> live = service.list_active_conflict_candidates(TimeWindow{at(10), at(11)});
    REQUIRE(live.size() == 1);
    REQUIRE(live.front().flight_id == first.flight_id);
}

TEST_CASE("AdmissionService admits a flight separated vertically") {
    AdmissionService service = make_default_service();
    REQUIRE(service.submit_flight(make_hover(k_open_country, 100.0, at(10), at(10, 30)), submission_time()).status == FlightStatus::Pending);

    const SubmissionResult result = service.submit_flight(
        make_hover(north_of(k_open_country, 150.0), 140.0, at(10, 15), at(10, 45)),
        submission_time()
    );
    REQUIRE(result.status == FlightStatus::Pending);
}

TEST_CASE("AdmissionService cancellation frees the airspace") {
    AdmissionService service = make_default_service();
    const SubmissionResult first = service.submit_flight(make_hover(k_open_country, 100.0, at(10), at(10, 30)), submission_time());

    REQUIRE(service.cancel_flight(first.flight_id, submission_time()));
    REQUIRE(service.find_flight(first.flight_id)->status == FlightStatus::Cancelled);
    REQUIRE_FALSE(service.cancel_flight(first.flight_id, submission_time()));
    REQUIRE_FALSE(service.cancel_flight("flight-404", submission_time()));

    const SubmissionResult second = service.submit_flight(
        make_hover(north_of(k_open_country, 150.0), 110.0, at(10, 15), at(10, 45)),
        submission_time()
    );
    REQUIRE(second.status == FlightStatus::Pending);
}

TEST_CASE("AdmissionService does not cancel rejected flights") {
    AdmissionService service = make_default_service();
    const SubmissionResult result = service.submit_flight(make_hover(k_open_country, 300.0, at(10), at(10, 30)), submission_time());

    REQUIRE(result.status == FlightStatus::Rejected);
    REQUIRE_FALSE(service.cancel_flight(result.flight_id, submission_time()));
}

TEST_CASE("AdmissionService tick advances approved flights only") {
    AdmissionService service = make_default_service();
    const SubmissionResult pending = service.submit_flight(make_hover(k_open_country, 100.0, at(10), at(10, 30)), submission_time());
    const SubmissionResult approved = service.submit_flight(
        make_hover(north_of(k_open_country, 1'000.0), 100.0, at(10), at(10, 30)),
        submission_time()
    );
    REQUIRE(approved.status == FlightStatus::Pending);
    REQUIRE(service.approve_flight(approved.flight_id, submission_time()));
    REQUIRE_FALSE(service.approve_flight(approved.flight_id, submission_time()));

    REQUIRE(service.tick(at(9)) == 0);
    REQUIRE(service.tick(at(10, 5)) == 1);
    REQUIRE(service.find_flight(approved.flight_id)->status == FlightStatus::Active);
    REQUIRE(service.find_flight(pending.flight_id)->status == FlightStatus::Pending);

    REQUIRE(service.tick(at(10, 30)) == 1);
    REQUIRE(service.find_flight(approved.flight_id)->status == FlightStatus::Completed);
    REQUIRE(service.find_flight(pending.flight_id)->status == FlightStatus::Pending);
}

TEST_CASE("AdmissionService stores nothing for malformed input") {
    AdmissionService service = make_default_service();
    FlightRequest request = make_hover(k_open_country, 100.0, at(10), at(10, 30));
    request.operation_area = OperationArea{Circle{k_open_country, 100.0}};

    REQUIRE_THROWS_AS(service.submit_flight(request, submission_time()), InputError);
    REQUIRE(service.flight_count() == 0);

    const SubmissionResult next = service.submit_flight(make_hover(k_open_country, 100.0, at(10), at(10, 30)), submission_time());
    REQUIRE(next.flight_id == "flight-1");
}

TEST_CASE("AdmissionService admits mixed area and path traffic") {
    AdmissionService service = make_default_service();
    const SubmissionResult area = service.submit_flight(
        make_area_request(OperationArea{Circle{k_open_country, 200.0}}, 90.0, at(10), at(11)),
        submission_time()
    );
    REQUIRE(area.status == FlightStatus::Pending);

    const SubmissionResult crossing = service.submit_flight(
        make_path_request({north_of(k_open_country, -500.0), north_of(k_open_country, 500.0)}, 90.0, at(10, 30), at(11, 30)),
        submission_time()
    );
    REQUIRE(crossing.status == FlightStatus::Rejected);
    REQUIRE(has_traffic_conflict(crossing.validation_report));
}

TEST_CASE("AdmissionService serializes concurrent conflicting submissions") {
    AdmissionService service = make_default_service();
    constexpr std::size_t k_thread_count{8};
    std::vector<SubmissionResult> results(k_thread_count);
    std::vector<std::thread> threads;
    threads.reserve(k_thread_count);

    for (std::size_t index = 0; index < k_thread_count; ++index) {
        threads.emplace_back([&service, &results, index]() {
            results[index] = service.submit_flight(
                make_hover(north_of(k_open_country, static_cast<double>(index) * 10.0), 100.0, at(10), at(10, 30)),
                submission_time()
            );
        });
    }
    for (std::thread& thread : threads) {
        thread.join();
    }

    const auto pending_count = std::count_if(results.begin(), results.end(), [](const SubmissionResult& result) {
        return result.status == FlightStatus::Pending;
    });
    REQUIRE(pending_count == 1);
    REQUIRE(service.flight_count() == k_thread_count);
    REQUIRE(service.list_active_conflict_candidates(TimeWindow{at(10), at(10, 30)}).size() == 1);

    std::vector<std::string> identifiers;
    for (const SubmissionResult& result : results) {
        identifiers.push_back(result.flight_id);
    }
    std::sort(identifiers.begin(), identifiers.end());
    REQUIRE(std::adjacent_find(identifiers.begin(), identifiers.end()) == identifiers.end());
}

TEST_CASE("AdmissionService answers point queries against static airspace") {
    AdmissionService service = make_default_service();

    const PointReport open_point = service.check_point(k_open_country);
    REQUIRE(open_point.inside_border);
    REQUIRE(open_point.classification.severity == ZoneSeverity::None);
    REQUIRE(open_point.nearest_airport.has_value());
    REQUIRE(open_point.nearest_airport->airport.icao_code == "BKPR");

    const PointReport camp = service.check_point(GeoPoint{42.3617, 21.2500});
    REQUIRE(camp.inside_border);
    REQUIRE(camp.classification.severity == ZoneSeverity::NoFly);
    REQUIRE(camp.classification.zone_name == "Camp Bondsteel");

    const PointReport abroad = service.check_point(GeoPoint{44.0, 20.9});
    REQUIRE_FALSE(abroad.inside_border);

    REQUIRE_THROWS_AS(service.check_point(GeoPoint{120.0, 20.9}), InputError);
    REQUIRE(service.flight_count() == 0);
}

TEST_CASE("AdmissionService reports counts per status") {
    AdmissionService service = make_default_service();
    const SubmissionResult approved = service.submit_flight(make_hover(k_open_country, 100.0, at(10), at(10, 30)), submission_time());
    const SubmissionResult cancelled = service.submit_flight(
        make_hover(north_of(k_open_country, 1'000.0), 100.0, at(10), at(10, 30)),
        submission_time()
    );
    service.submit_flight(make_hover(north_of(k_open_country, 2'000.0), 100.0, at(10), at(10, 30)), submission_time());
    service.submit_flight(make_hover(k_open_country, 300.0, at(10), at(10, 30)), submission_time());

    REQUIRE(service.approve_flight(approved.flight_id, submission_time()));
    REQUIRE(service.cancel_flight(cancelled.flight_id, submission_time()));
    REQUIRE(service.tick(at(10, 5)) == 1);

    const FlightStatistics stats = service.statistics();
    REQUIRE(stats.total == 4);
    REQUIRE(stats.pending == 1);
    REQUIRE(stats.approved == 0);
    REQUIRE(stats.active == 1);
    REQUIRE(stats.completed == 0);
    REQUIRE(stats.cancelled == 1);
    REQUIRE(stats.rejected == 1);
}
