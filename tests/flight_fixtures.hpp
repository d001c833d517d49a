#pragma once

#include <chrono>
#include <utility>
#include <vector>

#include "airspace/admission_service.hpp"
#include "airspace/flight_plan.hpp"
#include "airspace/region_data.hpp"

namespace airspace::test {

/** @brief Test day; all schedules fall on 2030-01-15 UTC. */
inline TimePoint at(int hour, int minute = 0) {
    using namespace std::chrono;
    return sys_days{year{2030} / January / 15} + hours{hour} + minutes{minute};
}

/** @brief Submission clock used by default: midnight before the test day's flights. */
inline TimePoint submission_time() {
    return at(0);
}

/** @brief Metres expressed as degrees of latitude. */
inline double north_offset_deg(double meters) {
    return meters / 111'320.0;
}

inline FlightRequest make_path_request(std::vector<GeoPoint> points, double altitude_m, TimePoint start, TimePoint end) {
    FlightRequest request{};
    for (std::size_t index = 0; index < points.size(); ++index) {
        request.waypoints.push_back(Waypoint{points[index], altitude_m, static_cast<int>(index) + 1});
    }
    request.scheduled_start = start;
    request.scheduled_end = end;
    request.max_altitude_m = altitude_m;
    return request;
}

inline FlightRequest make_area_request(OperationArea area, double altitude_m, TimePoint start, TimePoint end) {
    FlightRequest request{};
    request.operation_area = std::move(area);
    request.scheduled_start = start;
    request.scheduled_end = end;
    request.max_altitude_m = altitude_m;
    return request;
}

/** @brief Plan with identity filled in, for feeding the registry directly. */
inline FlightPlan make_plan(const std::string& flight_id, const FlightRequest& request, FlightStatus status = FlightStatus::Pending) {
    FlightPlan plan = plan_from_request(request);
    plan.flight_id = flight_id;
    plan.flight_number = "KS-" + flight_id;
    plan.status = status;
    return plan;
}

/** @brief Service over the built-in region with default limits. */
inline AdmissionService make_default_service() {
    return AdmissionService{
        BorderGeometry{default_border_ring()},
        ZoneRegistry{default_restricted_zones(), default_airports()},
        RegulatoryLimits{},
        SeparationConfig{},
        "KS"
    };
}

/** @brief A point inside the border and clear of every built-in zone. */
inline constexpr GeoPoint k_open_country{42.60, 20.90};

}  // namespace airspace::test
