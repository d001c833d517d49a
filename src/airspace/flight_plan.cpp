#include "airspace/flight_plan.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "airspace/geodesy.hpp"

namespace airspace {

const char* to_string(FlightStatus status) noexcept {
    switch (status) {
        case FlightStatus::Pending:
            return "pending";
        case FlightStatus::Approved:
            return "approved";
        case FlightStatus::Active:
            return "active";
        case FlightStatus::Completed:
            return "completed";
        case FlightStatus::Cancelled:
            return "cancelled";
        case FlightStatus::Rejected:
            return "rejected";
    }
    return "unknown";
}

const char* to_string(CheckSeverity severity) noexcept {
    switch (severity) {
        case CheckSeverity::Info:
            return "info";
        case CheckSeverity::Warning:
            return "warning";
        case CheckSeverity::Error:
            return "error";
    }
    return "unknown";
}

const char* to_string(ConflictType type) noexcept {
    switch (type) {
        case ConflictType::AreaOverlap:
            return "area_overlap";
        case ConflictType::PathEntersArea:
            return "path_enters_area";
        case ConflictType::PathProximity:
            return "path_proximity";
    }
    return "unknown";
}

bool is_live(FlightStatus status) noexcept {
    return status == FlightStatus::Pending || status == FlightStatus::Approved || status == FlightStatus::Active;
}

bool is_terminal(FlightStatus status) noexcept {
    return !is_live(status);
}

bool is_allowed_transition(FlightStatus from, FlightStatus to) noexcept {
    switch (to) {
        case FlightStatus::Approved:
            return from == FlightStatus::Pending;
        case FlightStatus::Active:
            return from == FlightStatus::Approved;
        case FlightStatus::Completed:
            return from == FlightStatus::Active;
        case FlightStatus::Cancelled:
            return is_live(from);
        case FlightStatus::Pending:
        case FlightStatus::Rejected:
            return false;
    }
    return false;
}

void require_valid_request(const FlightRequest& request) {
    const bool has_path = !request.waypoints.empty();
    const bool has_area = request.operation_area.has_value();
    if (has_path == has_area) {
        throw InputError("Flight request must carry either waypoints or an operation area, not both or neither");
    }

    if (has_area) {
        require_valid_area(*request.operation_area);
    } else {
        std::vector<int> orders;
        orders.reserve(request.waypoints.size());
        for (std::size_t index = 0; index < request.waypoints.size(); ++index) {
            const Waypoint& waypoint = request.waypoints[index];
            require_valid_point(waypoint.point, fmt::format("Waypoint {}", index + 1));
            if (!std::isfinite(waypoint.altitude_m) || waypoint.altitude_m < 0.0) {
                throw InputError(fmt::format("Waypoint {} altitude must be non-negative", index + 1));
            }
            orders.push_back(waypoint.order);
        }
        std::sort(orders.begin(), orders.end());
        for (std::size_t index = 1; index < orders.size(); ++index) {
            if (orders[index] == orders[index - 1]) {
                throw InputError(fmt::format("Duplicate waypoint order {}", orders[index]));
            }
            if (orders[index] != orders[index - 1] + 1) {
                throw InputError(fmt::format("Waypoint orders are not contiguous between {} and {}", orders[index - 1], orders[index]));
            }
        }
    }

    if (!(request.scheduled_start < request.scheduled_end)) {
        throw InputError("Scheduled start must precede scheduled end");
    }
    if (!std::isfinite(request.max_altitude_m) || request.max_altitude_m <= 0.0) {
        throw InputError("Maximum altitude must be positive");
    }
}

FlightPlan plan_from_request(const FlightRequest& request) {
    FlightPlan plan{};
    plan.waypoints = ordered_waypoints(request.waypoints);
    plan.operation_area = request.operation_area;
    plan.time_window = request.time_window();
    plan.max_altitude_m = request.max_altitude_m;
    plan.estimated_distance_m = path_length_m(plan.waypoints);
    return plan;
}

std::vector<Waypoint> ordered_waypoints(std::vector<Waypoint> waypoints) {
    std::sort(waypoints.begin(), waypoints.end(), [](const Waypoint& lhs, const Waypoint& rhs) {
        return lhs.order < rhs.order;
    });
    return waypoints;
}

double path_length_m(const std::vector<Waypoint>& waypoints) noexcept {
    double total_m = 0.0;
    for (std::size_t index = 1; index < waypoints.size(); ++index) {
        total_m += haversine_distance_m(waypoints[index - 1].point, waypoints[index].point);
    }
    return total_m;
}

}  // namespace airspace
