#include "airspace/admission_validator.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

#include <fmt/format.h>

namespace airspace {

namespace {
constexpr char k_border_check[] = "border_check";
constexpr char k_area_border_check[] = "area_border_check";
constexpr char k_path_border_check[] = "path_border_check";
constexpr char k_altitude_check[] = "altitude_check";
constexpr char k_zone_check[] = "zone_check";
constexpr char k_time_check[] = "time_check";
constexpr char k_daylight_check[] = "daylight_check";
constexpr char k_traffic_conflict[] = "traffic_conflict";

ValidationCheck make_check(const char* name, bool passed, std::string message, CheckSeverity severity) {
    return ValidationCheck{name, passed, std::move(message), severity, std::nullopt};
}

/** @brief Labelled points a zone classification runs against: area samples, or waypoints plus the samples of each leg. */
std::vector<std::pair<std::string, GeoPoint>> zone_sample_points(const FlightPlan& candidate, const PathSampler& sampler, double spacing_m) {
    std::vector<std::pair<std::string, GeoPoint>> list_points;
    if (candidate.is_area_flight()) {
        const std::vector<GeoPoint> samples = sampler.sample_area(*candidate.operation_area);
        for (std::size_t index = 0; index < samples.size(); ++index) {
            list_points.emplace_back(index == 0 ? std::string{"Area center"} : fmt::format("Area perimeter point {}", index), samples[index]);
        }
        return list_points;
    }
    for (std::size_t index = 0; index < candidate.waypoints.size(); ++index) {
        list_points.emplace_back(fmt::format("Waypoint {}", index + 1), candidate.waypoints[index].point);
        if (index + 1 == candidate.waypoints.size()) {
            break;
        }
        const std::vector<GeoPoint> leg = sampler.sample_segment(candidate.waypoints[index].point, candidate.waypoints[index + 1].point, spacing_m);
        const std::string label = fmt::format("Path between waypoints {} and {}", index + 1, index + 2);
        // Endpoints are the waypoints themselves.
        for (std::size_t sample = 1; sample + 1 < leg.size(); ++sample) {
            list_points.emplace_back(label, leg[sample]);
        }
    }
    return list_points;
}
}  // namespace

AdmissionValidator::AdmissionValidator(
    const BorderGeometry& border,
    const ZoneRegistry& zones,
    const PathSampler& sampler,
    const ConflictIndex& conflicts,
    RegulatoryLimits limits
)
    : border_(border),
      zones_(zones),
      sampler_(sampler),
      conflicts_(conflicts),
      limits_(limits),
      logger_(get_logger()) {
    if (!(limits_.max_altitude_agl_m > 0.0)) {
        throw InputError("Regulatory altitude ceiling must be positive");
    }
    if (limits_.daylight_start_hour < 0 || limits_.daylight_end_hour > 24 || limits_.daylight_start_hour >= limits_.daylight_end_hour) {
        throw InputError("Daylight window must satisfy 0 <= start < end <= 24");
    }
}

ValidationReport AdmissionValidator::validate(const FlightRequest& request, TimePoint now) const {
    require_valid_request(request);
    return validate_candidate(plan_from_request(request), now);
}

ValidationReport AdmissionValidator::validate_candidate(const FlightPlan& candidate, TimePoint now) const {
    ValidationReport report{};
    report.validated_at = now;

    check_border(candidate, report.checks);
    check_path_border(candidate, report.checks);
    check_altitude(candidate, report.checks);
    check_zones(candidate, report.checks);
    check_time(candidate, now, report.checks);
    check_daylight(candidate, report.checks);
    check_conflicts(candidate, report.checks);

    report.is_valid = std::none_of(report.checks.begin(), report.checks.end(), [](const ValidationCheck& check) {
        return check.severity == CheckSeverity::Error && !check.passed;
    });

    const auto error_count = std::count_if(report.checks.begin(), report.checks.end(), [](const ValidationCheck& check) {
        return check.severity == CheckSeverity::Error;
    });
    const auto warning_count = std::count_if(report.checks.begin(), report.checks.end(), [](const ValidationCheck& check) {
        return check.severity == CheckSeverity::Warning;
    });
    logger_->debug(
        R"({{"component":"validator","flight":"{}","valid":{},"errors":{},"warnings":{}}})",
        candidate.flight_number,
        report.is_valid ? "true" : "false",
        error_count,
        warning_count
    );
    return report;
}

const RegulatoryLimits& AdmissionValidator::limits() const noexcept {
    return limits_;
}

void AdmissionValidator::check_border(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const {
    if (candidate.is_area_flight()) {
        if (border_.is_inside(candidate.operation_area->center())) {
            checks.push_back(make_check(k_area_border_check, true, "Operation area within the border", CheckSeverity::Info));
        } else {
            checks.push_back(make_check(k_area_border_check, false, "Operation area center is outside the border", CheckSeverity::Error));
        }
        return;
    }

    bool all_inside = true;
    for (std::size_t index = 0; index < candidate.waypoints.size(); ++index) {
        if (border_.is_inside(candidate.waypoints[index].point)) {
            continue;
        }
        all_inside = false;
        checks.push_back(make_check(k_border_check, false, fmt::format("Waypoint {} is outside the border", index + 1), CheckSeverity::Error));
    }
    if (all_inside) {
        checks.push_back(make_check(k_border_check, true, "All waypoints within the border", CheckSeverity::Info));
    }
}

void AdmissionValidator::check_path_border(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const {
    if (candidate.is_area_flight() || candidate.waypoints.size() < 2) {
        return;
    }
    bool path_inside = true;
    for (std::size_t index = 1; index < candidate.waypoints.size(); ++index) {
        const auto optional_exit = sampler_.crosses_border(candidate.waypoints[index - 1].point, candidate.waypoints[index].point);
        if (!optional_exit.has_value()) {
            continue;
        }
        path_inside = false;
        checks.push_back(make_check(
            k_path_border_check,
            false,
            fmt::format(
                "Path between waypoints {} and {} leaves the border near ({:.5f}, {:.5f})",
                index,
                index + 1,
                optional_exit->latitude_deg,
                optional_exit->longitude_deg
            ),
            CheckSeverity::Error
        ));
    }
    if (path_inside) {
        checks.push_back(make_check(k_path_border_check, true, "Flight path stays within the border", CheckSeverity::Info));
    }
}

void AdmissionValidator::check_altitude(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const {
    if (candidate.max_altitude_m > limits_.max_altitude_agl_m) {
        checks.push_back(make_check(
            k_altitude_check,
            false,
            fmt::format("Maximum altitude {}m exceeds legal limit of {}m AGL", candidate.max_altitude_m, limits_.max_altitude_agl_m),
            CheckSeverity::Error
        ));
        return;
    }
    checks.push_back(make_check(
        k_altitude_check,
        true,
        fmt::format("Altitude {}m within legal limits", candidate.max_altitude_m),
        CheckSeverity::Info
    ));
}

void AdmissionValidator::check_zones(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const {
    // One finding per zone and outcome, however many sample points hit it.
    std::set<std::pair<std::string, CheckSeverity>> set_reported;
    for (const auto& [label, point] : zone_sample_points(candidate, sampler_, conflicts_.config().sample_spacing_m)) {
        const ZoneClassification classification = zones_.classify(point);
        if (classification.severity == ZoneSeverity::None) {
            continue;
        }

        ValidationCheck check{};
        check.name = k_zone_check;
        if (classification.severity == ZoneSeverity::NoFly) {
            check.passed = false;
            check.severity = CheckSeverity::Error;
            check.message = fmt::format("{} lies inside no-fly zone {} ({})", label, classification.zone_name, classification.zone_type);
        } else if (classification.altitude_cap_m.has_value() && candidate.max_altitude_m > *classification.altitude_cap_m) {
            check.passed = false;
            check.severity = CheckSeverity::Error;
            check.message = fmt::format(
                "{} lies inside {} where altitude is capped at {}m; requested {}m",
                label,
                classification.zone_name,
                *classification.altitude_cap_m,
                candidate.max_altitude_m
            );
        } else if (classification.altitude_cap_m.has_value()) {
            check.passed = true;
            check.severity = CheckSeverity::Warning;
            check.message = fmt::format("{}: maximum altitude {}m in this area", classification.zone_name, *classification.altitude_cap_m);
        } else {
            check.passed = true;
            check.severity = CheckSeverity::Warning;
            check.message = fmt::format(
                "{} is within the caution radius of {} ({:.0f}m away)",
                label,
                classification.zone_name,
                classification.distance_m
            );
        }

        if (!set_reported.emplace(classification.zone_name, check.severity).second) {
            continue;
        }
        checks.push_back(std::move(check));
    }

    if (set_reported.empty()) {
        checks.push_back(make_check(k_zone_check, true, "No restricted zone violations", CheckSeverity::Info));
    }
}

void AdmissionValidator::check_time(const FlightPlan& candidate, TimePoint now, std::vector<ValidationCheck>& checks) const {
    if (candidate.time_window.start < now) {
        checks.push_back(make_check(k_time_check, false, "Scheduled start time is in the past", CheckSeverity::Error));
        return;
    }
    checks.push_back(make_check(k_time_check, true, "Flight scheduled for future time", CheckSeverity::Info));
}

void AdmissionValidator::check_daylight(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const {
    const TimePoint local_start = candidate.time_window.start + limits_.utc_offset;
    const auto local_day = std::chrono::floor<std::chrono::days>(local_start);
    const auto local_hour = std::chrono::duration_cast<std::chrono::hours>(local_start - local_day).count();
    const bool within_window = local_hour >= limits_.daylight_start_hour && local_hour <= limits_.daylight_end_hour;
    if (!within_window) {
        checks.push_back(make_check(
            k_daylight_check,
            false,
            fmt::format("Regulations require daylight operations ({:02}:00-{:02}:00)", limits_.daylight_start_hour, limits_.daylight_end_hour),
            CheckSeverity::Warning
        ));
        return;
    }
    checks.push_back(make_check(k_daylight_check, true, "Flight scheduled during daylight hours", CheckSeverity::Info));
}

void AdmissionValidator::check_conflicts(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const {
    const std::vector<ConflictRecord> list_conflicts = conflicts_.find_conflicts(candidate, candidate.flight_id.empty()
        ? std::nullopt
        : std::optional<std::string>{candidate.flight_id});
    if (list_conflicts.empty()) {
        checks.push_back(make_check(k_traffic_conflict, true, "No traffic conflicts detected - airspace clear", CheckSeverity::Info));
        return;
    }
    for (const ConflictRecord& conflict : list_conflicts) {
        ValidationCheck check = make_check(
            k_traffic_conflict,
            false,
            fmt::format(
                "CONFLICT with flight {}: {} ({}m separation)",
                conflict.other_flight_number,
                to_string(conflict.conflict_type),
                std::lround(conflict.min_distance_m)
            ),
            CheckSeverity::Error
        );
        check.conflict = conflict;
        checks.push_back(std::move(check));
    }
}

}  // namespace airspace
