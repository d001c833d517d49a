#include "airspace/conflict_index.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "airspace/geodesy.hpp"

namespace airspace {

ConflictIndex::ConflictIndex(const FlightRegistry& registry, const PathSampler& sampler, SeparationConfig config)
    : registry_(registry),
      sampler_(sampler),
      config_(config),
      logger_(get_logger()) {
    if (!(config_.min_vertical_separation_m > 0.0) || !(config_.min_horizontal_separation_m > 0.0)) {
        throw InputError("Separation minima must be positive");
    }
    if (!(config_.sample_spacing_m > 0.0) || config_.bounds_buffer_deg < 0.0) {
        throw InputError("Sample spacing must be positive and the bounds buffer non-negative");
    }
}

std::vector<ConflictRecord> ConflictIndex::find_conflicts(
    const FlightPlan& candidate,
    const std::optional<std::string>& exclude_id
) const {
    std::vector<ConflictRecord> list_conflicts;
    const GeoBounds candidate_bounds = PathSampler::flight_bounds(candidate);

    for (const FlightPlan& other : registry_.active_conflict_candidates(candidate.time_window)) {
        if (exclude_id.has_value() && other.flight_id == *exclude_id) {
            continue;
        }
        if (std::abs(candidate.max_altitude_m - other.max_altitude_m) >= config_.min_vertical_separation_m) {
            continue;
        }
        if (!candidate_bounds.overlaps(PathSampler::flight_bounds(other), config_.bounds_buffer_deg)) {
            continue;
        }
        std::optional<ConflictRecord> optional_conflict = spatial_conflict(candidate, other);
        if (!optional_conflict.has_value()) {
            continue;
        }
        logger_->info(
            R"({{"component":"conflict_index","candidate":"{}","other":"{}","type":"{}","min_distance_m":{:.1f}}})",
            candidate.flight_number,
            other.flight_number,
            to_string(optional_conflict->conflict_type),
            optional_conflict->min_distance_m
        );
        list_conflicts.push_back(std::move(*optional_conflict));
    }
    return list_conflicts;
}

const SeparationConfig& ConflictIndex::config() const noexcept {
    return config_;
}

std::optional<ConflictRecord> ConflictIndex::spatial_conflict(const FlightPlan& candidate, const FlightPlan& other) const {
    ConflictRecord record{other.flight_id, other.flight_number, 0.0, ConflictType::AreaOverlap};

    if (candidate.is_area_flight() && other.is_area_flight()) {
        const auto* circle_a = std::get_if<Circle>(&candidate.operation_area->shape);
        const auto* circle_b = std::get_if<Circle>(&other.operation_area->shape);
        if (circle_a != nullptr && circle_b != nullptr) {
            const double center_distance_m = haversine_distance_m(circle_a->center, circle_b->center);
            if (center_distance_m >= circle_a->radius_m + circle_b->radius_m) {
                return std::nullopt;
            }
            record.min_distance_m = center_distance_m;
            return record;
        }
        // A rectangle is involved: the buffered bounds overlap already established is the conflict.
        return record;
    }

    if (candidate.is_area_flight() || other.is_area_flight()) {
        const FlightPlan& area_flight = candidate.is_area_flight() ? candidate : other;
        const FlightPlan& path_flight = candidate.is_area_flight() ? other : candidate;
        if (!path_enters_area(path_flight.waypoints, *area_flight.operation_area)) {
            return std::nullopt;
        }
        record.conflict_type = ConflictType::PathEntersArea;
        return record;
    }

    const std::vector<GeoPoint> samples_candidate = sampler_.sample_path(candidate.waypoints, config_.sample_spacing_m);
    const std::vector<GeoPoint> samples_other = sampler_.sample_path(other.waypoints, config_.sample_spacing_m);
    double min_distance_m = std::numeric_limits<double>::infinity();
    for (const GeoPoint& sample_a : samples_candidate) {
        for (const GeoPoint& sample_b : samples_other) {
            min_distance_m = std::min(min_distance_m, haversine_distance_m(sample_a, sample_b));
        }
    }
    if (!(min_distance_m < config_.min_horizontal_separation_m)) {
        return std::nullopt;
    }
    record.min_distance_m = min_distance_m;
    record.conflict_type = ConflictType::PathProximity;
    return record;
}

bool ConflictIndex::path_enters_area(const std::vector<Waypoint>& waypoints, const OperationArea& area) const {
    for (const GeoPoint& sample : sampler_.sample_path(waypoints, config_.sample_spacing_m)) {
        if (PathSampler::is_point_in_area(sample, area)) {
            return true;
        }
    }
    return false;
}

}  // namespace airspace
