// === Flight Plan =============================================================
//
// Flight requests as submitted, the admitted/rejected plans stored by the
// registry, their lifecycle status, and the itemized validation report.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "airspace/types.hpp"

namespace airspace {

/**
 * @brief Lifecycle states of a flight plan.
 */
enum class FlightStatus {
    Pending,    /**< Admitted; reserves airspace until decided by the authority. */
    Approved,   /**< Approved by the authority, not yet started. */
    Active,     /**< Scheduled start has passed. */
    Completed,  /**< Scheduled end has passed. Terminal. */
    Cancelled,  /**< Withdrawn by the owner. Terminal. */
    Rejected    /**< Failed validation; kept for audit only. Terminal. */
};

enum class CheckSeverity {
    Info,
    Warning,
    Error
};

enum class ConflictType {
    AreaOverlap,     /**< Two operation areas overlap. */
    PathEntersArea,  /**< A waypoint path enters an operation area. */
    PathProximity    /**< Two waypoint paths come within the horizontal minimum. */
};

/** @brief One flight found in conflict with a candidate. */
struct ConflictRecord final {
    std::string other_flight_id{};
    std::string other_flight_number{};
    double min_distance_m{};
    ConflictType conflict_type{ConflictType::PathProximity};

    bool operator==(const ConflictRecord&) const = default;
};

/** @brief A single named check within a validation report. */
struct ValidationCheck final {
    std::string name{};
    bool passed{};
    std::string message{};
    CheckSeverity severity{CheckSeverity::Info};
    std::optional<ConflictRecord> conflict{};

    bool operator==(const ValidationCheck&) const = default;
};

/** @brief Verdict plus every check that ran. */
struct ValidationReport final {
    bool is_valid{};
    std::vector<ValidationCheck> checks{};
    TimePoint validated_at{};
};

/**
 * @brief Submission payload: either a waypoint path or an operation area.
 */
struct FlightRequest final {
    std::vector<Waypoint> waypoints{};
    std::optional<OperationArea> operation_area{};
    TimePoint scheduled_start{};
    TimePoint scheduled_end{};
    double max_altitude_m{};

    [[nodiscard]] TimeWindow time_window() const noexcept {
        return TimeWindow{scheduled_start, scheduled_end};
    }
};

/** @brief Entry of a plan's status audit trail. */
struct StatusChange final {
    FlightStatus status{FlightStatus::Pending};
    TimePoint changed_at{};
    std::string reason{};
};

/**
 * @brief A stored flight: the request geometry plus identity, status and report.
 */
struct FlightPlan final {
    std::string flight_id{};
    std::string flight_number{};
    std::vector<Waypoint> waypoints{};           /**< Sorted by order; empty for area flights. */
    std::optional<OperationArea> operation_area{};
    TimeWindow time_window{};
    double max_altitude_m{};
    FlightStatus status{FlightStatus::Pending};
    ValidationReport validation_report{};
    double estimated_distance_m{};
    TimePoint created_at{};
    std::vector<StatusChange> status_history{};

    [[nodiscard]] bool is_area_flight() const noexcept {
        return operation_area.has_value();
    }
};

[[nodiscard]] const char* to_string(FlightStatus status) noexcept;
[[nodiscard]] const char* to_string(CheckSeverity severity) noexcept;
[[nodiscard]] const char* to_string(ConflictType type) noexcept;

/** @brief True for pending, approved and active plans. */
[[nodiscard]] bool is_live(FlightStatus status) noexcept;
/** @brief True for completed, cancelled and rejected plans. */
[[nodiscard]] bool is_terminal(FlightStatus status) noexcept;
/** @brief Whether the lifecycle allows moving from @p from to @p to. */
[[nodiscard]] bool is_allowed_transition(FlightStatus from, FlightStatus to) noexcept;

/**
 * @brief Reject structurally invalid requests with InputError.
 *
 * Checks: exactly one of waypoints/area, finite in-range coordinates, waypoint
 * altitudes >= 0, orders unique and contiguous, area geometry, start < end and
 * a positive max altitude.
 */
void require_valid_request(const FlightRequest& request);

/**
 * @brief Draft plan carrying the request geometry, waypoints sorted by order.
 *
 * Identity, status and report are left for the caller to fill in.
 */
[[nodiscard]] FlightPlan plan_from_request(const FlightRequest& request);

/** @brief Waypoints sorted by their order field. */
[[nodiscard]] std::vector<Waypoint> ordered_waypoints(std::vector<Waypoint> waypoints);

/** @brief Sum of haversine leg lengths along the ordered path. */
[[nodiscard]] double path_length_m(const std::vector<Waypoint>& waypoints) noexcept;

}  // namespace airspace
