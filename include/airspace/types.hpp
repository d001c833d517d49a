// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight geometry structs used throughout
// the admission engine (wall-clock time primitives, geographic points, operation
// areas, waypoints) plus the exception type raised for malformed input.

#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <variant>

namespace airspace {

/**
 * @brief Alias for the wall clock used to schedule flights.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Alias for wall-clock instants.
 */
using TimePoint = SystemClock::time_point;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Raised when a request or static definition is structurally invalid.
 *
 * Distinct from a regulatory rejection: nothing is stored when this is thrown.
 */
class InputError final : public std::invalid_argument {
  public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeoPoint final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */

    bool operator==(const GeoPoint&) const = default;
};

/**
 * @brief Circular operation area.
 */
struct Circle final {
    GeoPoint center{};  /**< Center of the circle. */
    double radius_m{};  /**< Radius in metres, strictly positive. */
};

/**
 * @brief Axis-aligned latitude/longitude rectangle.
 */
struct Rectangle final {
    double north_deg{};
    double south_deg{};
    double east_deg{};
    double west_deg{};
};

/**
 * @brief Tagged operation area flown instead of a waypoint path.
 */
struct OperationArea final {
    std::variant<Circle, Rectangle> shape{};

    /** @brief Circle center, or the rectangle midpoint. */
    [[nodiscard]] GeoPoint center() const;
    [[nodiscard]] bool is_circle() const noexcept;
};

/**
 * @brief A single ordered point of a waypoint path.
 */
struct Waypoint final {
    GeoPoint point{};     /**< Position of the waypoint. */
    double altitude_m{};  /**< Planned altitude above ground level in metres. */
    int order{};          /**< Position in the path; unique and contiguous per flight. */
};

/**
 * @brief Half-open time interval [start, end).
 */
struct TimeWindow final {
    TimePoint start{};
    TimePoint end{};

    /** @brief Half-open intersection test. */
    [[nodiscard]] bool overlaps(const TimeWindow& other) const noexcept {
        return start < other.end && end > other.start;
    }
};

/** @brief Validate that a point carries finite, in-range coordinates. */
void require_valid_point(const GeoPoint& point, const std::string& context);

/** @brief Validate circle/rectangle invariants; throws InputError. */
void require_valid_area(const OperationArea& area);

}  // namespace airspace
