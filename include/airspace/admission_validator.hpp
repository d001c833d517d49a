// === Admission Validator =====================================================
//
// Runs every regulatory check against a candidate flight and folds them into
// a single verdict plus an itemized report. Checks never short-circuit, so the
// caller always receives the full list of passed, warned and failed checks.

#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "airspace/border_geometry.hpp"
#include "airspace/conflict_index.hpp"
#include "airspace/flight_plan.hpp"
#include "airspace/logging.hpp"
#include "airspace/path_sampler.hpp"
#include "airspace/zone_registry.hpp"

namespace airspace {

/** @brief Regulatory constants applied to every submission. */
struct RegulatoryLimits final {
    double max_altitude_agl_m{120.0};
    int daylight_start_hour{6};
    int daylight_end_hour{20};
    std::chrono::minutes utc_offset{std::chrono::hours{1}};  /**< Local time = UTC + offset. */
};

class AdmissionValidator final {
  public:
    AdmissionValidator(
        const BorderGeometry& border,
        const ZoneRegistry& zones,
        const PathSampler& sampler,
        const ConflictIndex& conflicts,
        RegulatoryLimits limits
    );

    /** @brief Validate a raw request; throws InputError for malformed input. */
    [[nodiscard]] ValidationReport validate(const FlightRequest& request, TimePoint now) const;

    /** @brief Validate an already well-formed candidate plan. */
    [[nodiscard]] ValidationReport validate_candidate(const FlightPlan& candidate, TimePoint now) const;

    [[nodiscard]] const RegulatoryLimits& limits() const noexcept;

  private:
    void check_border(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const;
    void check_path_border(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const;
    void check_altitude(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const;
    void check_zones(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const;
    void check_time(const FlightPlan& candidate, TimePoint now, std::vector<ValidationCheck>& checks) const;
    void check_daylight(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const;
    void check_conflicts(const FlightPlan& candidate, std::vector<ValidationCheck>& checks) const;

    const BorderGeometry& border_;
    const ZoneRegistry& zones_;
    const PathSampler& sampler_;
    const ConflictIndex& conflicts_;
    RegulatoryLimits limits_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace airspace
