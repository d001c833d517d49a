// === Conflict Index ==========================================================
//
// Finds registered flights that overlap a candidate in time, altitude and
// space. Cost is O(N * S1 * S2) over live flights and per-flight sample
// counts; beyond a few dozen concurrent flights this needs a spatial index and
// an interval tree over time windows.

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "airspace/flight_plan.hpp"
#include "airspace/flight_registry.hpp"
#include "airspace/logging.hpp"
#include "airspace/path_sampler.hpp"

namespace airspace {

/** @brief Separation minima and sampling knobs used by the conflict search. */
struct SeparationConfig final {
    double min_vertical_separation_m{30.0};
    double min_horizontal_separation_m{200.0};
    double bounds_buffer_deg{0.005};  /**< About 550 m, added around each bounding box. */
    double sample_spacing_m{k_default_sample_spacing_m};
};

class ConflictIndex final {
  public:
    ConflictIndex(const FlightRegistry& registry, const PathSampler& sampler, SeparationConfig config);

    /** @brief One record per live flight conflicting with @p candidate, skipping @p exclude_id. */
    [[nodiscard]] std::vector<ConflictRecord> find_conflicts(
        const FlightPlan& candidate,
        const std::optional<std::string>& exclude_id = std::nullopt
    ) const;

    [[nodiscard]] const SeparationConfig& config() const noexcept;

  private:
    /** @brief Detailed spatial test once time, altitude and bounds overlap. */
    [[nodiscard]] std::optional<ConflictRecord> spatial_conflict(const FlightPlan& candidate, const FlightPlan& other) const;
    [[nodiscard]] bool path_enters_area(const std::vector<Waypoint>& waypoints, const OperationArea& area) const;

    const FlightRegistry& registry_;
    const PathSampler& sampler_;
    SeparationConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace airspace
