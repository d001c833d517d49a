// === Flight Registry =========================================================
//
// Authoritative store of flight plans keyed by flight id, including rejected
// plans kept for audit. Not internally synchronized: its single owner,
// AdmissionService, serializes every call under the admission mutex.

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "airspace/flight_plan.hpp"
#include "airspace/logging.hpp"

namespace airspace {

class FlightRegistry final {
  public:
    FlightRegistry();

    /** @brief Store a new plan; throws InputError when the id already exists. */
    void insert(FlightPlan plan);

    /**
     * @brief Move a plan to @p new_status, recording the change in its history.
     *
     * @return false when the id is unknown or the lifecycle forbids the transition.
     */
    bool update_status(const std::string& flight_id, FlightStatus new_status, TimePoint now, const std::string& reason);

    /** @brief Erase a plan entirely. */
    bool remove(const std::string& flight_id);

    [[nodiscard]] std::optional<FlightPlan> find(const std::string& flight_id) const;

    /** @brief Live plans (pending/approved/active) whose window overlaps @p window. */
    [[nodiscard]] std::vector<FlightPlan> active_conflict_candidates(const TimeWindow& window) const;

    /**
     * @brief Wall-clock sweep: approved -> active once started, active -> completed once ended.
     *
     * A plan passing through both transitions in one sweep is counted once.
     */
    std::size_t advance_lifecycle(TimePoint now);

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t count_with_status(FlightStatus status) const noexcept;

  private:
    static void record_transition(FlightPlan& plan, FlightStatus new_status, TimePoint now, const std::string& reason);

    std::map<std::string, FlightPlan> map_flights_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace airspace
