// === Admission Service =======================================================
//
// Transport-agnostic entry point of the engine. Owns the flight registry and
// the single admission mutex: every public operation runs under that mutex, so
// "check conflicts, then insert" is atomic with respect to other submissions,
// cancellations and maintenance sweeps.

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "airspace/admission_validator.hpp"
#include "airspace/border_geometry.hpp"
#include "airspace/configuration.hpp"
#include "airspace/conflict_index.hpp"
#include "airspace/flight_registry.hpp"
#include "airspace/logging.hpp"
#include "airspace/path_sampler.hpp"
#include "airspace/zone_registry.hpp"

namespace airspace {

/** @brief Outcome of a submission. */
struct SubmissionResult final {
    std::string flight_id{};
    std::string flight_number{};
    FlightStatus status{FlightStatus::Rejected};
    ValidationReport validation_report{};
};

/** @brief Static-airspace answer for a single point. */
struct PointReport final {
    bool inside_border{};
    ZoneClassification classification{};
    std::optional<NearestAirport> nearest_airport{};
};

/** @brief Registry counts per lifecycle status. */
struct FlightStatistics final {
    std::size_t total{};
    std::size_t pending{};
    std::size_t approved{};
    std::size_t active{};
    std::size_t completed{};
    std::size_t cancelled{};
    std::size_t rejected{};
};

class AdmissionService final {
  public:
    AdmissionService(
        BorderGeometry border,
        ZoneRegistry zones,
        RegulatoryLimits limits,
        SeparationConfig separation,
        std::string flight_number_prefix
    );

    /** @brief Wire the service from a loaded configuration. */
    explicit AdmissionService(const Configuration& configuration);

    AdmissionService(const AdmissionService&) = delete;
    AdmissionService& operator=(const AdmissionService&) = delete;

    /**
     * @brief Validate and record a flight; valid plans become pending, others rejected.
     *
     * Throws InputError for malformed requests, in which case nothing is stored.
     */
    SubmissionResult submit_flight(const FlightRequest& request, TimePoint now);
    SubmissionResult submit_flight(const FlightRequest& request);

    [[nodiscard]] std::vector<FlightPlan> list_active_conflict_candidates(const TimeWindow& window) const;

    /** @brief Maintenance sweep; returns the number of flights transitioned. */
    std::size_t tick(TimePoint now);

    bool cancel_flight(const std::string& flight_id, TimePoint now);
    bool cancel_flight(const std::string& flight_id);

    /** @brief Authority decision moving a pending flight to approved. */
    bool approve_flight(const std::string& flight_id, TimePoint now);
    bool approve_flight(const std::string& flight_id);

    [[nodiscard]] std::optional<FlightPlan> find_flight(const std::string& flight_id) const;
    [[nodiscard]] std::size_t flight_count() const;
    [[nodiscard]] FlightStatistics statistics() const;

    /** @brief Border, zone and nearest-airport lookup; touches no flight state. */
    [[nodiscard]] PointReport check_point(const GeoPoint& point) const;

    [[nodiscard]] const BorderGeometry& border() const noexcept;
    [[nodiscard]] const ZoneRegistry& zones() const noexcept;

  private:
    [[nodiscard]] std::string next_flight_number(TimePoint now);

    BorderGeometry border_;
    ZoneRegistry zones_;
    PathSampler sampler_;
    FlightRegistry registry_;
    ConflictIndex conflict_index_;
    AdmissionValidator validator_;
    std::string str_flight_number_prefix_;
    std::uint64_t sequence_{0};
    mutable std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace airspace
