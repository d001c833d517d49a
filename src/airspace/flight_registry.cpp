#include "airspace/flight_registry.hpp"

#include <algorithm>
#include <utility>

namespace airspace {

FlightRegistry::FlightRegistry()
    : logger_(get_logger()) {}

void FlightRegistry::insert(FlightPlan plan) {
    if (plan.flight_id.empty()) {
        throw InputError("Flight plan requires an identifier");
    }
    if (map_flights_.contains(plan.flight_id)) {
        throw InputError("Flight " + plan.flight_id + " is already registered");
    }
    if (plan.status_history.empty()) {
        plan.status_history.push_back(StatusChange{plan.status, plan.created_at, "submitted"});
    }
    logger_->debug("Registering flight {} ({}) as {}", plan.flight_id, plan.flight_number, to_string(plan.status));
    const std::string flight_id = plan.flight_id;
    map_flights_.emplace(flight_id, std::move(plan));
}

bool FlightRegistry::update_status(const std::string& flight_id, FlightStatus new_status, TimePoint now, const std::string& reason) {
    const auto iterator_flight = map_flights_.find(flight_id);
    if (iterator_flight == map_flights_.end()) {
        logger_->warn("Status update for unknown flight {}", flight_id);
        return false;
    }
    FlightPlan& plan = iterator_flight->second;
    if (!is_allowed_transition(plan.status, new_status)) {
        logger_->warn(
            R"({{"component":"registry","flight":"{}","rejected_transition":"{}->{}"}})",
            flight_id,
            to_string(plan.status),
            to_string(new_status)
        );
        return false;
    }
    record_transition(plan, new_status, now, reason);
    return true;
}

bool FlightRegistry::remove(const std::string& flight_id) {
    return map_flights_.erase(flight_id) > 0;
}

std::optional<FlightPlan> FlightRegistry::find(const std::string& flight_id) const {
    const auto iterator_flight = map_flights_.find(flight_id);
    if (iterator_flight == map_flights_.end()) {
        return std::nullopt;
    }
    return iterator_flight->second;
}

std::vector<FlightPlan> FlightRegistry::active_conflict_candidates(const TimeWindow& window) const {
    std::vector<FlightPlan> list_candidates;
    for (const auto& [flight_id, plan] : map_flights_) {
        if (!is_live(plan.status)) {
            continue;
        }
        if (!window.overlaps(plan.time_window)) {
            continue;
        }
        list_candidates.push_back(plan);
    }
    return list_candidates;
}

std::size_t FlightRegistry::advance_lifecycle(TimePoint now) {
    std::size_t transitioned_count = 0;
    for (auto& [flight_id, plan] : map_flights_) {
        bool transitioned = false;
        if (plan.status == FlightStatus::Approved && plan.time_window.start <= now) {
            record_transition(plan, FlightStatus::Active, now, "scheduled start reached");
            transitioned = true;
        }
        if (plan.status == FlightStatus::Active && plan.time_window.end <= now) {
            record_transition(plan, FlightStatus::Completed, now, "scheduled end reached");
            transitioned = true;
        }
        if (transitioned) {
            logger_->info(
                R"({{"component":"registry","flight":"{}","status":"{}"}})",
                flight_id,
                to_string(plan.status)
            );
            ++transitioned_count;
        }
    }
    return transitioned_count;
}

std::size_t FlightRegistry::size() const noexcept {
    return map_flights_.size();
}

std::size_t FlightRegistry::count_with_status(FlightStatus status) const noexcept {
    return static_cast<std::size_t>(std::count_if(map_flights_.begin(), map_flights_.end(), [status](const auto& entry) {
        return entry.second.status == status;
    }));
}

void FlightRegistry::record_transition(FlightPlan& plan, FlightStatus new_status, TimePoint now, const std::string& reason) {
    plan.status = new_status;
    plan.status_history.push_back(StatusChange{new_status, now, reason});
}

}  // namespace airspace
