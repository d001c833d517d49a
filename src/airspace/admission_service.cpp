#include "airspace/admission_service.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace airspace {

namespace {
constexpr char k_base36_digits[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
constexpr std::size_t k_timestamp_chars{6};
constexpr std::size_t k_sequence_chars{3};

/** @brief Uppercase base-36 rendering of @p value, keeping the last @p width digits (zero padded). */
std::string to_base36(std::uint64_t value, std::size_t width) {
    std::string digits(width, '0');
    for (std::size_t index = width; index > 0; --index) {
        digits[index - 1] = k_base36_digits[value % 36];
        value /= 36;
    }
    return digits;
}
}  // namespace

AdmissionService::AdmissionService(
    BorderGeometry border,
    ZoneRegistry zones,
    RegulatoryLimits limits,
    SeparationConfig separation,
    std::string flight_number_prefix
)
    : border_(std::move(border)),
      zones_(std::move(zones)),
      sampler_(border_),
      registry_(),
      conflict_index_(registry_, sampler_, separation),
      validator_(border_, zones_, sampler_, conflict_index_, limits),
      str_flight_number_prefix_(std::move(flight_number_prefix)),
      logger_(get_logger()) {
    if (str_flight_number_prefix_.empty()) {
        throw InputError("Flight number prefix cannot be empty");
    }
    logger_->info(
        "Admission service ready: border_mode={} zones={} airports={}",
        border_.mode() == BorderMode::Polygon ? "polygon" : "bounding_box",
        zones_.zones().size(),
        zones_.airports().size()
    );
}

AdmissionService::AdmissionService(const Configuration& configuration)
    : AdmissionService(
          make_border_geometry(configuration),
          ZoneRegistry{configuration.restricted_zones, configuration.airports},
          configuration.limits,
          configuration.separation,
          configuration.flight_number_prefix
      ) {}

SubmissionResult AdmissionService::submit_flight(const FlightRequest& request, TimePoint now) {
    require_valid_request(request);

    std::scoped_lock lock(mutex_);
    FlightPlan plan = plan_from_request(request);
    plan.flight_id = fmt::format("flight-{}", sequence_ + 1);
    plan.flight_number = next_flight_number(now);
    plan.created_at = now;
    plan.validation_report = validator_.validate_candidate(plan, now);
    plan.status = plan.validation_report.is_valid ? FlightStatus::Pending : FlightStatus::Rejected;

    SubmissionResult result{plan.flight_id, plan.flight_number, plan.status, plan.validation_report};
    registry_.insert(std::move(plan));

    if (result.status == FlightStatus::Pending) {
        logger_->info(
            R"({{"component":"admission","flight":"{}","number":"{}","status":"pending"}})",
            result.flight_id,
            result.flight_number
        );
    } else {
        const auto failed_count = std::count_if(result.validation_report.checks.begin(), result.validation_report.checks.end(), [](const ValidationCheck& check) {
            return !check.passed && check.severity == CheckSeverity::Error;
        });
        logger_->warn(
            R"({{"component":"admission","flight":"{}","number":"{}","status":"rejected","failed_checks":{}}})",
            result.flight_id,
            result.flight_number,
            failed_count
        );
    }
    return result;
}

SubmissionResult AdmissionService::submit_flight(const FlightRequest& request) {
    return submit_flight(request, SystemClock::now());
}

std::vector<FlightPlan> AdmissionService::list_active_conflict_candidates(const TimeWindow& window) const {
    std::scoped_lock lock(mutex_);
    return registry_.active_conflict_candidates(window);
}

std::size_t AdmissionService::tick(TimePoint now) {
    std::scoped_lock lock(mutex_);
    const std::size_t transitioned_count = registry_.advance_lifecycle(now);
    if (transitioned_count > 0) {
        logger_->info("Maintenance sweep transitioned {} flights", transitioned_count);
    }
    return transitioned_count;
}

bool AdmissionService::cancel_flight(const std::string& flight_id, TimePoint now) {
    std::scoped_lock lock(mutex_);
    const bool cancelled = registry_.update_status(flight_id, FlightStatus::Cancelled, now, "cancelled by owner");
    if (cancelled) {
        logger_->info(R"({{"component":"admission","flight":"{}","status":"cancelled"}})", flight_id);
    }
    return cancelled;
}

bool AdmissionService::cancel_flight(const std::string& flight_id) {
    return cancel_flight(flight_id, SystemClock::now());
}

bool AdmissionService::approve_flight(const std::string& flight_id, TimePoint now) {
    std::scoped_lock lock(mutex_);
    const bool approved = registry_.update_status(flight_id, FlightStatus::Approved, now, "approved by authority");
    if (approved) {
        logger_->info(R"({{"component":"admission","flight":"{}","status":"approved"}})", flight_id);
    }
    return approved;
}

bool AdmissionService::approve_flight(const std::string& flight_id) {
    return approve_flight(flight_id, SystemClock::now());
}

std::optional<FlightPlan> AdmissionService::find_flight(const std::string& flight_id) const {
    std::scoped_lock lock(mutex_);
    return registry_.find(flight_id);
}

std::size_t AdmissionService::flight_count() const {
    std::scoped_lock lock(mutex_);
    return registry_.size();
}

FlightStatistics AdmissionService::statistics() const {
    std::scoped_lock lock(mutex_);
    FlightStatistics stats{};
    stats.total = registry_.size();
    stats.pending = registry_.count_with_status(FlightStatus::Pending);
    stats.approved = registry_.count_with_status(FlightStatus::Approved);
    stats.active = registry_.count_with_status(FlightStatus::Active);
    stats.completed = registry_.count_with_status(FlightStatus::Completed);
    stats.cancelled = registry_.count_with_status(FlightStatus::Cancelled);
    stats.rejected = registry_.count_with_status(FlightStatus::Rejected);
    return stats;
}

PointReport AdmissionService::check_point(const GeoPoint& point) const {
    require_valid_point(point, "Checked point");
    return PointReport{border_.is_inside(point), zones_.classify(point), zones_.nearest_airport(point)};
}

const BorderGeometry& AdmissionService::border() const noexcept {
    return border_;
}

const ZoneRegistry& AdmissionService::zones() const noexcept {
    return zones_;
}

std::string AdmissionService::next_flight_number(TimePoint now) {
    ++sequence_;
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return fmt::format(
        "{}-{}-{}",
        str_flight_number_prefix_,
        to_base36(static_cast<std::uint64_t>(std::max<decltype(millis)>(millis, 0)), k_timestamp_chars),
        to_base36(sequence_, k_sequence_chars)
    );
}

}  // namespace airspace
