#include "airspace/airspace_runtime.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <exception>
#include <utility>

#include "airspace/logging.hpp"

namespace airspace {

namespace {

constexpr std::chrono::milliseconds k_max_queue_wait{100};  /**< Upper bound on one idle wait so shutdown stays responsive. */
constexpr std::chrono::minutes k_demo_lead_time{60};        /**< Demo flights start this long after startup. */
constexpr std::chrono::minutes k_demo_duration{60};         /**< Length of each demo flight window. */
constexpr double k_demo_altitude_m{80.0};                   /**< Demo cruise altitude, below every zone cap in use. */

/**
 * @brief Demonstration traffic clear of every built-in zone and well separated.
 */
std::array<FlightRequest, 3> make_demo_requests(TimePoint start) {
    const TimePoint end = start + k_demo_duration;

    FlightRequest survey_path{};
    survey_path.waypoints = {
        Waypoint{GeoPoint{42.6000, 20.9000}, k_demo_altitude_m, 1},
        Waypoint{GeoPoint{42.6100, 20.9150}, k_demo_altitude_m, 2},
        Waypoint{GeoPoint{42.6200, 20.9300}, k_demo_altitude_m, 3},
    };
    survey_path.scheduled_start = start;
    survey_path.scheduled_end = end;
    survey_path.max_altitude_m = k_demo_altitude_m;

    FlightRequest orchard_circle{};
    orchard_circle.operation_area = OperationArea{Circle{GeoPoint{42.3800, 20.8000}, 500.0}};
    orchard_circle.scheduled_start = start;
    orchard_circle.scheduled_end = end;
    orchard_circle.max_altitude_m = k_demo_altitude_m;

    FlightRequest river_box{};
    river_box.operation_area = OperationArea{Rectangle{42.9000, 42.8900, 20.8800, 20.8600}};
    river_box.scheduled_start = start;
    river_box.scheduled_end = end;
    river_box.max_altitude_m = k_demo_altitude_m;

    return {survey_path, orchard_circle, river_box};
}

}  // namespace

AirspaceRuntime::AirspaceRuntime(Configuration configuration)
    : configuration_(std::move(configuration)),
      service_(configuration_),
      submission_queue_(),
      logger_(get_logger()) {
    if (!(configuration_.tick_hz > 0.0)) {
        throw InputError("Maintenance tick rate must be positive");
    }
}

AirspaceRuntime::~AirspaceRuntime() {
    shutdown();
}

/**
 * @brief Admit the demonstration flights directly, bypassing the queue.
 */
void AirspaceRuntime::initialize() {
    logger_->info("Seeding demonstration traffic");
    const TimePoint now = SystemClock::now();
    for (const FlightRequest& request : make_demo_requests(now + k_demo_lead_time)) {
        const SubmissionResult result = service_.submit_flight(request, now);
        logger_->info("Seeded demo flight {} as {}", result.flight_number, to_string(result.status));
    }
}

void AirspaceRuntime::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting admission worker at {} Hz maintenance cadence", configuration_.tick_hz);
    worker_thread_ = std::thread(&AirspaceRuntime::worker_loop, this);
}

void AirspaceRuntime::shutdown() {
    if (flag_running_.exchange(false)) {
        logger_->info("Shutting down airspace runtime");
        if (worker_thread_.joinable()) {
            worker_thread_.join();
        }
    }
    drain_pending();
}

std::future<SubmissionResult> AirspaceRuntime::enqueue(FlightRequest request) {
    return submission_queue_.publish(std::move(request));
}

AdmissionService& AirspaceRuntime::service() noexcept {
    return service_;
}

bool AirspaceRuntime::is_running() const noexcept {
    return flag_running_.load();
}

void AirspaceRuntime::worker_loop() {
    const auto tick_interval = std::chrono::duration_cast<std::chrono::steady_clock::duration>(Duration{1.0 / configuration_.tick_hz});
    auto next_tick = std::chrono::steady_clock::now();
    while (flag_running_.load()) {
        const auto steady_now = std::chrono::steady_clock::now();
        if (steady_now >= next_tick) {
            try {
                service_.tick(SystemClock::now());
            } catch (const std::exception& exc) {
                logger_->error("Maintenance sweep error: {}", exc.what());
            }
            next_tick = steady_now + tick_interval;
        }

        const auto wait = std::min(
            k_max_queue_wait,
            std::chrono::duration_cast<std::chrono::milliseconds>(next_tick - std::chrono::steady_clock::now())
        );
        std::optional<PendingSubmission> optional_submission = submission_queue_.wait_consume_for(
            std::max(wait, std::chrono::milliseconds{0})
        );
        if (optional_submission.has_value()) {
            process(std::move(*optional_submission));
        }
    }
}

void AirspaceRuntime::process(PendingSubmission submission) {
    try {
        submission.promise.set_value(service_.submit_flight(submission.request));
    } catch (const InputError& exc) {
        logger_->warn(R"({{"component":"runtime","rejected_input":"{}"}})", exc.what());
        submission.promise.set_exception(std::current_exception());
    } catch (const std::exception& exc) {
        logger_->error("Submission processing error: {}", exc.what());
        submission.promise.set_exception(std::current_exception());
    }
}

void AirspaceRuntime::drain_pending() {
    while (std::optional<PendingSubmission> optional_submission = submission_queue_.try_consume()) {
        process(std::move(*optional_submission));
    }
}

}  // namespace airspace
