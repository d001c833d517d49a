// === Airspace Runtime ========================================================
//
// Hosts the admission service behind a submission queue. One worker thread
// drains the queue in arrival order and runs the lifecycle maintenance sweep at
// the configured cadence, so submissions are decided strictly one at a time.

#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <thread>

#include "airspace/admission_service.hpp"
#include "airspace/configuration.hpp"
#include "airspace/submission_queue.hpp"

namespace airspace {

/** @brief Owns the worker thread that feeds the admission service. */
class AirspaceRuntime final {
  public:
    explicit AirspaceRuntime(Configuration configuration);
    ~AirspaceRuntime();

    AirspaceRuntime(const AirspaceRuntime&) = delete;
    AirspaceRuntime& operator=(const AirspaceRuntime&) = delete;

    /** @brief Seed the registry with demonstration flights. */
    void initialize();
    /** @brief Start the background worker. */
    void run();
    /** @brief Stop the worker, deciding any submissions still queued. */
    void shutdown();

    /** @brief Queue a submission; the future carries the decision or the InputError. */
    [[nodiscard]] std::future<SubmissionResult> enqueue(FlightRequest request);

    [[nodiscard]] AdmissionService& service() noexcept;
    [[nodiscard]] bool is_running() const noexcept;

  private:
    /** @brief Drain submissions and tick the lifecycle at tick_hz. */
    void worker_loop();
    void process(PendingSubmission submission);
    void drain_pending();

    Configuration configuration_;
    AdmissionService service_;
    SubmissionQueue submission_queue_;
    std::atomic<bool> flag_running_{false};
    std::thread worker_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace airspace
