// === Submission Queue ========================================================
//
// Thread-safe FIFO handing flight submissions from any number of producers to
// the single admission worker. Each entry carries the promise its producer is
// waiting on.

#pragma once

#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <optional>
#include <queue>

#include "airspace/admission_service.hpp"

namespace airspace {

/** @brief A queued request and the promise fulfilled once it is decided. */
struct PendingSubmission final {
    FlightRequest request{};
    std::promise<SubmissionResult> promise{};
};

/** @brief Thread-safe FIFO of pending submissions. */
class SubmissionQueue final {
  public:
    /** @brief Enqueue a request; the returned future resolves with its decision. */
    [[nodiscard]] std::future<SubmissionResult> publish(FlightRequest request);
    /** @brief Attempt to consume a pending submission without blocking. */
    [[nodiscard]] std::optional<PendingSubmission> try_consume();
    /** @brief Wait up to @p timeout for a submission. */
    [[nodiscard]] std::optional<PendingSubmission> wait_consume_for(std::chrono::milliseconds timeout);
    [[nodiscard]] std::size_t size() const;

  private:
    [[nodiscard]] std::optional<PendingSubmission> pop_locked();

    mutable std::mutex mutex_;
    std::condition_variable condition_available_;
    std::queue<PendingSubmission> queue_submissions_;
};

}  // namespace airspace
