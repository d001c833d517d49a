#include "airspace/submission_queue.hpp"

#include <utility>

namespace airspace {

std::future<SubmissionResult> SubmissionQueue::publish(FlightRequest request) {
    PendingSubmission submission{std::move(request), {}};
    std::future<SubmissionResult> future_result = submission.promise.get_future();
    {
        std::scoped_lock lock(mutex_);
        queue_submissions_.push(std::move(submission));
    }
    condition_available_.notify_one();
    return future_result;
}

std::optional<PendingSubmission> SubmissionQueue::try_consume() {
    std::scoped_lock lock(mutex_);
    return pop_locked();
}

std::optional<PendingSubmission> SubmissionQueue::wait_consume_for(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    condition_available_.wait_for(lock, timeout, [this]() { return !queue_submissions_.empty(); });
    return pop_locked();
}

std::size_t SubmissionQueue::size() const {
    std::scoped_lock lock(mutex_);
    return queue_submissions_.size();
}

std::optional<PendingSubmission> SubmissionQueue::pop_locked() {
    if (queue_submissions_.empty()) {
        return std::nullopt;
    }
    PendingSubmission submission = std::move(queue_submissions_.front());
    queue_submissions_.pop();
    return submission;
}

}  // namespace airspace
