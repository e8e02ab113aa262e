#include "xLoad/context.h"

namespace xload {

Context::Context()
    : cancelled_(false), has_deadline_(false) {
}

Context::Context(std::chrono::milliseconds timeout)
    : cancelled_(false), has_deadline_(true), deadline_(Clock::now() + timeout) {
}

void Context::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool Context::isDone() const {
    return !status().ok();
}

Status Context::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        return Status(ErrorCode::ERR_CANCELLED, "context canceled");
    }
    if (has_deadline_ && Clock::now() >= deadline_) {
        return Status(ErrorCode::ERR_DEADLINE_EXCEEDED, "context deadline exceeded");
    }
    return Status::OK();
}

Status Context::sleepFor(std::chrono::milliseconds duration) const {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        Clock::time_point wake_at = Clock::now() + duration;
        if (has_deadline_ && deadline_ < wake_at) {
            wake_at = deadline_;
        }
        cv_.wait_until(lock, wake_at, [this] { return cancelled_; });
    }
    return status();
}

}  // namespace xload
