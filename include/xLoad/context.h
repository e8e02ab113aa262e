#ifndef XLOAD_CONTEXT_H_
#define XLOAD_CONTEXT_H_

#include "status.h"
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace xload {

// ============================================================================
// Context - cancellation token passed to every blocking operation
// ============================================================================

class Context {
public:
    using Clock = std::chrono::steady_clock;

    /// Context without deadline
    Context();

    /// Context that expires after timeout
    explicit Context(std::chrono::milliseconds timeout);

    // Disable copy and move (shared by reference)
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;
    Context(Context&&) = delete;
    Context& operator=(Context&&) = delete;

    /// Cancel the context and wake every sleeper
    void cancel();

    /// True once cancelled or past the deadline
    bool isDone() const;

    /// SUCCESS while live, ERR_CANCELLED or ERR_DEADLINE_EXCEEDED afterwards
    Status status() const;

    /// Sleep on the calling thread, waking early if the context ends
    /// @return status() after waking
    Status sleepFor(std::chrono::milliseconds duration) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_;
    bool has_deadline_;
    Clock::time_point deadline_;
};

}  // namespace xload

#endif  // XLOAD_CONTEXT_H_
