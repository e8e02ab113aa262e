#ifndef XLOAD_ENGINE_COUNTERS_H_
#define XLOAD_ENGINE_COUNTERS_H_

#include "logger.h"
#include <atomic>
#include <cstdint>
#include <memory>

namespace xload {

// ============================================================================
// Engine counters and the engine-count consistency guard
// ============================================================================

/// Opened / closed engine counts of one Backend instance
class EngineCounters {
public:
    EngineCounters() : opened_(0), closed_(0) {}

    void incOpened() { opened_.fetch_add(1, std::memory_order_relaxed); }
    void incClosed() { closed_.fetch_add(1, std::memory_order_relaxed); }

    int64_t opened() const { return opened_.load(std::memory_order_relaxed); }
    int64_t closed() const { return closed_.load(std::memory_order_relaxed); }

    /// Engines opened but not yet closed
    int64_t unbalanced() const { return opened() - closed(); }

private:
    std::atomic<int64_t> opened_;
    std::atomic<int64_t> closed_;
};

/// Checked right after every successful engine open
class IEngineCountPolicy {
public:
    virtual ~IEngineCountPolicy() = default;

    virtual void onEngineOpened(const EngineCounters& counters, const Logger& logger) = 0;
};

class NoopEngineCountPolicy : public IEngineCountPolicy {
public:
    void onEngineOpened(const EngineCounters&, const Logger&) override {}
};

/// Aborts the process once opened - closed exceeds the ceiling.
/// Used under fault injection to catch engine leaks.
class EngineCountCeilingPolicy : public IEngineCountPolicy {
public:
    explicit EngineCountCeilingPolicy(int64_t ceiling) : ceiling_(ceiling) {}

    /// True if the counters violate the ceiling
    bool exceeds(const EngineCounters& counters) const {
        return counters.unbalanced() > ceiling_;
    }

    void onEngineOpened(const EngineCounters& counters, const Logger& logger) override;

    int64_t ceiling() const { return ceiling_; }

private:
    int64_t ceiling_;
};

/// Policy for a configured ceiling
/// @param max_unbalanced_engines Ceiling, 0 disables the guard
std::shared_ptr<IEngineCountPolicy> makeEngineCountPolicy(int64_t max_unbalanced_engines);

}  // namespace xload

#endif  // XLOAD_ENGINE_COUNTERS_H_
