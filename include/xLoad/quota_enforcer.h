#ifndef XLOAD_QUOTA_ENFORCER_H_
#define XLOAD_QUOTA_ENFORCER_H_

#include "config.h"
#include "context.h"
#include "delivery.h"
#include "logger.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace xload {

/// Outcome of one quota check
struct QuotaCheckReport {
    int64_t total_size;
    size_t large_engines;            // Idle engines selected for import
    int in_progress_large_engines;   // Over-quota engines already importing
    size_t imported_engines;         // Engines imported and reset this round
    Status first_error;

    QuotaCheckReport()
        : total_size(0), large_engines(0), in_progress_large_engines(0), imported_engines(0) {}

    bool exceeded() const { return large_engines > 0 || in_progress_large_engines > 0; }
};

// ============================================================================
// QuotaEnforcer - keeps the local engine footprint below the disk quota
// ============================================================================

class QuotaEnforcer {
public:
    /// Constructor
    /// @param backend Delivery target (must outlive the enforcer)
    /// @param gate Gate shared with the writers
    /// @param quota Disk quota in bytes (0 or less disables enforcement)
    /// @param interval Period of the background check
    QuotaEnforcer(Backend& backend,
                  std::shared_ptr<WriteGate> gate,
                  int64_t quota,
                  std::chrono::milliseconds interval,
                  std::shared_ptr<LogSink> sink = nullptr);

    /// Enforcer on the backend's own write gate, with quota and interval
    /// taken from the configuration
    QuotaEnforcer(Backend& backend,
                  const DeliveryConfig& config,
                  std::shared_ptr<LogSink> sink = nullptr);

    /// Destructor - stops the background thread
    ~QuotaEnforcer();

    // Disable copy and move
    QuotaEnforcer(const QuotaEnforcer&) = delete;
    QuotaEnforcer& operator=(const QuotaEnforcer&) = delete;
    QuotaEnforcer(QuotaEnforcer&&) = delete;
    QuotaEnforcer& operator=(QuotaEnforcer&&) = delete;

    /// Run one check; empty report when disabled. When idle engines exceed
    /// the quota, block writers, flush every engine and import-and-reset the
    /// large engines in order, stopping at the first failure.
    QuotaCheckReport checkOnce(const Context& ctx);

    /// Start periodic checks on a background thread. No-op if running, if
    /// enforcement is disabled or if the interval is not positive.
    void start();

    /// Stop the background thread and wait for it
    void stop();

    bool isRunning() const;

    /// False when the quota is 0 or less; checkOnce then reports nothing
    bool enabled() const { return quota_ > 0; }

    /// Report of the last background check
    QuotaCheckReport lastReport() const;

private:
    void run(Context* ctx);

    Backend& backend_;
    std::shared_ptr<WriteGate> gate_;
    int64_t quota_;
    std::chrono::milliseconds interval_;
    Logger logger_;

    mutable std::mutex mutex_;        // Guards the members below
    std::unique_ptr<Context> run_ctx_;
    std::thread thread_;
    QuotaCheckReport last_report_;
};

}  // namespace xload

#endif  // XLOAD_QUOTA_ENFORCER_H_
