#include "xLoad/quota_enforcer.h"

namespace xload {

QuotaEnforcer::QuotaEnforcer(Backend& backend,
                             std::shared_ptr<WriteGate> gate,
                             int64_t quota,
                             std::chrono::milliseconds interval,
                             std::shared_ptr<LogSink> sink)
    : backend_(backend),
      gate_(std::move(gate)),
      quota_(quota),
      interval_(interval),
      logger_("QuotaEnforcer", std::move(sink)) {
}

QuotaEnforcer::QuotaEnforcer(Backend& backend,
                             const DeliveryConfig& config,
                             std::shared_ptr<LogSink> sink)
    : QuotaEnforcer(backend, backend.writeGate(), config.disk_quota_bytes,
                    std::chrono::milliseconds(config.quota_check_interval_ms), std::move(sink)) {
}

QuotaEnforcer::~QuotaEnforcer() {
    stop();
}

QuotaCheckReport QuotaEnforcer::checkOnce(const Context& ctx) {
    QuotaCheckReport report;
    if (!enabled()) {
        return report;
    }

    DiskQuotaResult result = backend_.checkDiskQuota(quota_);
    report.total_size = result.total_size;
    report.large_engines = result.large_engines.size();
    report.in_progress_large_engines = result.in_progress_large_engines;

    if (!report.exceeded()) {
        logger_.with("totalSize", report.total_size).debug("disk quota respected");
        return report;
    }

    Logger quota_logger = logger_.with("quota", quota_)
                                 .with("totalSize", report.total_size)
                                 .with("largeEnginesCount", static_cast<int64_t>(report.large_engines))
                                 .with("inProgressLargeEnginesCount",
                                       static_cast<int64_t>(report.in_progress_large_engines));

    if (result.large_engines.empty()) {
        quota_logger.warn("disk quota exceeded, but all large engines are already importing");
        return report;
    }

    quota_logger.warn("disk quota exceeded");

    // Writers must not touch an engine between flush and reset
    std::unique_lock<std::shared_mutex> exclusive = gate_->acquireExclusive();

    LogTask task = quota_logger.begin(LogLevel::INFO, "flush all engines for quota");
    Status status = backend_.flushAll();
    task.end(LogLevel::ERROR, status);
    if (!status.ok()) {
        report.first_error = status.annotate("flush engines");
        return report;
    }

    EngineRecovery recovery = backend_.recovery();
    for (const EngineUUID& uuid : result.large_engines) {
        status = ctx.status();
        if (status.ok()) {
            status = recovery.unsafeImportAndReset(ctx, uuid);
        }
        if (!status.ok()) {
            quota_logger.with("engineUUID", uuid.toString())
                        .error("import and reset engine failed: " + status.toString());
            report.first_error = status;
            return report;
        }
        report.imported_engines++;
    }

    quota_logger.with("importedEngines", static_cast<int64_t>(report.imported_engines))
                .info("disk quota resolved");
    return report;
}

void QuotaEnforcer::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) {
        return;
    }
    if (!enabled() || interval_.count() <= 0) {
        logger_.with("quota", quota_).info("quota enforcer disabled");
        return;
    }
    run_ctx_ = std::make_unique<Context>();
    thread_ = std::thread(&QuotaEnforcer::run, this, run_ctx_.get());
    logger_.with("intervalMs", static_cast<int64_t>(interval_.count())).info("quota enforcer started");
}

void QuotaEnforcer::stop() {
    std::thread worker;
    std::unique_ptr<Context> ctx;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable()) {
            return;
        }
        run_ctx_->cancel();
        worker = std::move(thread_);
        ctx = std::move(run_ctx_);
    }
    worker.join();
    logger_.info("quota enforcer stopped");
}

bool QuotaEnforcer::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thread_.joinable();
}

QuotaCheckReport QuotaEnforcer::lastReport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_report_;
}

void QuotaEnforcer::run(Context* ctx) {
    while (ctx->sleepFor(interval_).ok()) {
        QuotaCheckReport report = checkOnce(*ctx);
        if (ctx->isDone()) {
            // Round cut short by stop()
            break;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        last_report_ = report;
    }
}

}  // namespace xload
