#include "xLoad/delivery.h"
#include "xLoad/constants.h"
#include <algorithm>
#include <chrono>

namespace xload {

namespace {

uint64_t currentCommitTS() {
    auto now = std::chrono::system_clock::now();
    int64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();
    return composeTS(seconds * 1000, 0);
}

}  // namespace

// ============================================================================
// Engine
// ============================================================================

Engine::Engine(std::shared_ptr<IAbstractBackend> backend, Logger logger, const EngineUUID& uuid)
    : backend_(std::move(backend)), logger_(std::move(logger)), uuid_(uuid) {
}

Status Engine::unsafeClose(const Context& ctx, std::unique_ptr<ClosedEngine>& out) const {
    LogTask task = logger_.begin(LogLevel::INFO, "engine close");
    Status status = backend_->closeEngine(ctx, uuid_);
    task.end(LogLevel::ERROR, status);
    if (!status.ok()) {
        return status;
    }
    out = std::make_unique<ClosedEngine>(backend_, logger_, uuid_);
    return Status::OK();
}

// ============================================================================
// OpenedEngine
// ============================================================================

OpenedEngine::OpenedEngine(std::shared_ptr<IAbstractBackend> backend,
                           Logger logger,
                           const EngineUUID& uuid,
                           std::string table_name,
                           uint64_t ts,
                           std::shared_ptr<EngineCounters> counters,
                           std::shared_ptr<WriteGate> gate)
    : Engine(std::move(backend), std::move(logger), uuid),
      table_name_(std::move(table_name)), ts_(ts),
      counters_(std::move(counters)), gate_(std::move(gate)) {
}

Status OpenedEngine::writeRows(const Context& ctx,
                               const std::vector<std::string>& column_names,
                               const IRows& rows) {
    std::vector<std::unique_ptr<IRows>> chunks = rows.splitIntoChunks(backend_->maxChunkSize());

    for (const auto& chunk : chunks) {
        std::shared_lock<std::shared_mutex> shared;
        if (gate_) {
            shared = gate_->acquireShared();
        }

        Status status;
        bool written = false;
        for (int attempt = 0; attempt < kMaxRetryTimes; ++attempt) {
            Status ctx_status = ctx.status();
            if (!ctx_status.ok()) {
                return ctx_status;
            }

            status = backend_->writeRows(ctx, uuid_, table_name_, column_names, ts_, *chunk);
            if (status.ok()) {
                written = true;
                break;
            }
            if (!isRetryableError(status)) {
                return status;
            }
            logger_.with("retryCnt", attempt).with("error", status.toString())
                .warn("write rows spuriously failed, going to retry again");
        }

        if (!written) {
            return status.annotate("[" + table_name_ + "] write rows reach max retry " +
                                   std::to_string(kMaxRetryTimes) + " and still failed");
        }
    }

    return Status::OK();
}

Status OpenedEngine::flush() {
    return backend_->flushEngine(uuid_);
}

Status OpenedEngine::close(const Context& ctx, std::unique_ptr<ClosedEngine>& out) {
    Status status = unsafeClose(ctx, out);
    if (status.ok() && counters_) {
        counters_->incClosed();
    }
    return status;
}

// ============================================================================
// ClosedEngine
// ============================================================================

Status ClosedEngine::import(const Context& ctx) {
    Status status;

    for (int attempt = 0; attempt < kMaxRetryTimes; ++attempt) {
        Status ctx_status = ctx.status();
        if (!ctx_status.ok()) {
            return ctx_status;
        }

        LogTask task = logger_.with("retryCnt", attempt).begin(LogLevel::INFO, "import");
        status = backend_->importEngine(ctx, uuid_);
        if (!isRetryableError(status)) {
            task.end(LogLevel::ERROR, status);
            return status;
        }
        task.warn("import spuriously failed, going to retry again", status);

        if (attempt + 1 < kMaxRetryTimes) {
            Status sleep_status = ctx.sleepFor(backend_->retryImportDelay());
            if (!sleep_status.ok()) {
                return sleep_status;
            }
        }
    }

    return status.annotate("[" + uuid_.toString() + "] import reach max retry " +
                           std::to_string(kMaxRetryTimes) + " and still failed");
}

Status ClosedEngine::cleanup(const Context& ctx) {
    LogTask task = logger_.begin(LogLevel::INFO, "cleanup");
    Status status = backend_->cleanupEngine(ctx, uuid_);
    task.end(LogLevel::WARN, status);
    return status;
}

// ============================================================================
// Backend
// ============================================================================

Backend::Backend(std::shared_ptr<IAbstractBackend> abstract)
    : Backend(std::move(abstract), std::make_shared<LogSink>()) {
}

Backend::Backend(std::shared_ptr<IAbstractBackend> abstract, std::shared_ptr<LogSink> sink)
    : abstract_(std::move(abstract)),
      sink_(sink ? std::move(sink) : std::make_shared<LogSink>()),
      counters_(std::make_shared<EngineCounters>()),
      write_gate_(std::make_shared<WriteGate>()),
      policy_(std::make_shared<NoopEngineCountPolicy>()) {
}

void Backend::close() {
    abstract_->close();
}

std::unique_ptr<IRows> Backend::makeEmptyRows() {
    return abstract_->makeEmptyRows();
}

std::unique_ptr<IEncoder> Backend::newEncoder(const TableInfo& table, const SessionOptions& options) {
    return abstract_->newEncoder(table, options);
}

bool Backend::shouldPostProcess() const {
    return abstract_->shouldPostProcess();
}

Status Backend::checkRequirements(const Context& ctx) {
    return abstract_->checkRequirements(ctx);
}

Status Backend::fetchRemoteTableModels(const Context& ctx,
                                       const std::string& schema_name,
                                       std::vector<TableInfo>& tables) {
    return abstract_->fetchRemoteTableModels(ctx, schema_name, tables);
}

Status Backend::flushAll() {
    return abstract_->flushAllEngines();
}

DiskQuotaResult Backend::checkDiskQuota(int64_t quota) {
    std::vector<EngineFileSize> sizes = abstract_->engineFileSizes();

    // Idle engines first, then importing ones; ascending size within each
    std::stable_sort(sizes.begin(), sizes.end(),
                     [](const EngineFileSize& a, const EngineFileSize& b) {
                         if (a.is_importing != b.is_importing) {
                             return b.is_importing;
                         }
                         return a.size < b.size;
                     });

    DiskQuotaResult result;
    for (const EngineFileSize& size : sizes) {
        result.total_size += size.size;
        if (result.total_size > quota) {
            if (size.is_importing) {
                result.in_progress_large_engines++;
            } else {
                result.large_engines.push_back(size.uuid);
            }
        }
    }
    return result;
}

Status Backend::openEngine(const Context& ctx,
                           const std::string& table_name,
                           int32_t engine_id,
                           std::unique_ptr<OpenedEngine>& out) {
    std::string tag;
    EngineUUID engine_uuid = makeEngineUUID(table_name, engine_id, tag);
    Logger logger = makeEngineLogger(tag, engine_uuid);

    Status status = abstract_->openEngine(ctx, engine_uuid);
    if (!status.ok()) {
        return status;
    }

    counters_->incOpened();
    logger.info("open engine");

    std::shared_ptr<IEngineCountPolicy> policy;
    {
        std::lock_guard<std::mutex> lock(policy_mutex_);
        policy = policy_;
    }
    policy->onEngineOpened(*counters_, logger);

    out = std::make_unique<OpenedEngine>(abstract_, logger, engine_uuid, table_name,
                                         currentCommitTS(), counters_, write_gate_);
    return Status::OK();
}

EngineRecovery Backend::recovery() {
    return EngineRecovery(*this);
}

void Backend::setEngineCountPolicy(std::shared_ptr<IEngineCountPolicy> policy) {
    std::lock_guard<std::mutex> lock(policy_mutex_);
    policy_ = policy ? std::move(policy) : std::make_shared<NoopEngineCountPolicy>();
}

Logger Backend::makeEngineLogger(const std::string& tag, const EngineUUID& uuid) const {
    return Logger("Engine", sink_)
        .with("engineTag", tag)
        .with("engineUUID", uuid.toString());
}

// ============================================================================
// EngineRecovery
// ============================================================================

Status EngineRecovery::unsafeCloseEngine(const Context& ctx,
                                         const std::string& table_name,
                                         int32_t engine_id,
                                         std::unique_ptr<ClosedEngine>& out) {
    std::string tag;
    EngineUUID engine_uuid = makeEngineUUID(table_name, engine_id, tag);
    return unsafeCloseEngineWithUUID(ctx, tag, engine_uuid, out);
}

Status EngineRecovery::unsafeCloseEngineWithUUID(const Context& ctx,
                                                 const std::string& tag,
                                                 const EngineUUID& engine_uuid,
                                                 std::unique_ptr<ClosedEngine>& out) {
    Engine engine(backend_.abstract_, backend_.makeEngineLogger(tag, engine_uuid), engine_uuid);
    return engine.unsafeClose(ctx, out);
}

Status EngineRecovery::unsafeImportAndReset(const Context& ctx, const EngineUUID& engine_uuid) {
    // Never closeEngine here: the engine must remain writable afterwards.
    ClosedEngine engine(backend_.abstract_,
                        backend_.makeEngineLogger("<import-and-reset>", engine_uuid),
                        engine_uuid);
    Status status = engine.import(ctx);
    if (!status.ok()) {
        return status;
    }
    return backend_.abstract_->resetEngine(ctx, engine_uuid);
}

}  // namespace xload
