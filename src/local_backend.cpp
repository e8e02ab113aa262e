#include "xLoad/local_backend.h"
#include "xLoad/run_file.h"
#include "xLoad/thread_pool.h"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <sqlite3.h>

namespace fs = std::filesystem;

namespace xload {

namespace {

constexpr const char* kRunFilePrefix = "run_";
constexpr const char* kRunFileSuffix = ".kv";
constexpr const char* kTempSuffix = ".tmp";

// WITHOUT ROWID tables and the busy handler semantics we rely on
constexpr int kMinSQLiteVersion = 3008003;

std::string runFileName(uint32_t run_id) {
    char name[32];
    std::snprintf(name, sizeof(name), "%s%06u%s", kRunFilePrefix, run_id, kRunFileSuffix);
    return name;
}

/// Parse "run_NNNNNN.kv"; returns false for any other name
bool parseRunFileName(const std::string& name, uint32_t& run_id) {
    const std::string prefix(kRunFilePrefix);
    const std::string suffix(kRunFileSuffix);
    if (name.size() <= prefix.size() + suffix.size() ||
        name.compare(0, prefix.size(), prefix) != 0 ||
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    std::string digits = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
    if (!std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    run_id = static_cast<uint32_t>(std::stoul(digits));
    return true;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Status fsError(const std::string& what, const std::string& path, const std::error_code& ec) {
    return Status(ErrorCode::ERR_IO_FAILED, what + " '" + path + "': " + ec.message());
}

// Clears the importing flag on scope exit
class ImportingGuard {
public:
    explicit ImportingGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~ImportingGuard() { flag_.store(false); }
    ImportingGuard(const ImportingGuard&) = delete;
    ImportingGuard& operator=(const ImportingGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

}  // namespace

LocalBackend::LocalBackend(const DeliveryConfig& config, std::shared_ptr<LogSink> sink)
    : config_(config),
      logger_("LocalBackend",
              sink ? sink : std::make_shared<LogSink>(&std::cerr, config.log_level)),
      target_(std::make_unique<TargetStore>(config.target_db_path)) {
}

LocalBackend::~LocalBackend() {
    close();
}

Status LocalBackend::open() {
    std::string reason;
    if (!validateConfig(config_, reason)) {
        return Status(ErrorCode::ERR_INVALID_ARGUMENT, "invalid delivery config: " + reason);
    }

    std::error_code ec;
    fs::create_directories(config_.sorted_kv_dir, ec);
    if (ec) {
        return fsError("failed to create sorted-kv directory", config_.sorted_kv_dir, ec);
    }

    fs::path db_parent = fs::path(config_.target_db_path).parent_path();
    if (!db_parent.empty()) {
        fs::create_directories(db_parent, ec);
        if (ec) {
            return fsError("failed to create target directory", db_parent.string(), ec);
        }
    }

    Status status = target_->open();
    if (!status.ok()) {
        return status.annotate("open target store");
    }
    status = target_->initSchema();
    if (!status.ok()) {
        target_->close();
        return status.annotate("init target schema");
    }

    logger_.with("dir", config_.sorted_kv_dir).info("local backend opened");
    return Status::OK();
}

void LocalBackend::close() {
    std::vector<EnginePtr> engines;
    {
        std::lock_guard<std::mutex> lock(engines_mutex_);
        for (const auto& [uuid, engine] : engines_) {
            engines.push_back(engine);
        }
        engines_.clear();
    }

    // Keep unflushed writes of still-open engines for a resumed process
    for (const EnginePtr& engine : engines) {
        std::lock_guard<std::mutex> lock(engine->mutex);
        Status status = flushLocked(*engine);
        if (!status.ok()) {
            logger_.with("engine", engine->uuid.toString())
                   .error("flush on close failed: " + status.toString());
        }
    }

    if (target_->isOpen()) {
        target_->close();
    }
}

std::unique_ptr<IRows> LocalBackend::makeEmptyRows() {
    return std::make_unique<KvPairs>();
}

std::chrono::milliseconds LocalBackend::retryImportDelay() const {
    return std::chrono::milliseconds(config_.retry_import_delay_ms);
}

size_t LocalBackend::maxChunkSize() const {
    return static_cast<size_t>(config_.max_chunk_size);
}

std::unique_ptr<IEncoder> LocalBackend::newEncoder(const TableInfo& table,
                                                   const SessionOptions& options) {
    return std::make_unique<KvEncoder>(table, options);
}

// ============================================================================
// Engine lifecycle
// ============================================================================

Status LocalBackend::openEngine(const Context& ctx, const EngineUUID& engine_uuid) {
    Status status = ctx.status();
    if (!status.ok()) {
        return status;
    }

    EnginePtr engine;
    status = loadEngine(engine_uuid, true, engine);
    if (!status.ok()) {
        return status;
    }

    std::lock_guard<std::mutex> lock(engine->mutex);
    engine->closed = false;
    return Status::OK();
}

Status LocalBackend::writeRows(const Context& ctx,
                               const EngineUUID& engine_uuid,
                               const std::string& table_name,
                               const std::vector<std::string>& column_names,
                               uint64_t commit_ts,
                               const IRows& rows) {
    (void)column_names;
    (void)commit_ts;

    Status status = ctx.status();
    if (!status.ok()) {
        return status;
    }

    const KvPairs* pairs = dynamic_cast<const KvPairs*>(&rows);
    if (!pairs) {
        return Status(ErrorCode::ERR_INVALID_ARGUMENT,
                      "local backend only accepts rows made by makeEmptyRows");
    }

    EnginePtr engine = findEngine(engine_uuid);
    if (!engine) {
        return Status(ErrorCode::ERR_NOT_FOUND,
                      "engine " + engine_uuid.toString() + " is not open");
    }

    std::lock_guard<std::mutex> lock(engine->mutex);
    if (engine->closed) {
        return Status(ErrorCode::ERR_INVALID_ARGUMENT,
                      "write " + table_name + " to closed engine " + engine_uuid.toString());
    }

    int64_t delta = 0;
    for (const KvPair& pair : pairs->pairs()) {
        auto it = engine->memtable.find(pair.key);
        if (it == engine->memtable.end()) {
            delta += static_cast<int64_t>(pair.byteSize());
            engine->memtable.emplace(pair.key, pair.value);
        } else {
            delta += static_cast<int64_t>(pair.value.size()) -
                     static_cast<int64_t>(it->second.size());
            it->second = pair.value;
        }
    }
    int64_t mem_bytes = engine->mem_bytes.fetch_add(delta) + delta;

    // Keyed writes are idempotent, so a failed spill can be retried as a whole
    if (mem_bytes >= static_cast<int64_t>(config_.memtable_limit)) {
        status = flushLocked(*engine);
        if (!status.ok()) {
            return status.annotate("spill memtable");
        }
    }
    return Status::OK();
}

Status LocalBackend::closeEngine(const Context& ctx, const EngineUUID& engine_uuid) {
    Status status = ctx.status();
    if (!status.ok()) {
        return status;
    }

    EnginePtr engine;
    status = loadEngine(engine_uuid, false, engine);
    if (!status.ok()) {
        return status;
    }

    std::lock_guard<std::mutex> lock(engine->mutex);
    status = flushLocked(*engine);
    if (!status.ok()) {
        return status;
    }
    engine->closed = true;
    return Status::OK();
}

Status LocalBackend::importEngine(const Context& ctx, const EngineUUID& engine_uuid) {
    Status status = ctx.status();
    if (!status.ok()) {
        return status;
    }

    EnginePtr engine;
    status = loadEngine(engine_uuid, false, engine);
    if (!status.ok()) {
        return status;
    }

    if (engine->importing.exchange(true)) {
        return Status(ErrorCode::ERR_BUSY,
                      "engine " + engine_uuid.toString() + " is already importing");
    }
    ImportingGuard guard(engine->importing);

    std::lock_guard<std::mutex> lock(engine->mutex);
    std::vector<KvPair> pairs;
    status = mergeLocked(*engine, pairs);
    if (!status.ok()) {
        return status;
    }

    status = target_->ingest(ctx, pairs);
    if (!status.ok()) {
        return status;
    }

    logger_.with("engine", engine_uuid.toString())
           .with("pairs", static_cast<int64_t>(pairs.size()))
           .debug("engine ingested");
    return Status::OK();
}

Status LocalBackend::cleanupEngine(const Context& ctx, const EngineUUID& engine_uuid) {
    Status status = ctx.status();
    if (!status.ok()) {
        return status;
    }

    EnginePtr engine;
    {
        std::lock_guard<std::mutex> lock(engines_mutex_);
        auto it = engines_.find(engine_uuid);
        if (it != engines_.end()) {
            if (it->second->importing.load()) {
                return Status(ErrorCode::ERR_BUSY,
                              "engine " + engine_uuid.toString() + " is importing");
            }
            engine = it->second;
            engines_.erase(it);
        }
    }

    if (engine) {
        std::lock_guard<std::mutex> lock(engine->mutex);
        engine->memtable.clear();
        engine->runs.clear();
        engine->mem_bytes.store(0);
        engine->run_bytes.store(0);
    }

    std::string dir = engineDir(engine_uuid);
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        return fsError("failed to remove engine directory", dir, ec);
    }
    return Status::OK();
}

Status LocalBackend::resetEngine(const Context& ctx, const EngineUUID& engine_uuid) {
    Status status = ctx.status();
    if (!status.ok()) {
        return status;
    }

    EnginePtr engine;
    status = loadEngine(engine_uuid, false, engine);
    if (!status.ok()) {
        return status;
    }

    std::lock_guard<std::mutex> lock(engine->mutex);
    while (!engine->runs.empty()) {
        const std::string& path = engine->runs.back();
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            return fsError("failed to remove run file", path, ec);
        }
        engine->runs.pop_back();
    }
    engine->run_bytes.store(0);
    engine->memtable.clear();
    engine->mem_bytes.store(0);
    return Status::OK();
}

// ============================================================================
// Requirements and catalog
// ============================================================================

Status LocalBackend::checkRequirements(const Context& ctx) {
    Status status = ctx.status();
    if (!status.ok()) {
        return status;
    }
    if (!target_->isOpen()) {
        return Status(ErrorCode::ERR_UNAVAILABLE, "target store is not open");
    }
    if (sqlite3_libversion_number() < kMinSQLiteVersion) {
        return Status(ErrorCode::ERR_UNSUPPORTED,
                      std::string("SQLite ") + sqlite3_libversion() +
                      " is too old, need at least 3.8.3");
    }

    std::error_code ec;
    if (!fs::is_directory(config_.sorted_kv_dir, ec)) {
        return Status(ErrorCode::ERR_IO_FAILED,
                      "sorted-kv directory '" + config_.sorted_kv_dir + "' does not exist");
    }
    return Status::OK();
}

Status LocalBackend::fetchRemoteTableModels(const Context& ctx,
                                            const std::string& schema_name,
                                            std::vector<TableInfo>& tables) {
    Status status = ctx.status();
    if (!status.ok()) {
        return status;
    }
    return target_->loadTableModels(schema_name, tables);
}

// ============================================================================
// Flush and sizes
// ============================================================================

Status LocalBackend::flushEngine(const EngineUUID& engine_uuid) {
    EnginePtr engine = findEngine(engine_uuid);
    if (!engine) {
        return Status(ErrorCode::ERR_NOT_FOUND,
                      "engine " + engine_uuid.toString() + " is not open");
    }
    std::lock_guard<std::mutex> lock(engine->mutex);
    return flushLocked(*engine);
}

Status LocalBackend::flushAllEngines() {
    std::vector<EnginePtr> engines;
    {
        std::lock_guard<std::mutex> lock(engines_mutex_);
        for (const auto& [uuid, engine] : engines_) {
            engines.push_back(engine);
        }
    }
    if (engines.empty()) {
        return Status::OK();
    }

    std::vector<ThreadPool::Job> jobs;
    jobs.reserve(engines.size());
    for (const EnginePtr& engine : engines) {
        jobs.push_back([this, engine]() {
            std::lock_guard<std::mutex> lock(engine->mutex);
            return flushLocked(*engine);
        });
    }

    ThreadPool pool(std::min<size_t>(config_.flush_threads == 0 ? std::thread::hardware_concurrency()
                                                       : config_.flush_threads,
                             engines.size()));
    std::vector<Status> statuses;
    size_t failed = pool.runAll(std::move(jobs), statuses);
    if (failed < statuses.size()) {
        return statuses[failed].annotate("flush engine " + engines[failed]->uuid.toString());
    }
    return Status::OK();
}

std::vector<EngineFileSize> LocalBackend::engineFileSizes() {
    std::lock_guard<std::mutex> lock(engines_mutex_);
    std::vector<EngineFileSize> sizes;
    sizes.reserve(engines_.size());
    for (const auto& [uuid, engine] : engines_) {
        sizes.emplace_back(uuid,
                           engine->run_bytes.load() + engine->mem_bytes.load(),
                           engine->importing.load());
    }
    return sizes;
}

// ============================================================================
// Introspection
// ============================================================================

std::string LocalBackend::engineDir(const EngineUUID& engine_uuid) const {
    return (fs::path(config_.sorted_kv_dir) / engine_uuid.toString()).string();
}

size_t LocalBackend::runCount(const EngineUUID& engine_uuid) const {
    EnginePtr engine = findEngine(engine_uuid);
    if (!engine) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(engine->mutex);
    return engine->runs.size();
}

size_t LocalBackend::engineCount() const {
    std::lock_guard<std::mutex> lock(engines_mutex_);
    return engines_.size();
}

// ============================================================================
// Internals
// ============================================================================

LocalBackend::EnginePtr LocalBackend::findEngine(const EngineUUID& engine_uuid) const {
    std::lock_guard<std::mutex> lock(engines_mutex_);
    auto it = engines_.find(engine_uuid);
    return it == engines_.end() ? nullptr : it->second;
}

Status LocalBackend::loadEngine(const EngineUUID& engine_uuid, bool create, EnginePtr& out) {
    std::lock_guard<std::mutex> lock(engines_mutex_);
    auto it = engines_.find(engine_uuid);
    if (it != engines_.end()) {
        out = it->second;
        return Status::OK();
    }

    std::string dir = engineDir(engine_uuid);
    std::error_code ec;
    bool exists = fs::is_directory(dir, ec);
    if (!exists) {
        if (!create) {
            return Status(ErrorCode::ERR_NOT_FOUND,
                          "engine " + engine_uuid.toString() + " not found in " + config_.sorted_kv_dir);
        }
        fs::create_directories(dir, ec);
        if (ec) {
            return fsError("failed to create engine directory", dir, ec);
        }
    }

    auto engine = std::make_shared<LocalEngine>(engine_uuid, dir);
    if (exists) {
        Status status = scanRuns(*engine);
        if (!status.ok()) {
            return status;
        }
        logger_.with("engine", engine_uuid.toString())
               .with("runs", static_cast<int64_t>(engine->runs.size()))
               .info("engine reloaded from disk");
    }

    engines_.emplace(engine_uuid, engine);
    out = engine;
    return Status::OK();
}

Status LocalBackend::scanRuns(LocalEngine& engine) {
    std::error_code ec;
    std::vector<std::pair<uint32_t, std::string>> found;
    for (fs::directory_iterator it(engine.dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (endsWith(name, kTempSuffix)) {
            // Partial spill of a crashed process
            std::error_code rm_ec;
            fs::remove(it->path(), rm_ec);
            if (rm_ec) {
                return fsError("failed to remove partial run file", it->path().string(), rm_ec);
            }
            continue;
        }
        uint32_t run_id = 0;
        if (parseRunFileName(name, run_id)) {
            found.emplace_back(run_id, it->path().string());
        }
    }
    if (ec) {
        return fsError("failed to list engine directory", engine.dir, ec);
    }

    std::sort(found.begin(), found.end());
    int64_t run_bytes = 0;
    for (const auto& [run_id, path] : found) {
        uintmax_t size = fs::file_size(path, ec);
        if (ec) {
            return fsError("failed to stat run file", path, ec);
        }
        run_bytes += static_cast<int64_t>(size);
        engine.runs.push_back(path);
        engine.next_run_id = run_id + 1;
    }
    engine.run_bytes.store(run_bytes);
    return Status::OK();
}

Status LocalBackend::flushLocked(LocalEngine& engine) {
    if (engine.memtable.empty()) {
        return Status::OK();
    }

    std::vector<KvPair> pairs;
    pairs.reserve(engine.memtable.size());
    for (const auto& [key, value] : engine.memtable) {
        pairs.emplace_back(key, value);
    }

    std::string path = (fs::path(engine.dir) / runFileName(engine.next_run_id)).string();
    uint64_t file_size = 0;
    Status status = writeRunFile(path, pairs, config_.run_compression, file_size);
    if (!status.ok()) {
        return status;
    }
    status = syncDirectory(engine.dir);
    if (!status.ok()) {
        return status;
    }

    engine.runs.push_back(path);
    engine.next_run_id++;
    engine.run_bytes.fetch_add(static_cast<int64_t>(file_size));
    engine.memtable.clear();
    engine.mem_bytes.store(0);
    return Status::OK();
}

Status LocalBackend::mergeLocked(LocalEngine& engine, std::vector<KvPair>& pairs) {
    std::map<std::string, std::string> merged;
    for (const std::string& path : engine.runs) {
        std::vector<KvPair> run;
        Status status = readRunFile(path, run);
        if (!status.ok()) {
            return status;
        }
        for (KvPair& pair : run) {
            merged[std::move(pair.key)] = std::move(pair.value);
        }
    }
    for (const auto& [key, value] : engine.memtable) {
        merged[key] = value;
    }

    pairs.clear();
    pairs.reserve(merged.size());
    for (auto& [key, value] : merged) {
        pairs.emplace_back(key, std::move(value));
    }
    return Status::OK();
}

}  // namespace xload
