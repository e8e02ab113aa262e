#ifndef XLOAD_DELIVERY_H_
#define XLOAD_DELIVERY_H_

#include "backend.h"
#include "engine_counters.h"
#include "logger.h"
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

namespace xload {

// ============================================================================
// Delivery target
// ============================================================================
//
// Usual workflow:
//
// 1. Create one Backend for the whole process.
// 2. For each table, split the data files into batches of roughly equal size.
//    For each batch:
//    a. open an OpenedEngine via Backend::openEngine()
//    b. deliver every chunk into the engine via OpenedEngine::writeRows()
//    c. when all chunks are written, obtain a ClosedEngine via
//       OpenedEngine::close()
//    d. import the data via ClosedEngine::import()
//    e. clean up via ClosedEngine::cleanup()
// 3. Close the connection via Backend::close().

class ClosedEngine;
class EngineRecovery;

// ============================================================================
// WriteGate - writers share it, the quota enforcer takes it exclusively
// ============================================================================

class WriteGate {
public:
    WriteGate() = default;

    // Disable copy and move
    WriteGate(const WriteGate&) = delete;
    WriteGate& operator=(const WriteGate&) = delete;

    /// Held by a writer around OpenedEngine::writeRows
    std::shared_lock<std::shared_mutex> acquireShared() {
        return std::shared_lock<std::shared_mutex>(mutex_);
    }

    /// Held by the enforcer while flushing and importing
    std::unique_lock<std::shared_mutex> acquireExclusive() {
        return std::unique_lock<std::shared_mutex>(mutex_);
    }

private:
    std::shared_mutex mutex_;
};

/// State shared by opened and closed engines
class Engine {
public:
    Engine(std::shared_ptr<IAbstractBackend> backend, Logger logger, const EngineUUID& uuid);

    const EngineUUID& uuid() const { return uuid_; }
    const Logger& logger() const { return logger_; }

protected:
    /// Close through the backend without touching counters
    Status unsafeClose(const Context& ctx, std::unique_ptr<ClosedEngine>& out) const;

    std::shared_ptr<IAbstractBackend> backend_;
    Logger logger_;
    EngineUUID uuid_;

    friend class EngineRecovery;
};

/// An opened engine, accepting writes. Thread safe.
class OpenedEngine : public Engine {
public:
    OpenedEngine(std::shared_ptr<IAbstractBackend> backend,
                 Logger logger,
                 const EngineUUID& uuid,
                 std::string table_name,
                 uint64_t ts,
                 std::shared_ptr<EngineCounters> counters,
                 std::shared_ptr<WriteGate> gate);

    /// Write a collection of encoded rows. Rows are split into chunks of at
    /// most maxChunkSize() bytes, written in order; each chunk gets up to
    /// kMaxRetryTimes attempts when the failure is retryable. Each chunk is
    /// written under the shared side of the backend's write gate.
    Status writeRows(const Context& ctx,
                     const std::vector<std::string>& column_names,
                     const IRows& rows);

    /// Make the written data durable (local backend only)
    Status flush();

    /// Close the engine to prepare it for importing. On failure the engine
    /// stays open.
    Status close(const Context& ctx, std::unique_ptr<ClosedEngine>& out);

    const std::string& tableName() const { return table_name_; }
    uint64_t commitTS() const { return ts_; }

private:
    std::string table_name_;
    uint64_t ts_;
    std::shared_ptr<EngineCounters> counters_;
    std::shared_ptr<WriteGate> gate_;
};

/// A closed engine, ready for import. Thread safe.
class ClosedEngine : public Engine {
public:
    using Engine::Engine;

    /// Import the written data into the target. Retryable failures are
    /// retried up to kMaxRetryTimes, sleeping retryImportDelay() in between.
    Status import(const Context& ctx);

    /// Delete the intermediate data of the engine
    Status cleanup(const Context& ctx);
};

/// Result of Backend::checkDiskQuota
struct DiskQuotaResult {
    std::vector<EngineUUID> large_engines;      // Idle engines to import, smallest first
    int in_progress_large_engines;              // Over-quota engines already importing
    int64_t total_size;                         // Sum over all engines

    DiskQuotaResult() : in_progress_large_engines(0), total_size(0) {}
};

/// The delivery target: one per process, wrapping exactly one backend.
/// Thread safe.
class Backend {
public:
    explicit Backend(std::shared_ptr<IAbstractBackend> abstract);
    Backend(std::shared_ptr<IAbstractBackend> abstract, std::shared_ptr<LogSink> sink);

    // Disable copy and move (handles hold the counters)
    Backend(const Backend&) = delete;
    Backend& operator=(const Backend&) = delete;
    Backend(Backend&&) = delete;
    Backend& operator=(Backend&&) = delete;

    /// Close the connection to the backend
    void close();

    std::unique_ptr<IRows> makeEmptyRows();
    std::unique_ptr<IEncoder> newEncoder(const TableInfo& table, const SessionOptions& options);
    bool shouldPostProcess() const;
    Status checkRequirements(const Context& ctx);
    Status fetchRemoteTableModels(const Context& ctx,
                                  const std::string& schema_name,
                                  std::vector<TableInfo>& tables);

    /// Flush every engine. Expensive; call only before quota-triggered imports.
    Status flushAll();

    /// Check the total engine size against the quota. When exceeded, the
    /// result lists the engines which, once imported, bring the total back
    /// below the quota.
    DiskQuotaResult checkDiskQuota(int64_t quota);

    /// Open an engine for a table batch
    /// @param table_name Qualified table name
    /// @param engine_id Batch ordinal
    /// @param out Output: opened engine
    Status openEngine(const Context& ctx,
                      const std::string& table_name,
                      int32_t engine_id,
                      std::unique_ptr<OpenedEngine>& out);

    /// Operations bypassing the Open -> Write -> Close -> Import sequence
    EngineRecovery recovery();

    /// Replace the check run after every open (default: no-op)
    void setEngineCountPolicy(std::shared_ptr<IEngineCountPolicy> policy);

    const EngineCounters& counters() const { return *counters_; }
    const std::shared_ptr<WriteGate>& writeGate() const { return write_gate_; }
    const std::shared_ptr<IAbstractBackend>& abstract() const { return abstract_; }

private:
    Logger makeEngineLogger(const std::string& tag, const EngineUUID& uuid) const;

    std::shared_ptr<IAbstractBackend> abstract_;
    std::shared_ptr<LogSink> sink_;
    std::shared_ptr<EngineCounters> counters_;
    std::shared_ptr<WriteGate> write_gate_;
    std::shared_ptr<IEngineCountPolicy> policy_;
    std::mutex policy_mutex_;

    friend class EngineRecovery;
};

/// Recovery surface of a Backend. These operations do not follow the normal
/// sequence and are only valid when the caller knows the engine state from
/// elsewhere, e.g. a checkpoint.
class EngineRecovery {
public:
    explicit EngineRecovery(Backend& backend) : backend_(backend) {}

    /// Close an engine that was opened by an earlier process
    Status unsafeCloseEngine(const Context& ctx,
                             const std::string& table_name,
                             int32_t engine_id,
                             std::unique_ptr<ClosedEngine>& out);

    Status unsafeCloseEngineWithUUID(const Context& ctx,
                                     const std::string& tag,
                                     const EngineUUID& engine_uuid,
                                     std::unique_ptr<ClosedEngine>& out);

    /// Import the content of an open engine and reset it to empty without
    /// closing it; the engine stays writable. The caller must flush the
    /// engine first.
    Status unsafeImportAndReset(const Context& ctx, const EngineUUID& engine_uuid);

private:
    Backend& backend_;
};

}  // namespace xload

#endif  // XLOAD_DELIVERY_H_
