#ifndef XLOAD_LOCAL_BACKEND_H_
#define XLOAD_LOCAL_BACKEND_H_

#include "backend.h"
#include "config.h"
#include "kv_encoding.h"
#include "logger.h"
#include "target_store.h"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace xload {

// ============================================================================
// LocalBackend - engines as sorted run files on local disk
// ============================================================================
//
// Layout:
//   <sorted_kv_dir>/<engine-uuid>/run_000001.kv
//   <sorted_kv_dir>/<engine-uuid>/run_000002.kv
//   ...
//
// Writes go to a per-engine memtable; flush spills the memtable to the next
// run file. Import merges all runs in order (later runs win) and ingests the
// result into the target store.

class LocalBackend : public IAbstractBackend {
public:
    /// Constructor
    /// @param config Delivery configuration
    /// @param sink Log sink (nullptr = std::cerr at config.log_level)
    explicit LocalBackend(const DeliveryConfig& config,
                          std::shared_ptr<LogSink> sink = nullptr);

    /// Destructor - closes the backend if still open
    ~LocalBackend() override;

    // Disable copy and move
    LocalBackend(const LocalBackend&) = delete;
    LocalBackend& operator=(const LocalBackend&) = delete;
    LocalBackend(LocalBackend&&) = delete;
    LocalBackend& operator=(LocalBackend&&) = delete;

    /// Create the sorted-KV directory and open the target store
    Status open();

    // ========================================================================
    // IAbstractBackend
    // ========================================================================

    void close() override;
    std::unique_ptr<IRows> makeEmptyRows() override;
    std::chrono::milliseconds retryImportDelay() const override;
    size_t maxChunkSize() const override;
    bool shouldPostProcess() const override { return true; }
    std::unique_ptr<IEncoder> newEncoder(const TableInfo& table,
                                         const SessionOptions& options) override;

    Status openEngine(const Context& ctx, const EngineUUID& engine_uuid) override;
    Status writeRows(const Context& ctx,
                     const EngineUUID& engine_uuid,
                     const std::string& table_name,
                     const std::vector<std::string>& column_names,
                     uint64_t commit_ts,
                     const IRows& rows) override;
    Status closeEngine(const Context& ctx, const EngineUUID& engine_uuid) override;
    Status importEngine(const Context& ctx, const EngineUUID& engine_uuid) override;
    Status cleanupEngine(const Context& ctx, const EngineUUID& engine_uuid) override;

    Status checkRequirements(const Context& ctx) override;
    Status fetchRemoteTableModels(const Context& ctx,
                                  const std::string& schema_name,
                                  std::vector<TableInfo>& tables) override;

    Status flushEngine(const EngineUUID& engine_uuid) override;
    Status flushAllEngines() override;
    std::vector<EngineFileSize> engineFileSizes() override;
    Status resetEngine(const Context& ctx, const EngineUUID& engine_uuid) override;

    // ========================================================================
    // Introspection
    // ========================================================================

    /// Directory of an engine
    std::string engineDir(const EngineUUID& engine_uuid) const;

    /// Number of run files of a loaded engine (0 if unknown)
    size_t runCount(const EngineUUID& engine_uuid) const;

    /// Number of engines known to this process
    size_t engineCount() const;

    TargetStore& targetStore() { return *target_; }

private:
    /// Per-engine state. mutex guards everything except the atomics, which
    /// engineFileSizes reads without blocking behind an import.
    struct LocalEngine {
        EngineUUID uuid;
        std::string dir;

        std::mutex mutex;
        std::map<std::string, std::string> memtable;
        std::vector<std::string> runs;      // Run file paths, oldest first
        uint32_t next_run_id;
        bool closed;

        std::atomic<int64_t> run_bytes;
        std::atomic<int64_t> mem_bytes;
        std::atomic<bool> importing;

        LocalEngine(const EngineUUID& u, std::string d)
            : uuid(u), dir(std::move(d)), next_run_id(1), closed(false),
              run_bytes(0), mem_bytes(0), importing(false) {}
    };

    using EnginePtr = std::shared_ptr<LocalEngine>;

    /// Find an engine, loading it from disk when this process has not seen it
    /// @param create Create the directory if it does not exist
    Status loadEngine(const EngineUUID& engine_uuid, bool create, EnginePtr& out);

    /// Find an engine known to this process
    EnginePtr findEngine(const EngineUUID& engine_uuid) const;

    /// Scan the engine directory for run files left by a previous process
    Status scanRuns(LocalEngine& engine);

    /// Spill the memtable to a new run file (caller holds engine.mutex)
    Status flushLocked(LocalEngine& engine);

    /// Merge runs and memtable (caller holds engine.mutex)
    Status mergeLocked(LocalEngine& engine, std::vector<KvPair>& pairs);

    DeliveryConfig config_;
    Logger logger_;
    std::unique_ptr<TargetStore> target_;

    mutable std::mutex engines_mutex_;
    std::map<EngineUUID, EnginePtr> engines_;
};

}  // namespace xload

#endif  // XLOAD_LOCAL_BACKEND_H_
