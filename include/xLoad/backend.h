#ifndef XLOAD_BACKEND_H_
#define XLOAD_BACKEND_H_

#include "context.h"
#include "encoding.h"
#include "engine_uuid.h"
#include "status.h"
#include "table_model.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace xload {

// ============================================================================
// IAbstractBackend - capability interface of a storage backend
// ============================================================================

/// Local footprint of one engine
struct EngineFileSize {
    EngineUUID uuid;
    int64_t size;
    bool is_importing;

    EngineFileSize() : size(0), is_importing(false) {}
    EngineFileSize(const EngineUUID& u, int64_t s, bool importing)
        : uuid(u), size(s), is_importing(importing) {}
};

/// Abstract interface behind Backend.
/// Implementations must be thread safe: one instance is shared by every
/// table worker and any method may be called from any thread. Each engine
/// operation must be all-or-nothing so that it can be retried.
class IAbstractBackend {
public:
    virtual ~IAbstractBackend() = default;

    /// Close the connection to the backend
    virtual void close() = 0;

    /// Create an empty collection of encoded rows
    virtual std::unique_ptr<IRows> makeEmptyRows() = 0;

    /// Delay between import retries
    virtual std::chrono::milliseconds retryImportDelay() const = 0;

    /// Maximum chunk size accepted by writeRows, used by IRows::splitIntoChunks
    virtual size_t maxChunkSize() const = 0;

    /// Whether checksum and analyze should run after import
    virtual bool shouldPostProcess() const = 0;

    /// Create an encoder for a table
    virtual std::unique_ptr<IEncoder> newEncoder(const TableInfo& table,
                                                 const SessionOptions& options) = 0;

    virtual Status openEngine(const Context& ctx, const EngineUUID& engine_uuid) = 0;

    /// Write one chunk of rows
    /// @param commit_ts Commit timestamp fixed when the engine was opened
    virtual Status writeRows(const Context& ctx,
                             const EngineUUID& engine_uuid,
                             const std::string& table_name,
                             const std::vector<std::string>& column_names,
                             uint64_t commit_ts,
                             const IRows& rows) = 0;

    virtual Status closeEngine(const Context& ctx, const EngineUUID& engine_uuid) = 0;

    /// Import the engine into the target. Must be idempotent.
    virtual Status importEngine(const Context& ctx, const EngineUUID& engine_uuid) = 0;

    virtual Status cleanupEngine(const Context& ctx, const EngineUUID& engine_uuid) = 0;

    /// Check whether the backend satisfies version requirements
    virtual Status checkRequirements(const Context& ctx) = 0;

    /// Obtain the models of all tables of a schema. Each model must carry
    /// at least name, state (PUBLIC), id, public columns with offsets
    /// 0, 1, 2, ... and pk_is_handle.
    virtual Status fetchRemoteTableModels(const Context& ctx,
                                          const std::string& schema_name,
                                          std::vector<TableInfo>& tables) = 0;

    /// Make all pairs written to an open engine durable, so that a restart
    /// resuming from checkpoint recovers exactly that content.
    /// No-op for backends that keep nothing locally.
    virtual Status flushEngine(const EngineUUID& engine_uuid) = 0;

    /// flushEngine on every open engine. Expensive; meant for resolving a
    /// disk quota violation.
    virtual Status flushAllEngines() = 0;

    /// Local footprint of every engine, used to compute the disk quota.
    /// Empty if content is stored remotely.
    virtual std::vector<EngineFileSize> engineFileSizes() = 0;

    /// Clear all pairs written to an open engine; the engine stays open
    virtual Status resetEngine(const Context& ctx, const EngineUUID& engine_uuid) = 0;
};

}  // namespace xload

#endif  // XLOAD_BACKEND_H_
