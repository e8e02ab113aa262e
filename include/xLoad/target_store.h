#ifndef XLOAD_TARGET_STORE_H_
#define XLOAD_TARGET_STORE_H_

#include "context.h"
#include "kv_encoding.h"
#include "status.h"
#include "table_model.h"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace xload {

// ============================================================================
// TargetStore - SQLite database receiving imported engines
// ============================================================================

class TargetStore {
public:
    /// Constructor
    /// @param db_path Path to SQLite database file
    explicit TargetStore(const std::string& db_path);

    /// Destructor
    ~TargetStore();

    // Disable copy and move
    TargetStore(const TargetStore&) = delete;
    TargetStore& operator=(const TargetStore&) = delete;
    TargetStore(TargetStore&&) = delete;
    TargetStore& operator=(TargetStore&&) = delete;

    /// Open database connection
    Status open();

    /// Close database connection
    void close();

    bool isOpen() const;

    /// Create tables if missing
    Status initSchema();

    /// Ingest pairs in a single transaction. Existing keys are replaced, so
    /// ingesting the same pairs twice leaves the same content.
    Status ingest(const Context& ctx, const std::vector<KvPair>& pairs);

    /// Point lookup
    /// @param found Output: whether the key exists
    Status get(const std::string& key, std::string& value, bool& found);

    /// Number of stored pairs
    Status countPairs(int64_t& count);

    /// All stored pairs in key order
    Status scanPairs(std::vector<KvPair>& pairs);

    // ========================================================================
    // Table catalog
    // ========================================================================

    /// Store or replace the model of a table
    Status registerTableModel(const std::string& schema_name, const TableInfo& table);

    /// Load every table model of a schema, ordered by table id
    Status loadTableModels(const std::string& schema_name, std::vector<TableInfo>& tables);

private:
    /// Execute SQL statement (caller holds mutex_)
    Status executeSql(const std::string& sql);

    /// Roll back the open transaction and return cause
    Status rollback(const Status& cause);

    /// Map a SQLite result code to a Status
    Status sqliteError(int rc, const std::string& what) const;

    std::string db_path_;     // Database file path
    sqlite3* db_;             // SQLite database handle
    mutable std::mutex mutex_;
};

}  // namespace xload

#endif  // XLOAD_TARGET_STORE_H_
