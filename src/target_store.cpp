#include "xLoad/target_store.h"
#include <functional>
#include <sstream>

namespace xload {

namespace {

// Finalizes a prepared statement on scope exit
class Statement {
public:
    Statement() : stmt_(nullptr) {}
    ~Statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    int prepare(sqlite3* db, const char* sql) {
        return sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_;
};

void bindBlob(sqlite3_stmt* stmt, int index, const std::string& data) {
    sqlite3_bind_blob(stmt, index, data.data(), static_cast<int>(data.size()), SQLITE_TRANSIENT);
}

void bindText(sqlite3_stmt* stmt, int index, const std::string& text) {
    sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

std::string columnBlob(sqlite3_stmt* stmt, int index) {
    const void* data = sqlite3_column_blob(stmt, index);
    int size = sqlite3_column_bytes(stmt, index);
    if (!data || size <= 0) {
        return std::string();
    }
    return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

std::string columnText(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

std::string joinOffsets(const std::vector<int>& offsets) {
    std::ostringstream out;
    for (size_t i = 0; i < offsets.size(); ++i) {
        if (i > 0) out << ",";
        out << offsets[i];
    }
    return out.str();
}

std::vector<int> splitOffsets(const std::string& text) {
    std::vector<int> offsets;
    std::istringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        if (!item.empty()) {
            offsets.push_back(std::stoi(item));
        }
    }
    return offsets;
}

constexpr size_t kIngestCancelCheckInterval = 1024;

}  // namespace

TargetStore::TargetStore(const std::string& db_path)
    : db_path_(db_path), db_(nullptr) {
}

TargetStore::~TargetStore() {
    close();
}

Status TargetStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        return Status::OK();
    }

    int rc = sqlite3_open(db_path_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        Status status = sqliteError(rc, "failed to open target database '" + db_path_ + "'");
        sqlite3_close(db_);
        db_ = nullptr;
        return status;
    }

    // Concurrent importers wait instead of failing immediately
    sqlite3_busy_timeout(db_, 5000);

    // Enable WAL mode for better concurrency
    return executeSql("PRAGMA journal_mode=WAL");
}

void TargetStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool TargetStore::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

Status TargetStore::sqliteError(int rc, const std::string& what) const {
    std::string message = what;
    if (db_) {
        message += ": ";
        message += sqlite3_errmsg(db_);
    }

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Status(ErrorCode::ERR_BUSY, message);
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Status(ErrorCode::ERR_CORRUPTION, message);
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_READONLY:
            return Status(ErrorCode::ERR_IO_FAILED, message);
        default:
            return Status(ErrorCode::ERR_INTERNAL, message);
    }
}

Status TargetStore::executeSql(const std::string& sql) {
    if (!db_) {
        return Status(ErrorCode::ERR_UNAVAILABLE, "target database is not open");
    }

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string error = err_msg ? err_msg : "Unknown error";
        sqlite3_free(err_msg);
        return sqliteError(rc, "SQL execution failed (" + error + ")");
    }
    return Status::OK();
}

Status TargetStore::rollback(const Status& cause) {
    Status status = executeSql("ROLLBACK;");
    if (!status.ok()) {
        return cause.annotate("rollback failed (" + status.message() + ")");
    }
    return cause;
}

Status TargetStore::initSchema() {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = executeSql(R"(
        CREATE TABLE IF NOT EXISTS kv (
            key BLOB PRIMARY KEY,
            value BLOB NOT NULL
        ) WITHOUT ROWID;
    )");
    if (!status.ok()) {
        return status;
    }

    status = executeSql(R"(
        CREATE TABLE IF NOT EXISTS table_models (
            schema_name TEXT NOT NULL,
            table_name TEXT NOT NULL,
            table_id INTEGER NOT NULL,
            state INTEGER NOT NULL,
            pk_is_handle INTEGER NOT NULL,
            PRIMARY KEY (schema_name, table_name)
        );
    )");
    if (!status.ok()) {
        return status;
    }

    status = executeSql(R"(
        CREATE TABLE IF NOT EXISTS column_models (
            table_id INTEGER NOT NULL,
            column_offset INTEGER NOT NULL,
            name TEXT NOT NULL,
            type INTEGER NOT NULL,
            state INTEGER NOT NULL,
            is_primary_key INTEGER NOT NULL,
            PRIMARY KEY (table_id, column_offset)
        );
    )");
    if (!status.ok()) {
        return status;
    }

    return executeSql(R"(
        CREATE TABLE IF NOT EXISTS index_models (
            table_id INTEGER NOT NULL,
            index_id INTEGER NOT NULL,
            name TEXT NOT NULL,
            is_unique INTEGER NOT NULL,
            state INTEGER NOT NULL,
            column_offsets TEXT NOT NULL,
            PRIMARY KEY (table_id, index_id)
        );
    )");
}

Status TargetStore::ingest(const Context& ctx, const std::vector<KvPair>& pairs) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = executeSql("BEGIN IMMEDIATE TRANSACTION;");
    if (!status.ok()) {
        return status;
    }

    Statement stmt;
    int rc = stmt.prepare(db_, "INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);");
    if (rc != SQLITE_OK) {
        status = sqliteError(rc, "failed to prepare ingest");
    }

    for (size_t i = 0; status.ok() && i < pairs.size(); ++i) {
        if (i % kIngestCancelCheckInterval == 0) {
            status = ctx.status();
            if (!status.ok()) {
                break;
            }
        }

        bindBlob(stmt.get(), 1, pairs[i].key);
        bindBlob(stmt.get(), 2, pairs[i].value);
        rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            status = sqliteError(rc, "failed to ingest pair");
        }
        sqlite3_reset(stmt.get());
    }

    if (!status.ok()) {
        return rollback(status);
    }
    return executeSql("COMMIT;");
}

Status TargetStore::get(const std::string& key, std::string& value, bool& found) {
    std::lock_guard<std::mutex> lock(mutex_);
    found = false;
    if (!db_) {
        return Status(ErrorCode::ERR_UNAVAILABLE, "target database is not open");
    }

    Statement stmt;
    int rc = stmt.prepare(db_, "SELECT value FROM kv WHERE key = ?;");
    if (rc != SQLITE_OK) {
        return sqliteError(rc, "failed to prepare lookup");
    }
    bindBlob(stmt.get(), 1, key);

    rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        value = columnBlob(stmt.get(), 0);
        found = true;
        return Status::OK();
    }
    if (rc == SQLITE_DONE) {
        return Status::OK();
    }
    return sqliteError(rc, "failed to look up key");
}

Status TargetStore::countPairs(int64_t& count) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Status(ErrorCode::ERR_UNAVAILABLE, "target database is not open");
    }

    Statement stmt;
    int rc = stmt.prepare(db_, "SELECT COUNT(*) FROM kv;");
    if (rc != SQLITE_OK) {
        return sqliteError(rc, "failed to prepare count");
    }
    rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW) {
        return sqliteError(rc, "failed to count pairs");
    }
    count = sqlite3_column_int64(stmt.get(), 0);
    return Status::OK();
}

Status TargetStore::scanPairs(std::vector<KvPair>& pairs) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Status(ErrorCode::ERR_UNAVAILABLE, "target database is not open");
    }

    Statement stmt;
    int rc = stmt.prepare(db_, "SELECT key, value FROM kv ORDER BY key;");
    if (rc != SQLITE_OK) {
        return sqliteError(rc, "failed to prepare scan");
    }

    pairs.clear();
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        pairs.emplace_back(columnBlob(stmt.get(), 0), columnBlob(stmt.get(), 1));
    }
    if (rc != SQLITE_DONE) {
        return sqliteError(rc, "failed to scan pairs");
    }
    return Status::OK();
}

Status TargetStore::registerTableModel(const std::string& schema_name, const TableInfo& table) {
    std::lock_guard<std::mutex> lock(mutex_);

    Status status = executeSql("BEGIN IMMEDIATE TRANSACTION;");
    if (!status.ok()) {
        return status;
    }

    auto run = [this](const char* sql, const std::function<void(sqlite3_stmt*)>& bind) {
        Statement stmt;
        int rc = stmt.prepare(db_, sql);
        if (rc != SQLITE_OK) {
            return sqliteError(rc, "failed to prepare catalog statement");
        }
        bind(stmt.get());
        rc = sqlite3_step(stmt.get());
        if (rc != SQLITE_DONE) {
            return sqliteError(rc, "failed to update catalog");
        }
        return Status::OK();
    };

    status = run("INSERT OR REPLACE INTO table_models "
                 "(schema_name, table_name, table_id, state, pk_is_handle) VALUES (?, ?, ?, ?, ?);",
                 [&](sqlite3_stmt* stmt) {
                     bindText(stmt, 1, schema_name);
                     bindText(stmt, 2, table.name);
                     sqlite3_bind_int64(stmt, 3, table.id);
                     sqlite3_bind_int(stmt, 4, static_cast<int>(table.state));
                     sqlite3_bind_int(stmt, 5, table.pk_is_handle ? 1 : 0);
                 });
    if (status.ok()) {
        status = run("DELETE FROM column_models WHERE table_id = ?;",
                     [&](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, table.id); });
    }
    if (status.ok()) {
        status = run("DELETE FROM index_models WHERE table_id = ?;",
                     [&](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, table.id); });
    }
    for (size_t i = 0; status.ok() && i < table.columns.size(); ++i) {
        const ColumnInfo& column = table.columns[i];
        status = run("INSERT INTO column_models "
                     "(table_id, column_offset, name, type, state, is_primary_key) VALUES (?, ?, ?, ?, ?, ?);",
                     [&](sqlite3_stmt* stmt) {
                         sqlite3_bind_int64(stmt, 1, table.id);
                         sqlite3_bind_int(stmt, 2, column.offset);
                         bindText(stmt, 3, column.name);
                         sqlite3_bind_int(stmt, 4, static_cast<int>(column.type));
                         sqlite3_bind_int(stmt, 5, static_cast<int>(column.state));
                         sqlite3_bind_int(stmt, 6, column.is_primary_key ? 1 : 0);
                     });
    }
    for (size_t i = 0; status.ok() && i < table.indices.size(); ++i) {
        const IndexInfo& index = table.indices[i];
        status = run("INSERT INTO index_models "
                     "(table_id, index_id, name, is_unique, state, column_offsets) VALUES (?, ?, ?, ?, ?, ?);",
                     [&](sqlite3_stmt* stmt) {
                         sqlite3_bind_int64(stmt, 1, table.id);
                         sqlite3_bind_int64(stmt, 2, index.id);
                         bindText(stmt, 3, index.name);
                         sqlite3_bind_int(stmt, 4, index.unique ? 1 : 0);
                         sqlite3_bind_int(stmt, 5, static_cast<int>(index.state));
                         bindText(stmt, 6, joinOffsets(index.column_offsets));
                     });
    }

    if (!status.ok()) {
        return rollback(status);
    }
    return executeSql("COMMIT;");
}

Status TargetStore::loadTableModels(const std::string& schema_name, std::vector<TableInfo>& tables) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return Status(ErrorCode::ERR_UNAVAILABLE, "target database is not open");
    }

    tables.clear();

    Statement table_stmt;
    int rc = table_stmt.prepare(db_,
        "SELECT table_name, table_id, state, pk_is_handle FROM table_models "
        "WHERE schema_name = ? ORDER BY table_id;");
    if (rc != SQLITE_OK) {
        return sqliteError(rc, "failed to prepare table query");
    }
    bindText(table_stmt.get(), 1, schema_name);

    while ((rc = sqlite3_step(table_stmt.get())) == SQLITE_ROW) {
        TableInfo table;
        table.name = columnText(table_stmt.get(), 0);
        table.id = sqlite3_column_int64(table_stmt.get(), 1);
        table.state = static_cast<SchemaState>(sqlite3_column_int(table_stmt.get(), 2));
        table.pk_is_handle = sqlite3_column_int(table_stmt.get(), 3) != 0;
        tables.push_back(std::move(table));
    }
    if (rc != SQLITE_DONE) {
        return sqliteError(rc, "failed to query table models");
    }

    for (TableInfo& table : tables) {
        Statement column_stmt;
        rc = column_stmt.prepare(db_,
            "SELECT column_offset, name, type, state, is_primary_key FROM column_models "
            "WHERE table_id = ? ORDER BY column_offset;");
        if (rc != SQLITE_OK) {
            return sqliteError(rc, "failed to prepare column query");
        }
        sqlite3_bind_int64(column_stmt.get(), 1, table.id);
        while ((rc = sqlite3_step(column_stmt.get())) == SQLITE_ROW) {
            ColumnInfo column;
            column.offset = sqlite3_column_int(column_stmt.get(), 0);
            column.name = columnText(column_stmt.get(), 1);
            column.type = static_cast<ColumnType>(sqlite3_column_int(column_stmt.get(), 2));
            column.state = static_cast<SchemaState>(sqlite3_column_int(column_stmt.get(), 3));
            column.is_primary_key = sqlite3_column_int(column_stmt.get(), 4) != 0;
            table.columns.push_back(std::move(column));
        }
        if (rc != SQLITE_DONE) {
            return sqliteError(rc, "failed to query column models");
        }

        Statement index_stmt;
        rc = index_stmt.prepare(db_,
            "SELECT index_id, name, is_unique, state, column_offsets FROM index_models "
            "WHERE table_id = ? ORDER BY index_id;");
        if (rc != SQLITE_OK) {
            return sqliteError(rc, "failed to prepare index query");
        }
        sqlite3_bind_int64(index_stmt.get(), 1, table.id);
        while ((rc = sqlite3_step(index_stmt.get())) == SQLITE_ROW) {
            IndexInfo index;
            index.id = sqlite3_column_int64(index_stmt.get(), 0);
            index.name = columnText(index_stmt.get(), 1);
            index.unique = sqlite3_column_int(index_stmt.get(), 2) != 0;
            index.state = static_cast<SchemaState>(sqlite3_column_int(index_stmt.get(), 3));
            index.column_offsets = splitOffsets(columnText(index_stmt.get(), 4));
            table.indices.push_back(std::move(index));
        }
        if (rc != SQLITE_DONE) {
            return sqliteError(rc, "failed to query index models");
        }
    }

    return Status::OK();
}

}  // namespace xload
