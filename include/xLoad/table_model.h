#ifndef XLOAD_TABLE_MODEL_H_
#define XLOAD_TABLE_MODEL_H_

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace xload {

// ============================================================================
// Table models (the subset needed to reconstruct a column layout)
// ============================================================================

/// Schema object state; only PUBLIC objects are loadable
enum class SchemaState : uint8_t {
    NONE = 0,
    DELETE_ONLY = 1,
    WRITE_ONLY = 2,
    WRITE_REORGANIZATION = 3,
    DELETE_REORGANIZATION = 4,
    PUBLIC = 5
};

enum class ColumnType : uint8_t {
    INT = 1,
    DOUBLE = 2,
    STRING = 3
};

/// A single SQL value
using Datum = std::variant<std::monostate, int64_t, double, std::string>;

inline bool datumIsNull(const Datum& d) {
    return std::holds_alternative<std::monostate>(d);
}

struct ColumnInfo {
    std::string name;
    int offset;              // Zero-based position among public columns
    ColumnType type;
    SchemaState state;
    bool is_primary_key;

    ColumnInfo()
        : offset(0), type(ColumnType::INT), state(SchemaState::PUBLIC),
          is_primary_key(false) {}
};

struct IndexInfo {
    int64_t id;
    std::string name;
    std::vector<int> column_offsets;
    bool unique;
    SchemaState state;

    IndexInfo() : id(0), unique(false), state(SchemaState::PUBLIC) {}
};

struct TableInfo {
    int64_t id;
    std::string name;
    SchemaState state;
    std::vector<ColumnInfo> columns;
    std::vector<IndexInfo> indices;
    bool pk_is_handle;       // true = integer primary key is the row handle

    TableInfo() : id(0), state(SchemaState::PUBLIC), pk_is_handle(false) {}

    /// Offset of the handle column, or -1
    int handleColumnOffset() const;

    /// True if every column is public with offsets 0, 1, 2, ...
    bool hasValidColumnLayout() const;
};

/// Per-table encoding options
struct SessionOptions {
    bool strict_sql_mode;    // Reject values not matching the column type
    int64_t timestamp;       // Seconds since epoch used for defaults

    SessionOptions() : strict_sql_mode(true), timestamp(0) {}
};

}  // namespace xload

#endif  // XLOAD_TABLE_MODEL_H_
