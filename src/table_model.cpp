#include "xLoad/table_model.h"

namespace xload {

int TableInfo::handleColumnOffset() const {
    if (!pk_is_handle) {
        return -1;
    }
    for (const ColumnInfo& column : columns) {
        if (column.is_primary_key && column.type == ColumnType::INT) {
            return column.offset;
        }
    }
    return -1;
}

bool TableInfo::hasValidColumnLayout() const {
    if (state != SchemaState::PUBLIC) {
        return false;
    }
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i].state != SchemaState::PUBLIC ||
            columns[i].offset != static_cast<int>(i)) {
            return false;
        }
    }
    return true;
}

}  // namespace xload
