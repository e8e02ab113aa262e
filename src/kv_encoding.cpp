#include "xLoad/kv_encoding.h"
#include <cstring>
#include <stdexcept>

namespace xload {

namespace {

constexpr uint64_t kSignMask = 0x8000000000000000ull;
constexpr size_t kPrefixSize = 1 + 8 + 2;  // 't' + table_id + "_r"/"_i"

// Value tags of encodeRowValue
constexpr uint8_t kTagNull = 0;
constexpr uint8_t kTagInt = 1;
constexpr uint8_t kTagDouble = 2;
constexpr uint8_t kTagString = 3;

void appendU64(std::string& buf, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buf.push_back(static_cast<char>((v >> shift) & 0xFF));
    }
}

void appendU32(std::string& buf, uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buf.push_back(static_cast<char>((v >> shift) & 0xFF));
    }
}

uint64_t readU64(const std::string& buf, size_t pos) {
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i) {
        v = (v << 8) | static_cast<uint8_t>(buf[pos + i]);
    }
    return v;
}

uint32_t readU32(const std::string& buf, size_t pos) {
    uint32_t v = 0;
    for (size_t i = 0; i < 4; ++i) {
        v = (v << 8) | static_cast<uint8_t>(buf[pos + i]);
    }
    return v;
}

uint64_t doubleBits(double d) {
    uint64_t bits;
    std::memcpy(&bits, &d, sizeof(bits));
    return bits;
}

void appendTablePrefix(std::string& key, int64_t table_id, const char* kind) {
    key.push_back('t');
    appendU64(key, static_cast<uint64_t>(table_id) ^ kSignMask);
    key.append(kind, 2);
}

// Memcomparable form of one index value
void appendIndexValue(std::string& key, const Datum& value) {
    if (std::holds_alternative<int64_t>(value)) {
        key.push_back(static_cast<char>(kTagInt));
        appendU64(key, static_cast<uint64_t>(std::get<int64_t>(value)) ^ kSignMask);
    } else if (std::holds_alternative<double>(value)) {
        uint64_t bits = doubleBits(std::get<double>(value));
        bits = (bits & kSignMask) ? ~bits : (bits | kSignMask);
        key.push_back(static_cast<char>(kTagDouble));
        appendU64(key, bits);
    } else if (std::holds_alternative<std::string>(value)) {
        key.push_back(static_cast<char>(kTagString));
        for (char c : std::get<std::string>(value)) {
            key.push_back(c);
            if (c == '\0') {
                key.push_back(static_cast<char>(0xFF));
            }
        }
        key.push_back('\0');
        key.push_back('\x01');
    } else {
        key.push_back(static_cast<char>(kTagNull));
    }
}

}  // namespace

// ============================================================================
// KvPairs
// ============================================================================

std::vector<std::unique_ptr<IRows>> KvPairs::splitIntoChunks(size_t split_size) const {
    std::vector<std::unique_ptr<IRows>> result;
    if (pairs_.empty()) {
        return result;
    }

    size_t begin = 0;
    size_t cum_size = 0;
    for (size_t i = 0; i < pairs_.size(); ++i) {
        size_t size = pairs_[i].byteSize();
        if (begin < i && cum_size + size > split_size) {
            result.push_back(std::make_unique<KvPairs>(
                std::vector<KvPair>(pairs_.begin() + begin, pairs_.begin() + i)));
            begin = i;
            cum_size = 0;
        }
        cum_size += size;
    }
    result.push_back(std::make_unique<KvPairs>(
        std::vector<KvPair>(pairs_.begin() + begin, pairs_.end())));
    return result;
}

std::unique_ptr<IRows> KvPairs::clear() {
    pairs_.clear();
    auto empty = std::make_unique<KvPairs>();
    empty->pairs_ = std::move(pairs_);  // keeps capacity
    return empty;
}

size_t KvPairs::byteSize() const {
    size_t total = 0;
    for (const KvPair& pair : pairs_) {
        total += pair.byteSize();
    }
    return total;
}

// ============================================================================
// KvRow
// ============================================================================

void KvRow::classifyAndAppend(IRows* data,
                              KVChecksum* data_checksum,
                              IRows* indices,
                              KVChecksum* index_checksum) const {
    KvPairs* data_pairs = dynamic_cast<KvPairs*>(data);
    KvPairs* index_pairs = dynamic_cast<KvPairs*>(indices);
    if (!data_pairs || !index_pairs) {
        throw std::invalid_argument("KvRow: rows collections must be KvPairs");
    }

    for (const KvPair& pair : pairs_) {
        if (isRecordKey(pair.key)) {
            data_pairs->append(pair);
            data_checksum->update(pair.key, pair.value);
        } else {
            index_pairs->append(pair);
            index_checksum->update(pair.key, pair.value);
        }
    }
}

// ============================================================================
// KvEncoder
// ============================================================================

KvEncoder::KvEncoder(const TableInfo& table, const SessionOptions& options)
    : table_(table), options_(options),
      handle_offset_(table.handleColumnOffset()), closed_(false) {
}

void KvEncoder::close() {
    closed_ = true;
}

Status KvEncoder::castValue(const ColumnInfo& column, const Datum& value, Datum& out) const {
    if (datumIsNull(value)) {
        out = value;
        return Status::OK();
    }

    bool matches = false;
    switch (column.type) {
        case ColumnType::INT:
            matches = std::holds_alternative<int64_t>(value);
            out = value;
            break;
        case ColumnType::DOUBLE:
            if (std::holds_alternative<int64_t>(value)) {
                out = static_cast<double>(std::get<int64_t>(value));
                matches = true;
            } else {
                matches = std::holds_alternative<double>(value);
                out = value;
            }
            break;
        case ColumnType::STRING:
            matches = std::holds_alternative<std::string>(value);
            out = value;
            break;
    }

    if (matches) {
        return Status::OK();
    }
    if (options_.strict_sql_mode) {
        return Status(ErrorCode::ERR_INVALID_ARGUMENT,
                      "incorrect value for column '" + column.name + "'");
    }
    out = Datum();
    return Status::OK();
}

Status KvEncoder::encode(const Logger& logger,
                         const std::vector<Datum>& row,
                         int64_t row_id,
                         const std::vector<int>& column_permutation,
                         std::unique_ptr<IRow>& out) {
    if (closed_) {
        return Status(ErrorCode::ERR_INVALID_ARGUMENT, "encoder is closed");
    }
    if (!table_.hasValidColumnLayout()) {
        return Status(ErrorCode::ERR_SCHEMA_MISMATCH,
                      "table '" + table_.name + "' has no public column layout");
    }
    if (column_permutation.empty() && row.size() != table_.columns.size()) {
        return Status(ErrorCode::ERR_SCHEMA_MISMATCH,
                      "column count mismatch: table '" + table_.name + "' has " +
                      std::to_string(table_.columns.size()) + " columns, row has " +
                      std::to_string(row.size()));
    }

    // Arrange values in table column order
    std::vector<Datum> values(table_.columns.size());
    for (size_t i = 0; i < table_.columns.size(); ++i) {
        int source = static_cast<int>(i);
        if (!column_permutation.empty()) {
            source = i < column_permutation.size() ? column_permutation[i] : -1;
        }
        Datum value;
        if (source >= 0 && static_cast<size_t>(source) < row.size()) {
            value = row[source];
        }
        Status status = castValue(table_.columns[i], value, values[i]);
        if (!status.ok()) {
            logger.with("rowID", row_id).warn("encode row failed: " + status.message());
            return status;
        }
    }

    int64_t handle = row_id;
    if (handle_offset_ >= 0) {
        const Datum& pk = values[handle_offset_];
        if (!std::holds_alternative<int64_t>(pk)) {
            return Status(ErrorCode::ERR_INVALID_ARGUMENT,
                          "primary key of table '" + table_.name + "' must be a non-null integer");
        }
        handle = std::get<int64_t>(pk);
    }

    std::vector<KvPair> pairs;
    pairs.reserve(1 + table_.indices.size());
    pairs.emplace_back(encodeRecordKey(table_.id, handle), encodeRowValue(values));

    for (const IndexInfo& index : table_.indices) {
        if (index.state != SchemaState::PUBLIC) {
            continue;
        }
        std::vector<Datum> index_values;
        index_values.reserve(index.column_offsets.size());
        for (int offset : index.column_offsets) {
            if (offset < 0 || static_cast<size_t>(offset) >= values.size()) {
                return Status(ErrorCode::ERR_SCHEMA_MISMATCH,
                              "index '" + index.name + "' refers to unknown column");
            }
            index_values.push_back(values[offset]);
        }

        std::string handle_value;
        appendU64(handle_value, static_cast<uint64_t>(handle) ^ kSignMask);
        if (index.unique) {
            pairs.emplace_back(encodeIndexKey(table_.id, index.id, index_values, nullptr),
                               handle_value);
        } else {
            pairs.emplace_back(encodeIndexKey(table_.id, index.id, index_values, &handle),
                               std::string("0"));
        }
    }

    out = std::make_unique<KvRow>(std::move(pairs));
    return Status::OK();
}

// ============================================================================
// Key and value codec
// ============================================================================

std::string encodeRecordKey(int64_t table_id, int64_t handle) {
    std::string key;
    key.reserve(kPrefixSize + 8);
    appendTablePrefix(key, table_id, "_r");
    appendU64(key, static_cast<uint64_t>(handle) ^ kSignMask);
    return key;
}

std::string encodeIndexKey(int64_t table_id, int64_t index_id,
                           const std::vector<Datum>& values,
                           const int64_t* handle) {
    std::string key;
    appendTablePrefix(key, table_id, "_i");
    appendU64(key, static_cast<uint64_t>(index_id) ^ kSignMask);
    for (const Datum& value : values) {
        appendIndexValue(key, value);
    }
    if (handle) {
        appendU64(key, static_cast<uint64_t>(*handle) ^ kSignMask);
    }
    return key;
}

bool isRecordKey(const std::string& key) {
    return key.size() >= kPrefixSize && key[0] == 't' &&
           key[9] == '_' && key[10] == 'r';
}

bool decodeRecordKey(const std::string& key, int64_t& table_id, int64_t& handle) {
    if (key.size() != kPrefixSize + 8 || !isRecordKey(key)) {
        return false;
    }
    table_id = static_cast<int64_t>(readU64(key, 1) ^ kSignMask);
    handle = static_cast<int64_t>(readU64(key, kPrefixSize) ^ kSignMask);
    return true;
}

std::string encodeRowValue(const std::vector<Datum>& values) {
    std::string buf;
    appendU32(buf, static_cast<uint32_t>(values.size()));
    for (const Datum& value : values) {
        if (std::holds_alternative<int64_t>(value)) {
            buf.push_back(static_cast<char>(kTagInt));
            appendU64(buf, static_cast<uint64_t>(std::get<int64_t>(value)));
        } else if (std::holds_alternative<double>(value)) {
            buf.push_back(static_cast<char>(kTagDouble));
            appendU64(buf, doubleBits(std::get<double>(value)));
        } else if (std::holds_alternative<std::string>(value)) {
            const std::string& s = std::get<std::string>(value);
            buf.push_back(static_cast<char>(kTagString));
            appendU32(buf, static_cast<uint32_t>(s.size()));
            buf.append(s);
        } else {
            buf.push_back(static_cast<char>(kTagNull));
        }
    }
    return buf;
}

Status decodeRowValue(const std::string& value, std::vector<Datum>& values) {
    const Status corrupted(ErrorCode::ERR_CORRUPTION, "truncated row value");
    if (value.size() < 4) {
        return corrupted;
    }

    uint32_t count = readU32(value, 0);
    size_t pos = 4;
    values.clear();
    values.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        if (pos >= value.size()) {
            return corrupted;
        }
        uint8_t tag = static_cast<uint8_t>(value[pos++]);
        switch (tag) {
            case kTagNull:
                values.emplace_back();
                break;
            case kTagInt:
                if (pos + 8 > value.size()) return corrupted;
                values.emplace_back(static_cast<int64_t>(readU64(value, pos)));
                pos += 8;
                break;
            case kTagDouble: {
                if (pos + 8 > value.size()) return corrupted;
                uint64_t bits = readU64(value, pos);
                double d;
                std::memcpy(&d, &bits, sizeof(d));
                values.emplace_back(d);
                pos += 8;
                break;
            }
            case kTagString: {
                if (pos + 4 > value.size()) return corrupted;
                uint32_t len = readU32(value, pos);
                pos += 4;
                if (pos + len > value.size()) return corrupted;
                values.emplace_back(value.substr(pos, len));
                pos += len;
                break;
            }
            default:
                return Status(ErrorCode::ERR_CORRUPTION,
                              "unknown value tag " + std::to_string(tag));
        }
    }
    return Status::OK();
}

}  // namespace xload
