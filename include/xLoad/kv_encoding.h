#ifndef XLOAD_KV_ENCODING_H_
#define XLOAD_KV_ENCODING_H_

#include "encoding.h"
#include <string>
#include <utility>
#include <vector>

namespace xload {

// ============================================================================
// KV encoding: rows as sorted key/value pairs
// ============================================================================
//
// Record key: 't' | be64(table_id) | "_r" | be64(handle ^ sign bit)
// Index key:  't' | be64(table_id) | "_i" | be64(index_id) | values [| handle]
//
// Record keys are the data part of a row, index keys the index part.

struct KvPair {
    std::string key;
    std::string value;

    KvPair() = default;
    KvPair(std::string k, std::string v) : key(std::move(k)), value(std::move(v)) {}

    size_t byteSize() const { return key.size() + value.size(); }
};

/// Rows implementation backed by a vector of pairs
class KvPairs : public IRows {
public:
    KvPairs() = default;
    explicit KvPairs(std::vector<KvPair> pairs) : pairs_(std::move(pairs)) {}

    std::vector<std::unique_ptr<IRows>> splitIntoChunks(size_t split_size) const override;
    std::unique_ptr<IRows> clear() override;
    size_t byteSize() const override;
    size_t count() const override { return pairs_.size(); }

    void append(KvPair pair) { pairs_.push_back(std::move(pair)); }
    const std::vector<KvPair>& pairs() const { return pairs_; }

private:
    std::vector<KvPair> pairs_;
};

/// Row implementation: the pairs produced from one SQL row
class KvRow : public IRow {
public:
    explicit KvRow(std::vector<KvPair> pairs) : pairs_(std::move(pairs)) {}

    /// Both collections must be KvPairs; throws std::invalid_argument otherwise
    void classifyAndAppend(IRows* data,
                           KVChecksum* data_checksum,
                           IRows* indices,
                           KVChecksum* index_checksum) const override;

    const std::vector<KvPair>& pairs() const { return pairs_; }

private:
    std::vector<KvPair> pairs_;
};

/// Encoder producing KvRow values for one table
class KvEncoder : public IEncoder {
public:
    KvEncoder(const TableInfo& table, const SessionOptions& options);

    void close() override;

    Status encode(const Logger& logger,
                  const std::vector<Datum>& row,
                  int64_t row_id,
                  const std::vector<int>& column_permutation,
                  std::unique_ptr<IRow>& out) override;

private:
    /// Coerce a value to the column type
    Status castValue(const ColumnInfo& column, const Datum& value, Datum& out) const;

    TableInfo table_;
    SessionOptions options_;
    int handle_offset_;
    bool closed_;
};

// ============================================================================
// Key and value codec
// ============================================================================

std::string encodeRecordKey(int64_t table_id, int64_t handle);
std::string encodeIndexKey(int64_t table_id, int64_t index_id,
                           const std::vector<Datum>& values,
                           const int64_t* handle);

/// True for record (data) keys, false for index keys and foreign keys
bool isRecordKey(const std::string& key);

/// Decode a record key
/// @return false if key is not a record key
bool decodeRecordKey(const std::string& key, int64_t& table_id, int64_t& handle);

/// Encode column values of a record
std::string encodeRowValue(const std::vector<Datum>& values);

/// Decode column values of a record
Status decodeRowValue(const std::string& value, std::vector<Datum>& values);

}  // namespace xload

#endif  // XLOAD_KV_ENCODING_H_
