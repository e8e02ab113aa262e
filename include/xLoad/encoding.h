#ifndef XLOAD_ENCODING_H_
#define XLOAD_ENCODING_H_

#include "checksum.h"
#include "logger.h"
#include "status.h"
#include "table_model.h"
#include <cstddef>
#include <memory>
#include <vector>

namespace xload {

// ============================================================================
// Encoder / Row / Rows contracts (implemented per backend)
// ============================================================================

class IRows;

/// A collection of encoded rows
class IRows {
public:
    virtual ~IRows() = default;

    /// Split into consecutive parts, each with total byte size at most
    /// split_size. "Byte size" is the same measure used by
    /// IRow::classifyAndAppend. An element larger than split_size forms
    /// a part of its own.
    virtual std::vector<std::unique_ptr<IRows>> splitIntoChunks(size_t split_size) const = 0;

    /// Return an empty collection that may reuse this instance's capacity.
    /// Typical usage: rows = rows->clear();
    virtual std::unique_ptr<IRows> clear() = 0;

    /// Total byte size of the collection
    virtual size_t byteSize() const = 0;

    /// Number of elements in the collection
    virtual size_t count() const = 0;
};

/// A single encoded row
class IRow {
public:
    virtual ~IRow() = default;

    /// Separate the data-like and index-like parts of the row and append
    /// them to the given collections and checksums
    virtual void classifyAndAppend(IRows* data,
                                   KVChecksum* data_checksum,
                                   IRows* indices,
                                   KVChecksum* index_checksum) const = 0;
};

/// Encodes SQL rows of one table into a backend-specific form
class IEncoder {
public:
    virtual ~IEncoder() = default;

    /// Release resources held by the encoder
    virtual void close() = 0;

    /// Encode one row
    /// @param logger Logger of the calling chunk
    /// @param row SQL values in source order
    /// @param row_id Implicit row ID (used when the table has no integer PK)
    /// @param column_permutation Table column offset -> index in row (-1 = absent);
    ///                           empty means identity
    /// @param out Output: encoded row
    /// @return Status
    virtual Status encode(const Logger& logger,
                          const std::vector<Datum>& row,
                          int64_t row_id,
                          const std::vector<int>& column_permutation,
                          std::unique_ptr<IRow>& out) = 0;
};

}  // namespace xload

#endif  // XLOAD_ENCODING_H_
