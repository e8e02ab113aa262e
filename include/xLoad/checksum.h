#ifndef XLOAD_CHECKSUM_H_
#define XLOAD_CHECKSUM_H_

#include <cstddef>
#include <cstdint>
#include <string>

namespace xload {

// ============================================================================
// KV checksum accumulator
// ============================================================================

/// CRC-64/ECMA-182 (reflected, as used by XZ)
uint64_t calculateCRC64(const void* data, size_t size);

/// Continue a CRC-64 over more data
uint64_t updateCRC64(uint64_t crc, const void* data, size_t size);

/// CRC32 (IEEE) for run-file payloads
uint32_t calculateCRC32(const void* data, size_t size);

/// Running checksum of KV pairs. The checksum is order independent:
/// XOR of CRC-64(key || value) of every pair.
class KVChecksum {
public:
    KVChecksum() : checksum_(0), bytes_(0), kvs_(0) {}
    KVChecksum(uint64_t checksum, uint64_t bytes, uint64_t kvs)
        : checksum_(checksum), bytes_(bytes), kvs_(kvs) {}

    /// Fold one pair into the checksum
    void update(const std::string& key, const std::string& value);

    /// Merge another accumulator
    void add(const KVChecksum& other);

    uint64_t sum() const { return checksum_; }
    uint64_t sumSize() const { return bytes_; }
    uint64_t sumKVS() const { return kvs_; }

    bool operator==(const KVChecksum& other) const {
        return checksum_ == other.checksum_ && bytes_ == other.bytes_ && kvs_ == other.kvs_;
    }
    bool operator!=(const KVChecksum& other) const { return !(*this == other); }

private:
    uint64_t checksum_;
    uint64_t bytes_;
    uint64_t kvs_;
};

}  // namespace xload

#endif  // XLOAD_CHECKSUM_H_
