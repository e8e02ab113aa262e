#ifndef XLOAD_CONSTANTS_H_
#define XLOAD_CONSTANTS_H_

#include <cstdint>

namespace xload {

// ============================================================================
// Delivery Constants
// ============================================================================

/// Attempts per chunk write and per import. Backends retry internally, so
/// this stays small.
constexpr int kMaxRetryTimes = 3;

/// Logical bits of a hybrid timestamp
constexpr int kLogicalBits = 18;

/// Compose a hybrid timestamp from physical milliseconds and a logical counter
constexpr uint64_t composeTS(int64_t physical_ms, int64_t logical) {
    return (static_cast<uint64_t>(physical_ms) << kLogicalBits) +
           static_cast<uint64_t>(logical);
}

/// Physical milliseconds of a hybrid timestamp
constexpr int64_t extractPhysical(uint64_t ts) {
    return static_cast<int64_t>(ts >> kLogicalBits);
}

// ============================================================================
// Defaults
// ============================================================================

/// Default maximum chunk handed to one writeRows call (16MB)
constexpr uint64_t kDefaultMaxChunkSize = 16u * 1024u * 1024u;

/// Default memtable size before a local engine spills a run (64MB)
constexpr uint64_t kDefaultMemtableLimit = 64u * 1024u * 1024u;

/// Default delay between import attempts
constexpr int64_t kDefaultRetryImportDelayMs = 3000;

/// Default interval between disk quota checks
constexpr int64_t kDefaultQuotaCheckIntervalMs = 60000;

}  // namespace xload

#endif  // XLOAD_CONSTANTS_H_
