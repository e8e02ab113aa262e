#ifndef XLOAD_CONFIG_H_
#define XLOAD_CONFIG_H_

#include "compressor.h"
#include "constants.h"
#include "logger.h"
#include <cstdint>
#include <string>

namespace xload {

// ============================================================================
// Delivery configuration
// ============================================================================

struct DeliveryConfig {
    std::string sorted_kv_dir;        // Local engine directory
    std::string target_db_path;       // Target store (SQLite) path
    uint64_t max_chunk_size;          // Max bytes per writeRows chunk
    uint64_t memtable_limit;          // Memtable bytes before spilling a run
    int64_t retry_import_delay_ms;    // Sleep between import attempts
    CompressionType run_compression;  // Run file payload compression
    size_t flush_threads;             // Threads of flushAllEngines (0 = hardware)
    int64_t disk_quota_bytes;         // 0 = no quota enforcement
    int64_t quota_check_interval_ms;  // Period of the quota enforcer
    int64_t max_unbalanced_engines;   // Engine-count ceiling (0 = disabled)
    LogLevel log_level;

    DeliveryConfig()
        : sorted_kv_dir("./sorted-kv"),
          target_db_path("./sorted-kv/target.db"),
          max_chunk_size(kDefaultMaxChunkSize),
          memtable_limit(kDefaultMemtableLimit),
          retry_import_delay_ms(kDefaultRetryImportDelayMs),
          run_compression(CompressionType::COMP_ZSTD),
          flush_threads(0),
          disk_quota_bytes(0),
          quota_check_interval_ms(kDefaultQuotaCheckIntervalMs),
          max_unbalanced_engines(0),
          log_level(LogLevel::INFO) {
    }
};

/// Validate a configuration
/// @param config Configuration to check
/// @param error Output: reason of the first violation
/// @return true if the configuration is usable
bool validateConfig(const DeliveryConfig& config, std::string& error);

}  // namespace xload

#endif  // XLOAD_CONFIG_H_
