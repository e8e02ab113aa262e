#include "xLoad/config.h"

namespace xload {

bool validateConfig(const DeliveryConfig& config, std::string& error) {
    if (config.sorted_kv_dir.empty()) {
        error = "sorted-kv directory must not be empty";
        return false;
    }
    if (config.target_db_path.empty()) {
        error = "target database path must not be empty";
        return false;
    }
    if (config.max_chunk_size == 0) {
        error = "max chunk size must be positive";
        return false;
    }
    if (config.memtable_limit == 0) {
        error = "memtable limit must be positive";
        return false;
    }
    if (config.retry_import_delay_ms < 0) {
        error = "retry import delay must not be negative";
        return false;
    }
    if (!CompressorFactory::isSupported(config.run_compression)) {
        error = "unsupported run compression";
        return false;
    }
    if (config.disk_quota_bytes < 0) {
        error = "disk quota must not be negative";
        return false;
    }
    if (config.disk_quota_bytes > 0 && config.quota_check_interval_ms <= 0) {
        error = "quota check interval must be positive when a disk quota is set";
        return false;
    }
    if (config.max_unbalanced_engines < 0) {
        error = "max unbalanced engines must not be negative";
        return false;
    }
    error.clear();
    return true;
}

}  // namespace xload
