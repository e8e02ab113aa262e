#include "xLoad/checksum.h"
#include <mutex>

namespace xload {

// ============================================================================
// CRC tables
// ============================================================================

static uint64_t crc64_table[256];
static uint32_t crc32_table[256];
static std::once_flag crc_tables_once;

static void init_crc_tables() {
    std::call_once(crc_tables_once, [] {
        const uint64_t kPoly64 = 0xC96C5795D7870F42ull;  // ECMA-182, reflected
        const uint32_t kPoly32 = 0xEDB88320u;            // IEEE, reflected
        for (uint32_t i = 0; i < 256; i++) {
            uint64_t c64 = i;
            uint32_t c32 = i;
            for (int j = 0; j < 8; j++) {
                c64 = (c64 & 1) ? (c64 >> 1) ^ kPoly64 : (c64 >> 1);
                c32 = (c32 & 1) ? (c32 >> 1) ^ kPoly32 : (c32 >> 1);
            }
            crc64_table[i] = c64;
            crc32_table[i] = c32;
        }
    });
}

uint64_t updateCRC64(uint64_t crc, const void* data, size_t size) {
    init_crc_tables();

    const uint8_t* ptr = static_cast<const uint8_t*>(data);
    crc = ~crc;
    for (size_t i = 0; i < size; i++) {
        crc = crc64_table[(crc ^ ptr[i]) & 0xFF] ^ (crc >> 8);
    }
    return ~crc;
}

uint64_t calculateCRC64(const void* data, size_t size) {
    return updateCRC64(0, data, size);
}

uint32_t calculateCRC32(const void* data, size_t size) {
    init_crc_tables();

    const uint8_t* ptr = static_cast<const uint8_t*>(data);
    uint32_t crc = 0xFFFFFFFFu;
    for (size_t i = 0; i < size; i++) {
        crc = (crc >> 8) ^ crc32_table[(crc ^ ptr[i]) & 0xFF];
    }
    return crc ^ 0xFFFFFFFFu;
}

// ============================================================================
// KVChecksum
// ============================================================================

void KVChecksum::update(const std::string& key, const std::string& value) {
    uint64_t crc = updateCRC64(0, key.data(), key.size());
    crc = updateCRC64(crc, value.data(), value.size());
    checksum_ ^= crc;
    bytes_ += key.size() + value.size();
    kvs_++;
}

void KVChecksum::add(const KVChecksum& other) {
    checksum_ ^= other.checksum_;
    bytes_ += other.bytes_;
    kvs_ += other.kvs_;
}

}  // namespace xload
