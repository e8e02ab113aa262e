#ifndef XLOAD_RUN_FILE_H_
#define XLOAD_RUN_FILE_H_

#include "compressor.h"
#include "kv_encoding.h"
#include "status.h"
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace xload {

// ============================================================================
// Sorted run file: immutable spill of one engine memtable
// ============================================================================

constexpr char kRunFileMagic[8] = {'X','L','D','S','R','U','N','1'};
constexpr uint16_t kRunFileVersion = 0x0002;

#pragma pack(push, 1)

struct RunFileHeader {
    char     magic[8];               // "XLDSRUN1"
    uint16_t version;                // = 0x0002
    uint8_t  compression;            // CompressionType of the payload
    uint8_t  reserved0;

    uint32_t payload_crc32;          // CRC32 of the stored payload
    uint64_t entry_count;            // Number of pairs
    uint64_t raw_size;               // Payload size before compression
    uint64_t payload_size;           // Stored payload size (file size - header)
    uint32_t header_crc32;           // CRC32 of this header with header_crc32 = 0

    uint8_t  reserved[20];

    RunFileHeader() {
        std::memset(this, 0, sizeof(*this));
        std::memcpy(magic, kRunFileMagic, 8);
        version = kRunFileVersion;
    }
};

#pragma pack(pop)

static_assert(sizeof(RunFileHeader) == 64, "RunFileHeader must be exactly 64 bytes");

/// Write pairs (already sorted) to path atomically: temp file, fsync, rename
/// @param file_size Output: bytes on disk
Status writeRunFile(const std::string& path,
                    const std::vector<KvPair>& pairs,
                    CompressionType compression,
                    uint64_t& file_size);

/// CRC32 of a header, computed with header_crc32 zeroed
uint32_t runHeaderCRC32(const RunFileHeader& header);

/// Read and verify a run file. Every header field is checked before it
/// sizes an allocation; a damaged file yields ERR_CORRUPTION.
Status readRunFile(const std::string& path, std::vector<KvPair>& pairs);

/// fsync a directory so that renames inside it are durable
Status syncDirectory(const std::string& dir);

}  // namespace xload

#endif  // XLOAD_RUN_FILE_H_
