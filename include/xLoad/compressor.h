#ifndef XLOAD_COMPRESSOR_H_
#define XLOAD_COMPRESSOR_H_

#include "status.h"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace xload {

// ============================================================================
// Compression of sorted run payloads
// ============================================================================

/// Payload compression of a run file (stored in the run header)
enum class CompressionType : uint8_t {
    COMP_NONE = 0,
    COMP_ZSTD = 1
};

/// Codec of one run payload. Instances are not shared between threads.
class ICompressor {
public:
    virtual ~ICompressor() = default;

    virtual CompressionType type() const = 0;

    /// Compress a run payload
    /// @param payload Raw payload (must not be empty)
    /// @param level Codec level; out-of-range levels fall back to the codec default
    /// @param out Output: compressed bytes, replaced on success
    /// @return ERR_INVALID_ARGUMENT on empty input, ERR_INTERNAL on codec failure
    virtual Status compress(const std::vector<uint8_t>& payload,
                            int level,
                            std::vector<uint8_t>& out) = 0;

    /// Decompress a run payload whose raw size is known from the run header
    /// @param data Compressed bytes
    /// @param size Number of compressed bytes
    /// @param raw_size Expected size after decompression
    /// @param out Output: raw payload, cleared on failure
    /// @return ERR_CORRUPTION when the frame is invalid or its size differs
    virtual Status decompress(const uint8_t* data,
                              size_t size,
                              size_t raw_size,
                              std::vector<uint8_t>& out) = 0;
};

class CompressorFactory {
public:
    /// @return Compressor instance, or nullptr for COMP_NONE and unknown types
    static std::unique_ptr<ICompressor> create(CompressionType type);

    static bool isSupported(CompressionType type);

    static const char* typeName(CompressionType type);

    /// Level used when spilling runs. Runs are read back once, on import.
    static int runLevel(CompressionType type);
};

}  // namespace xload

#endif  // XLOAD_COMPRESSOR_H_
