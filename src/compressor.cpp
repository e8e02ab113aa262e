#include "xLoad/compressor.h"

namespace xload {

std::unique_ptr<ICompressor> createZstdCompressor();

std::unique_ptr<ICompressor> CompressorFactory::create(CompressionType type) {
    if (type == CompressionType::COMP_ZSTD) {
        return createZstdCompressor();
    }
    // COMP_NONE stores the payload as-is
    return nullptr;
}

bool CompressorFactory::isSupported(CompressionType type) {
    return type == CompressionType::COMP_NONE || type == CompressionType::COMP_ZSTD;
}

const char* CompressorFactory::typeName(CompressionType type) {
    switch (type) {
        case CompressionType::COMP_NONE:  return "NONE";
        case CompressionType::COMP_ZSTD:  return "ZSTD";
        default: return "UNKNOWN";
    }
}

int CompressorFactory::runLevel(CompressionType type) {
    return type == CompressionType::COMP_ZSTD ? 1 : 0;
}

}  // namespace xload
