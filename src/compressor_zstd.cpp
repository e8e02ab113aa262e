#include "xLoad/compressor.h"
#include <zstd.h>
#include <string>

namespace xload {

// ============================================================================
// ZstdCompressor - one reusable context per direction
// ============================================================================

class ZstdCompressor : public ICompressor {
public:
    ZstdCompressor() : cctx_(ZSTD_createCCtx()), dctx_(ZSTD_createDCtx()) {}

    ~ZstdCompressor() override {
        ZSTD_freeCCtx(cctx_);
        ZSTD_freeDCtx(dctx_);
    }

    ZstdCompressor(const ZstdCompressor&) = delete;
    ZstdCompressor& operator=(const ZstdCompressor&) = delete;

    CompressionType type() const override {
        return CompressionType::COMP_ZSTD;
    }

    Status compress(const std::vector<uint8_t>& payload,
                    int level,
                    std::vector<uint8_t>& out) override
    {
        if (payload.empty()) {
            return Status(ErrorCode::ERR_INVALID_ARGUMENT, "empty run payload");
        }
        if (!cctx_) {
            return Status(ErrorCode::ERR_INTERNAL, "zstd compression context unavailable");
        }
        if (level < ZSTD_minCLevel() || level > ZSTD_maxCLevel()) {
            level = ZSTD_CLEVEL_DEFAULT;
        }

        std::vector<uint8_t> buffer(ZSTD_compressBound(payload.size()));
        size_t written = ZSTD_compressCCtx(cctx_, buffer.data(), buffer.size(),
                                           payload.data(), payload.size(), level);
        if (ZSTD_isError(written)) {
            return Status(ErrorCode::ERR_INTERNAL,
                          std::string("zstd compression failed: ") + ZSTD_getErrorName(written));
        }

        buffer.resize(written);
        out.swap(buffer);
        return Status::OK();
    }

    Status decompress(const uint8_t* data,
                      size_t size,
                      size_t raw_size,
                      std::vector<uint8_t>& out) override
    {
        out.clear();
        if (!data || size == 0 || raw_size == 0) {
            return Status(ErrorCode::ERR_INVALID_ARGUMENT, "empty compressed run payload");
        }
        if (!dctx_) {
            return Status(ErrorCode::ERR_INTERNAL, "zstd decompression context unavailable");
        }

        unsigned long long frame_size = ZSTD_getFrameContentSize(data, size);
        if (frame_size == ZSTD_CONTENTSIZE_ERROR) {
            return Status(ErrorCode::ERR_CORRUPTION, "invalid zstd frame");
        }
        // Runs are always written with the content size in the frame
        if (frame_size == ZSTD_CONTENTSIZE_UNKNOWN) {
            return Status(ErrorCode::ERR_CORRUPTION, "zstd frame without content size");
        }
        if (frame_size != raw_size) {
            return Status(ErrorCode::ERR_CORRUPTION,
                          "zstd frame holds " + std::to_string(frame_size) +
                          " bytes, run header says " + std::to_string(raw_size));
        }

        out.resize(raw_size);
        size_t read = ZSTD_decompressDCtx(dctx_, out.data(), out.size(), data, size);
        if (ZSTD_isError(read)) {
            out.clear();
            return Status(ErrorCode::ERR_CORRUPTION,
                          std::string("zstd decompression failed: ") + ZSTD_getErrorName(read));
        }
        if (read != raw_size) {
            out.clear();
            return Status(ErrorCode::ERR_CORRUPTION, "short zstd frame");
        }
        return Status::OK();
    }

private:
    ZSTD_CCtx* cctx_;
    ZSTD_DCtx* dctx_;
};

std::unique_ptr<ICompressor> createZstdCompressor() {
    return std::make_unique<ZstdCompressor>();
}

}  // namespace xload
