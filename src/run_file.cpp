#include "xLoad/run_file.h"
#include "xLoad/checksum.h"
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace xload {

namespace {

Status ioError(const std::string& what, const std::string& path) {
    return Status(ErrorCode::ERR_IO_FAILED,
                  what + " '" + path + "': " + std::strerror(errno));
}

void appendU32(std::vector<uint8_t>& buf, uint32_t v) {
    uint8_t bytes[4];
    std::memcpy(bytes, &v, 4);
    buf.insert(buf.end(), bytes, bytes + 4);
}

void appendBytes(std::vector<uint8_t>& buf, const std::string& s) {
    appendU32(buf, static_cast<uint32_t>(s.size()));
    buf.insert(buf.end(), s.begin(), s.end());
}

bool readBytes(const std::vector<uint8_t>& buf, size_t& pos, std::string& out) {
    if (pos + 4 > buf.size()) {
        return false;
    }
    uint32_t len;
    std::memcpy(&len, buf.data() + pos, 4);
    pos += 4;
    if (pos + len > buf.size()) {
        return false;
    }
    out.assign(reinterpret_cast<const char*>(buf.data() + pos), len);
    pos += len;
    return true;
}

Status writeAll(int fd, const void* data, size_t size, const std::string& path) {
    const uint8_t* ptr = static_cast<const uint8_t*>(data);
    while (size > 0) {
        ssize_t written = ::write(fd, ptr, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return ioError("failed to write run file", path);
        }
        ptr += written;
        size -= static_cast<size_t>(written);
    }
    return Status::OK();
}

Status readAll(int fd, void* data, size_t size, const std::string& path) {
    uint8_t* ptr = static_cast<uint8_t*>(data);
    while (size > 0) {
        ssize_t n = ::read(fd, ptr, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return ioError("failed to read run file", path);
        }
        if (n == 0) {
            return Status(ErrorCode::ERR_CORRUPTION, "run file '" + path + "' is truncated");
        }
        ptr += n;
        size -= static_cast<size_t>(n);
    }
    return Status::OK();
}

// Smallest encoded pair: two empty length prefixes
constexpr uint64_t kMinEncodedPairSize = 8;

}  // namespace

uint32_t runHeaderCRC32(const RunFileHeader& header) {
    RunFileHeader copy = header;
    copy.header_crc32 = 0;
    return calculateCRC32(&copy, sizeof(copy));
}

namespace {

Status validateHeader(int fd, const RunFileHeader& header, const std::string& path) {
    auto corrupt = [&path](const std::string& what) {
        return Status(ErrorCode::ERR_CORRUPTION, "run file '" + path + "' " + what);
    };

    if (std::memcmp(header.magic, kRunFileMagic, 8) != 0 ||
        header.version != kRunFileVersion) {
        return corrupt("has a bad header");
    }
    if (runHeaderCRC32(header) != header.header_crc32) {
        return corrupt("header CRC mismatch");
    }

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        return ioError("failed to stat run file", path);
    }
    uint64_t file_size = static_cast<uint64_t>(st.st_size);
    if (file_size < sizeof(RunFileHeader) ||
        header.payload_size != file_size - sizeof(RunFileHeader)) {
        return corrupt("payload size does not match the file size");
    }
    if (header.entry_count > header.raw_size / kMinEncodedPairSize) {
        return corrupt("entry count exceeds the payload");
    }
    if (header.compression == static_cast<uint8_t>(CompressionType::COMP_NONE) &&
        header.raw_size != header.payload_size) {
        return corrupt("raw size of an uncompressed payload differs from its stored size");
    }
    return Status::OK();
}

}  // namespace

Status writeRunFile(const std::string& path,
                    const std::vector<KvPair>& pairs,
                    CompressionType compression,
                    uint64_t& file_size) {
    std::vector<uint8_t> raw;
    for (const KvPair& pair : pairs) {
        appendBytes(raw, pair.key);
        appendBytes(raw, pair.value);
    }

    RunFileHeader header;
    header.entry_count = pairs.size();
    header.raw_size = raw.size();
    header.compression = static_cast<uint8_t>(CompressionType::COMP_NONE);

    std::vector<uint8_t> compressed;
    const std::vector<uint8_t>* payload = &raw;
    std::unique_ptr<ICompressor> compressor = CompressorFactory::create(compression);
    if (compressor && !raw.empty()) {
        Status status = compressor->compress(raw, CompressorFactory::runLevel(compression),
                                             compressed);
        if (!status.ok()) {
            return status.annotate("failed to compress run '" + path + "'");
        }
        payload = &compressed;
        header.compression = static_cast<uint8_t>(compression);
    }
    header.payload_size = payload->size();
    header.payload_crc32 = calculateCRC32(payload->data(), payload->size());
    header.header_crc32 = runHeaderCRC32(header);

    std::string tmp_path = path + ".tmp";
    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return ioError("failed to create run file", tmp_path);
    }

    Status status = writeAll(fd, &header, sizeof(header), tmp_path);
    if (status.ok()) {
        status = writeAll(fd, payload->data(), payload->size(), tmp_path);
    }
    if (status.ok() && ::fsync(fd) != 0) {
        status = ioError("failed to sync run file", tmp_path);
    }
    if (::close(fd) != 0 && status.ok()) {
        status = ioError("failed to close run file", tmp_path);
    }
    if (!status.ok()) {
        ::unlink(tmp_path.c_str());
        return status;
    }

    if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
        Status rename_status = ioError("failed to rename run file", tmp_path);
        ::unlink(tmp_path.c_str());
        return rename_status;
    }

    file_size = sizeof(header) + payload->size();
    return Status::OK();
}

Status readRunFile(const std::string& path, std::vector<KvPair>& pairs) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        if (errno == ENOENT) {
            return Status(ErrorCode::ERR_NOT_FOUND, "run file '" + path + "' not found");
        }
        return ioError("failed to open run file", path);
    }

    RunFileHeader header;
    Status status = readAll(fd, &header, sizeof(header), path);
    std::vector<uint8_t> payload;
    if (status.ok()) {
        status = validateHeader(fd, header, path);
    }
    if (status.ok()) {
        payload.resize(static_cast<size_t>(header.payload_size));
        status = readAll(fd, payload.data(), payload.size(), path);
    }
    ::close(fd);
    if (!status.ok()) {
        return status;
    }

    if (calculateCRC32(payload.data(), payload.size()) != header.payload_crc32) {
        return Status(ErrorCode::ERR_CORRUPTION, "run file '" + path + "' CRC mismatch");
    }

    std::vector<uint8_t> decompressed;
    const std::vector<uint8_t>* raw = &payload;
    CompressionType compression = static_cast<CompressionType>(header.compression);
    if (compression != CompressionType::COMP_NONE) {
        std::unique_ptr<ICompressor> compressor = CompressorFactory::create(compression);
        if (!compressor) {
            return Status(ErrorCode::ERR_UNSUPPORTED,
                          std::string("run file compression ") +
                          CompressorFactory::typeName(compression) + " is not supported");
        }
        status = compressor->decompress(payload.data(), payload.size(),
                                        static_cast<size_t>(header.raw_size), decompressed);
        if (!status.ok()) {
            return Status(ErrorCode::ERR_CORRUPTION,
                          "failed to decompress run file '" + path + "': " + status.message());
        }
        raw = &decompressed;
    }

    pairs.clear();
    pairs.reserve(static_cast<size_t>(header.entry_count));
    size_t pos = 0;
    for (uint64_t i = 0; i < header.entry_count; ++i) {
        KvPair pair;
        if (!readBytes(*raw, pos, pair.key) || !readBytes(*raw, pos, pair.value)) {
            return Status(ErrorCode::ERR_CORRUPTION, "run file '" + path + "' has a truncated entry");
        }
        pairs.push_back(std::move(pair));
    }
    return Status::OK();
}

Status syncDirectory(const std::string& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY);
    if (fd < 0) {
        return ioError("failed to open directory", dir);
    }
    Status status;
    if (::fsync(fd) != 0) {
        status = ioError("failed to sync directory", dir);
    }
    ::close(fd);
    return status;
}

}  // namespace xload
