#include "xLoad/engine_uuid.h"
#include <openssl/evp.h>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

namespace xload {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

// d68d6abe-c59e-45d6-ade8-e2b0ceb7bedf
const EngineUUID kEngineNamespace(std::array<uint8_t, 16>{
    0xd6, 0x8d, 0x6a, 0xbe, 0xc5, 0x9e, 0x45, 0xd6,
    0xad, 0xe8, 0xe2, 0xb0, 0xce, 0xb7, 0xbe, 0xdf});

bool EngineUUID::parse(const std::string& text, EngineUUID& out) {
    if (text.size() != 36) {
        return false;
    }

    std::array<uint8_t, 16> bytes{};
    size_t byte_index = 0;
    for (size_t i = 0; i < text.size();) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (text[i] != '-') {
                return false;
            }
            ++i;
            continue;
        }
        int hi = hexValue(text[i]);
        int lo = hexValue(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        bytes[byte_index++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }

    out = EngineUUID(bytes);
    return true;
}

std::string EngineUUID::toString() const {
    static const char kHex[] = "0123456789abcdef";
    std::string result;
    result.reserve(36);
    for (size_t i = 0; i < bytes_.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result.push_back('-');
        }
        result.push_back(kHex[bytes_[i] >> 4]);
        result.push_back(kHex[bytes_[i] & 0x0F]);
    }
    return result;
}

bool EngineUUID::isNil() const {
    for (uint8_t b : bytes_) {
        if (b != 0) return false;
    }
    return true;
}

std::string makeTag(const std::string& table_name, int32_t engine_id) {
    return table_name + ":" + std::to_string(engine_id);
}

EngineUUID makeNameUUID(const EngineUUID& name_space, const std::string& data) {
    std::vector<uint8_t> input(name_space.bytes().begin(), name_space.bytes().end());
    input.insert(input.end(), data.begin(), data.end());

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1 ||
        digest_len < 16) {
        // Engine identities cannot be derived without SHA-1
        std::cerr << "[EngineUUID] FATAL: SHA-1 digest failed (libcrypto unusable)" << std::endl;
        std::abort();
    }

    std::array<uint8_t, 16> bytes{};
    std::memcpy(bytes.data(), digest, bytes.size());
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x50);  // version 5
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant
    return EngineUUID(bytes);
}

EngineUUID makeEngineUUID(const std::string& table_name, int32_t engine_id, std::string& tag) {
    tag = makeTag(table_name, engine_id);
    return makeNameUUID(kEngineNamespace, tag);
}

}  // namespace xload
