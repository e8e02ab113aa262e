#ifndef XLOAD_ENGINE_UUID_H_
#define XLOAD_ENGINE_UUID_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace xload {

// ============================================================================
// Engine identity
// ============================================================================

/// 16-byte RFC 4122 UUID
class EngineUUID {
public:
    EngineUUID() : bytes_{} {}
    explicit EngineUUID(const std::array<uint8_t, 16>& bytes) : bytes_(bytes) {}

    /// Parse canonical "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx" form
    /// @return false on malformed input (out is left untouched)
    static bool parse(const std::string& text, EngineUUID& out);

    /// Canonical lowercase form
    std::string toString() const;

    const std::array<uint8_t, 16>& bytes() const { return bytes_; }
    bool isNil() const;

    bool operator==(const EngineUUID& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const EngineUUID& other) const { return bytes_ != other.bytes_; }
    bool operator<(const EngineUUID& other) const { return bytes_ < other.bytes_; }

private:
    std::array<uint8_t, 16> bytes_;
};

/// Namespace of all engine identities
extern const EngineUUID kEngineNamespace;

/// "<table_name>:<engine_id>"
std::string makeTag(const std::string& table_name, int32_t engine_id);

/// Name-based (version 5) UUID of data within a namespace
EngineUUID makeNameUUID(const EngineUUID& name_space, const std::string& data);

/// Deterministic identity of an engine
/// @param table_name Qualified table name
/// @param engine_id Engine ordinal within the table
/// @param tag Output: engine tag
/// @return Engine UUID
EngineUUID makeEngineUUID(const std::string& table_name, int32_t engine_id, std::string& tag);

}  // namespace xload

namespace std {
template <>
struct hash<xload::EngineUUID> {
    size_t operator()(const xload::EngineUUID& uuid) const {
        const auto& b = uuid.bytes();
        uint64_t h = 1469598103934665603ull;  // FNV-1a
        for (uint8_t byte : b) {
            h = (h ^ byte) * 1099511628211ull;
        }
        return static_cast<size_t>(h);
    }
};
}  // namespace std

#endif  // XLOAD_ENGINE_UUID_H_
