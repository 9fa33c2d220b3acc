/**
 * @file uuid.hpp
 * @brief 128-bit UUID value type
 *
 * Parsing and formatting only; Marginalia never generates identifiers.
 */

#pragma once

#include <marginalia/core/result.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace marginalia {

/**
 * @brief UUID (Universally Unique Identifier)
 *
 * Stored as 16 big-endian bytes. Nibble i is the i-th hex digit of the
 * canonical 32-character form, so nibble 12 is the version field and
 * nibble 16 the variant field.
 */
class UUID {
public:
    static constexpr std::size_t kSize = 16;
    static constexpr std::size_t kHexLength = kSize * 2;

    using Bytes = std::array<uint8_t, kSize>;

    /// Create a null (all zero) UUID
    UUID() : m_data{} {}

    explicit UUID(const Bytes& data) : m_data(data) {}

    /**
     * @brief Parse a UUID from text
     *
     * Accepts 32 hex digits in either case, with optional dashes
     * anywhere, optional surrounding braces and an optional "urn:uuid:"
     * prefix (e.g. "550e8400-e29b-41d4-a716-446655440000",
     * "{550E8400E29B41D4A716446655440000}").
     *
     * @return The UUID, or InvalidIdentifier
     */
    static Result<UUID> fromString(std::string_view str);

    /// 32 lowercase hex digits
    std::string toHex() const;

    /// Dashed 8-4-4-4-12 lowercase form
    std::string toString() const;

    /// Hex digit value (0-15) of nibble index (0-31)
    uint8_t nibble(std::size_t index) const {
        const uint8_t byte = m_data[index / 2];
        return (index % 2 == 0) ? static_cast<uint8_t>(byte >> 4) : static_cast<uint8_t>(byte & 0x0F);
    }

    /// Version field (nibble 12)
    uint8_t versionNibble() const { return nibble(12); }

    /// Variant field (nibble 16)
    uint8_t variantNibble() const { return nibble(16); }

    /// Check if UUID is null (all zeros)
    bool isNull() const;

    bool operator==(const UUID& other) const { return m_data == other.m_data; }
    bool operator!=(const UUID& other) const { return m_data != other.m_data; }

    /// Raw big-endian bytes
    const Bytes& data() const { return m_data; }

private:
    Bytes m_data;
};

} // namespace marginalia

// Hash support for std::unordered_map
namespace std {
template<>
struct hash<marginalia::UUID> {
    size_t operator()(const marginalia::UUID& uuid) const {
        const auto& data = uuid.data();
        size_t h = 0;
        for (size_t i = 0; i < data.size(); ++i) {
            h ^= std::hash<uint8_t>{}(data[i]) + 0x9e3779b9 + (h << 6) + (h >> 2);
        }
        return h;
    }
};
} // namespace std
