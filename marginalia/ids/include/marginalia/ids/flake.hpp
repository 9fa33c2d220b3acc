/**
 * @file flake.hpp
 * @brief Embedding 120-bit search-index flake IDs in the UUID space
 *
 * A UUID is written xxxxxxxx-xxxx-Mxxx-Nxxx-xxxxxxxxxxxx, where M is the
 * version nibble (offset 12) and N the variant nibble (offset 16).
 * RFC 4122 UUIDs have M in {1, 2, 3, 4, 5} and N in {8, 9, a, b}.
 *
 * A 15-byte flake ID (30 nibbles) is stored as a UUID by inserting the
 * magic nibbles 0xe at offset 12 and 0x5 at offset 16. Neither value can
 * come from a standard generator (e.g. PostgreSQL's uuid_generate_v1mc()),
 * so a stored UUID carrying both is known to be an embedded flake ID.
 */

#pragma once

#include <marginalia/core/uuid.hpp>

#include <array>
#include <cstddef>
#include <cstdint>

namespace marginalia::ids {

/// Raw flake ID bytes
using FlakeBytes = std::array<uint8_t, 15>;

/// Magic version nibble marking an embedded flake ID
constexpr uint8_t kFlakeMagicVersion = 0xE;

/// Magic variant nibble marking an embedded flake ID
constexpr uint8_t kFlakeMagicVariant = 0x5;

/// Nibble offsets (in the 32-digit UUID hex form) of the magic nibbles
constexpr std::size_t kFlakeMagicVersionOffset = 12;
constexpr std::size_t kFlakeMagicVariantOffset = 16;

/// What a stored 128-bit value originally was
enum class IdKind {
    Uuid,   // Genuine UUID, 16 bytes
    Flake,  // Embedded flake ID, 15 bytes
};

inline const char* idKindToString(IdKind kind) {
    switch (kind) {
        case IdKind::Uuid: return "uuid";
        case IdKind::Flake: return "flake";
        default: return "unknown";
    }
}

/// Flake if both magic nibbles are present, Uuid otherwise
IdKind classify(const UUID& uuid);

/// Insert the magic nibbles into a flake ID
UUID embedFlake(const FlakeBytes& flake);

/// Remove the magic nibbles. Only meaningful when classify(uuid) == IdKind::Flake.
FlakeBytes extractFlake(const UUID& uuid);

} // namespace marginalia::ids
