/**
 * @file flake.cpp
 * @brief Flake ID embedding implementation
 */

#include <marginalia/ids/flake.hpp>

namespace marginalia::ids {

namespace {

template<std::size_t N>
uint8_t getNibble(const std::array<uint8_t, N>& bytes, std::size_t index) {
    const uint8_t byte = bytes[index / 2];
    return (index % 2 == 0) ? static_cast<uint8_t>(byte >> 4) : static_cast<uint8_t>(byte & 0x0F);
}

template<std::size_t N>
void setNibble(std::array<uint8_t, N>& bytes, std::size_t index, uint8_t value) {
    uint8_t& byte = bytes[index / 2];
    if (index % 2 == 0) {
        byte = static_cast<uint8_t>((byte & 0x0F) | (value << 4));
    } else {
        byte = static_cast<uint8_t>((byte & 0xF0) | (value & 0x0F));
    }
}

bool isMagicOffset(std::size_t index) {
    return index == kFlakeMagicVersionOffset || index == kFlakeMagicVariantOffset;
}

} // anonymous namespace

IdKind classify(const UUID& uuid) {
    if (uuid.versionNibble() == kFlakeMagicVersion && uuid.variantNibble() == kFlakeMagicVariant) {
        return IdKind::Flake;
    }
    return IdKind::Uuid;
}

UUID embedFlake(const FlakeBytes& flake) {
    UUID::Bytes out{};
    std::size_t src = 0;

    for (std::size_t dst = 0; dst < UUID::kHexLength; ++dst) {
        if (dst == kFlakeMagicVersionOffset) {
            setNibble(out, dst, kFlakeMagicVersion);
        } else if (dst == kFlakeMagicVariantOffset) {
            setNibble(out, dst, kFlakeMagicVariant);
        } else {
            setNibble(out, dst, getNibble(flake, src++));
        }
    }
    return UUID(out);
}

FlakeBytes extractFlake(const UUID& uuid) {
    FlakeBytes out{};
    std::size_t dst = 0;

    for (std::size_t src = 0; src < UUID::kHexLength; ++src) {
        if (!isMagicOffset(src)) {
            setNibble(out, dst++, uuid.nibble(src));
        }
    }
    return out;
}

} // namespace marginalia::ids
