/**
 * @file base64url.cpp
 * @brief URL-safe base64 implementation
 */

#include <marginalia/ids/base64url.hpp>

#include <array>

namespace marginalia::ids::base64url {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                             "abcdefghijklmnopqrstuvwxyz"
                             "0123456789-_";

constexpr std::array<int8_t, 256> makeDecodeTable() {
    std::array<int8_t, 256> table{};
    for (auto& entry : table) {
        entry = -1;
    }
    for (int i = 0; i < 64; ++i) {
        table[static_cast<uint8_t>(kAlphabet[i])] = static_cast<int8_t>(i);
    }
    return table;
}

constexpr auto kDecodeTable = makeDecodeTable();

} // anonymous namespace

std::string encode(std::span<const uint8_t> data, bool pad) {
    std::string encoded;
    encoded.reserve(encodedLength(data.size()));

    std::size_t i = 0;
    while (i + 2 < data.size()) {
        const uint32_t triple = (static_cast<uint32_t>(data[i]) << 16)
                              | (static_cast<uint32_t>(data[i + 1]) << 8)
                              | static_cast<uint32_t>(data[i + 2]);
        i += 3;

        encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        encoded.push_back(kAlphabet[triple & 0x3F]);
    }

    // Remaining 1 or 2 bytes
    if (i < data.size()) {
        uint32_t last = data[i++];
        encoded.push_back(kAlphabet[last >> 2]);
        if (i == data.size()) {
            encoded.push_back(kAlphabet[(last & 0x03) << 4]);
        } else {
            last = (last << 8) | data[i];
            encoded.push_back(kAlphabet[(last >> 4) & 0x3F]);
            encoded.push_back(kAlphabet[(last & 0x0F) << 2]);
        }
    }

    if (pad) {
        encoded.append(paddingLength(data.size()), '=');
    }
    return encoded;
}

Result<std::vector<uint8_t>> decode(std::string_view text) {
    const auto end = text.find_last_not_of('=');
    const std::string_view body = (end == std::string_view::npos) ? std::string_view() : text.substr(0, end + 1);

    if (body.size() % 4 == 1) {
        return Error(ErrorCode::InvalidIdentifier,
            "invalid base64: " + std::to_string(body.size()) + " data characters");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(body.size() / 4 * 3 + 2);

    uint32_t accumulator = 0;
    int bits = 0;
    for (char c : body) {
        const int8_t value = kDecodeTable[static_cast<uint8_t>(c)];
        if (value < 0) {
            return Error(ErrorCode::InvalidIdentifier,
                std::string("invalid base64 character '") + c + "'");
        }

        accumulator = (accumulator << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            bytes.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFF));
        }
    }

    return bytes;
}

} // namespace marginalia::ids::base64url
