/**
 * @file uuid.cpp
 * @brief UUID implementation
 */

#include <marginalia/core/uuid.hpp>

#include <algorithm>

namespace marginalia {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void eraseAll(std::string& str, std::string_view token) {
    for (auto pos = str.find(token); pos != std::string::npos; pos = str.find(token, pos)) {
        str.erase(pos, token.size());
    }
}

} // anonymous namespace

Result<UUID> UUID::fromString(std::string_view str) {
    std::string hex(str);

    eraseAll(hex, "urn:");
    eraseAll(hex, "uuid:");

    // Strip surrounding braces, then dashes anywhere
    const auto first = hex.find_first_not_of("{}");
    const auto last = hex.find_last_not_of("{}");
    hex = (first == std::string::npos) ? std::string() : hex.substr(first, last - first + 1);
    hex.erase(std::remove(hex.begin(), hex.end(), '-'), hex.end());

    if (hex.size() != kHexLength) {
        return Error(ErrorCode::InvalidIdentifier,
            "'" + std::string(str) + "' is not a valid UUID: expected 32 hex digits");
    }

    Bytes bytes{};
    for (std::size_t i = 0; i < kSize; ++i) {
        const int hi = hexValue(hex[i * 2]);
        const int lo = hexValue(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return Error(ErrorCode::InvalidIdentifier,
                "'" + std::string(str) + "' is not a valid UUID: non-hex character");
        }
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }

    return UUID(bytes);
}

std::string UUID::toHex() const {
    std::string out;
    out.reserve(kHexLength);

    for (uint8_t byte : m_data) {
        out.push_back(kHexDigits[byte >> 4]);
        out.push_back(kHexDigits[byte & 0x0F]);
    }
    return out;
}

std::string UUID::toString() const {
    const std::string hex = toHex();
    std::string out;
    out.reserve(kHexLength + 4);

    for (std::size_t i = 0; i < kHexLength; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            out.push_back('-');
        }
        out.push_back(hex[i]);
    }
    return out;
}

bool UUID::isNull() const {
    for (uint8_t byte : m_data) {
        if (byte != 0) return false;
    }
    return true;
}

} // namespace marginalia
