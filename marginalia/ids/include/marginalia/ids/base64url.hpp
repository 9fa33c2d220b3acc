/**
 * @file base64url.hpp
 * @brief URL-safe base64 (RFC 4648 section 5)
 *
 * Uses '-' and '_' in place of '+' and '/'.
 */

#pragma once

#include <marginalia/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace marginalia::ids::base64url {

/// Number of '=' characters standard base64 appends for byteCount bytes
constexpr std::size_t paddingLength(std::size_t byteCount) {
    return (3 - byteCount % 3) % 3;
}

/// Length of the padded encoding of byteCount bytes
constexpr std::size_t encodedLength(std::size_t byteCount) {
    return (byteCount + 2) / 3 * 4;
}

/**
 * @brief Encode bytes
 *
 * @param data Bytes to encode
 * @param pad Append '=' padding to a multiple of four characters
 */
std::string encode(std::span<const uint8_t> data, bool pad = true);

/**
 * @brief Decode text
 *
 * Trailing '=' padding is optional and may be longer than needed.
 * Unused low bits of the final character are ignored. Characters
 * outside the URL-safe alphabet, '=' before the end, and a dangling
 * single character are rejected with InvalidIdentifier.
 */
Result<std::vector<uint8_t>> decode(std::string_view text);

} // namespace marginalia::ids::base64url
