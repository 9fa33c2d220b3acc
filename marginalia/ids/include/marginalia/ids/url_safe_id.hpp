/**
 * @file url_safe_id.hpp
 * @brief Client-facing URL-safe identifiers
 *
 * Applications see a single URL-safe string; storage sees a UUID.
 *
 *   22 characters  <->  a genuine UUID (16 bytes, base64url, padding stripped)
 *   20 characters  <->  a flake ID (15 bytes, base64url, no padding needed)
 *
 * All functions are pure and safe to call concurrently.
 */

#pragma once

#include <marginalia/core/result.hpp>
#include <marginalia/core/uuid.hpp>
#include <marginalia/ids/flake.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace marginalia::ids {

/// Length of the URL-safe form of a genuine UUID
constexpr std::size_t kUuidIdLength = 22;

/// Length of the URL-safe form of a flake ID
constexpr std::size_t kFlakeIdLength = 20;

/**
 * @brief Parse a URL-safe identifier into its storage UUID
 *
 * @return The UUID (flake IDs come back with the magic nibbles
 *         inserted), or InvalidIdentifier
 */
Result<UUID> parse(std::string_view urlSafe);

/// URL-safe form of a stored UUID (20 characters for embedded flake IDs, else 22)
std::string format(const UUID& uuid);

/**
 * @brief URL-safe identifier to 32 lowercase hex digits
 *
 * @return Hex string, or InvalidIdentifier for malformed base64 or a
 *         length other than 20 or 22
 */
Result<std::string> decode(std::string_view urlSafe);

/**
 * @brief Dynamic value to 32 lowercase hex digits
 *
 * @return InvalidInput if value is not a string (null included),
 *         otherwise as decode(std::string_view)
 */
Result<std::string> decodeValue(const nlohmann::json& value);

/**
 * @brief Hex UUID (dashed or not, any case) to URL-safe identifier
 *
 * @return URL-safe string, or InvalidIdentifier if hexUuid is not a UUID
 */
Result<std::string> encode(std::string_view hexUuid);

} // namespace marginalia::ids
