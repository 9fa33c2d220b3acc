/**
 * @file url_safe_id.cpp
 * @brief URL-safe identifier codec implementation
 */

#include <marginalia/ids/url_safe_id.hpp>
#include <marginalia/ids/base64url.hpp>
#include <marginalia/core/logger.hpp>

#include <algorithm>

namespace marginalia::ids {

namespace {

Error invalidIdentifier(std::string_view urlSafe) {
    MARGINALIA_LOG_DEBUG("Rejected identifier '{}'", urlSafe);
    return Error(ErrorCode::InvalidIdentifier,
        "'" + std::string(urlSafe) + "' is not a valid encoded UUID");
}

} // anonymous namespace

Result<UUID> parse(std::string_view urlSafe) {
    // Callers omit padding; supply the most any length could need
    auto decoded = base64url::decode(std::string(urlSafe) + "==");
    if (!decoded) {
        return invalidIdentifier(urlSafe);
    }

    const auto& bytes = decoded.value();

    if (urlSafe.size() == kUuidIdLength && bytes.size() == UUID::kSize) {
        UUID::Bytes data{};
        std::copy(bytes.begin(), bytes.end(), data.begin());
        return UUID(data);
    }

    if (urlSafe.size() == kFlakeIdLength && bytes.size() == FlakeBytes{}.size()) {
        FlakeBytes flake{};
        std::copy(bytes.begin(), bytes.end(), flake.begin());
        return embedFlake(flake);
    }

    return invalidIdentifier(urlSafe);
}

std::string format(const UUID& uuid) {
    if (classify(uuid) == IdKind::Flake) {
        return base64url::encode(extractFlake(uuid), false);
    }

    std::string encoded = base64url::encode(uuid.data());
    encoded.resize(encoded.size() - base64url::paddingLength(UUID::kSize));
    return encoded;
}

Result<std::string> decode(std::string_view urlSafe) {
    return parse(urlSafe).map([](const UUID& uuid) { return uuid.toHex(); });
}

Result<std::string> decodeValue(const nlohmann::json& value) {
    if (!value.is_string()) {
        return Error(ErrorCode::InvalidInput,
            std::string("identifier is ") + value.type_name() + ", expected string");
    }
    return decode(value.get_ref<const std::string&>());
}

Result<std::string> encode(std::string_view hexUuid) {
    auto uuid = UUID::fromString(hexUuid);
    if (!uuid) {
        MARGINALIA_LOG_DEBUG("Rejected UUID '{}': {}", hexUuid, uuid.error().what());
        return uuid.error();
    }
    return format(uuid.value());
}

} // namespace marginalia::ids
