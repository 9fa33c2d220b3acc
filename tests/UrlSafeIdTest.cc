/**
 * @file UrlSafeIdTest.cc
 * @brief URL-safe identifier codec tests
 */

#include <marginalia/ids/url_safe_id.hpp>
#include <marginalia/ids/flake.hpp>

#include <catch2/catch.hpp>

#include <algorithm>
#include <random>
#include <string>

using namespace marginalia;
using namespace marginalia::ids;

namespace {

std::mt19937& rng() {
    static std::mt19937 gen(0x5eed);
    return gen;
}

UUID::Bytes randomBytes() {
    std::uniform_int_distribution<int> dist(0, 255);
    UUID::Bytes bytes{};
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(dist(rng()));
    }
    return bytes;
}

/// Random RFC 4122 UUID of the given version
UUID standardUuid(int version) {
    auto bytes = randomBytes();
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | (version << 4));
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    return UUID(bytes);
}

FlakeBytes randomFlake() {
    const auto bytes = randomBytes();
    FlakeBytes flake{};
    std::copy(bytes.begin(), bytes.begin() + flake.size(), flake.begin());
    return flake;
}

} // anonymous namespace

TEST_CASE("UrlSafeId: known UUIDs", "[UrlSafeId]") {
    struct Vector { const char* hex; const char* id; };
    const Vector vectors[] = {
        {"00000000000000000000000000000000", "AAAAAAAAAAAAAAAAAAAAAA"},
        {"ffffffffffffffffffffffffffffffff", "_____________________w"},
        {"550e8400e29b41d4a716446655440000", "VQ6EAOKbQdSnFkRmVUQAAA"},
        {"0123456789abcdef0123456789abcdef", "ASNFZ4mrze8BI0VniavN7w"},
        {"73badbbaf1234c6fb403a6d9849c829c", "c7rbuvEjTG-0A6bZhJyCnA"},
    };

    for (const auto& v : vectors) {
        INFO("hex = " << v.hex);
        auto encoded = encode(v.hex);
        REQUIRE(encoded.ok());
        CHECK(encoded.value() == v.id);

        auto decoded = decode(v.id);
        REQUIRE(decoded.ok());
        CHECK(decoded.value() == v.hex);
    }
}

TEST_CASE("UrlSafeId: known flake IDs", "[UrlSafeId]") {
    struct Vector { const char* id; const char* hex; };
    const Vector vectors[] = {
        {"AVYr35jQRM-Y5O0xdC8F", "01562bdf98d0e44c5f98e4ed31742f05"},
        {"AAAAAAAAAAAAAAAAAAAA", "000000000000e0005000000000000000"},
        {"____________________", "ffffffffffffefff5fffffffffffffff"},
        {"AAECAwQFBgcICQoLDA0O", "000102030405e0605708090a0b0c0d0e"},
    };

    for (const auto& v : vectors) {
        INFO("id = " << v.id);
        auto decoded = decode(v.id);
        REQUIRE(decoded.ok());
        CHECK(decoded.value() == v.hex);
        CHECK(decoded.value().size() == 32);

        auto encoded = encode(v.hex);
        REQUIRE(encoded.ok());
        CHECK(encoded.value() == v.id);
    }
}

TEST_CASE("UrlSafeId: magic nibble positions", "[UrlSafeId]") {
    // 30 hex digits 000102030405 060 708090a0b0c0d0e
    auto uuid = parse("AAECAwQFBgcICQoLDA0O");
    REQUIRE(uuid.ok());
    CHECK(uuid.value().nibble(kFlakeMagicVersionOffset) == 0xe);
    CHECK(uuid.value().nibble(kFlakeMagicVariantOffset) == 0x5);
    CHECK(classify(uuid.value()) == IdKind::Flake);

    const auto hex = uuid.value().toHex();
    CHECK(hex.substr(0, 12) == "000102030405");
    CHECK(hex[12] == 'e');
    CHECK(hex.substr(13, 3) == "060");
    CHECK(hex[16] == '5');
    CHECK(hex.substr(17) == "708090a0b0c0d0e");
}

TEST_CASE("UrlSafeId: encode accepts any UUID text form", "[UrlSafeId]") {
    for (const char* text : {"550e8400-e29b-41d4-a716-446655440000",
                             "550E8400E29B41D4A716446655440000",
                             "{550e8400-e29b-41d4-a716-446655440000}"}) {
        INFO("text = " << text);
        auto encoded = encode(text);
        REQUIRE(encoded.ok());
        CHECK(encoded.value() == "VQ6EAOKbQdSnFkRmVUQAAA");
    }

    auto flake = encode("01562BDF-98D0-E44C-5F98-E4ED31742F05");
    REQUIRE(flake.ok());
    CHECK(flake.value() == "AVYr35jQRM-Y5O0xdC8F");
}

TEST_CASE("UrlSafeId: genuine UUIDs never look like flake IDs", "[UrlSafeId]") {
    for (int version = 1; version <= 5; ++version) {
        for (int i = 0; i < 200; ++i) {
            const UUID uuid = standardUuid(version);
            INFO("uuid = " << uuid.toString());
            CHECK(classify(uuid) == IdKind::Uuid);

            auto encoded = encode(uuid.toHex());
            REQUIRE(encoded.ok());
            CHECK(encoded.value().size() == kUuidIdLength);

            auto decoded = decode(encoded.value());
            REQUIRE(decoded.ok());
            CHECK(decoded.value() == uuid.toHex());
        }
    }
}

TEST_CASE("UrlSafeId: UUID round trip", "[UrlSafeId]") {
    for (int i = 0; i < 1000; ++i) {
        const UUID uuid(randomBytes());
        if (classify(uuid) == IdKind::Flake) {
            continue;
        }
        const auto hex = uuid.toHex();
        INFO("hex = " << hex);

        auto id = encode(hex);
        REQUIRE(id.ok());
        CHECK(id.value().size() == kUuidIdLength);

        auto back = decode(id.value());
        REQUIRE(back.ok());
        CHECK(back.value() == hex);
        CHECK(encode(back.value()).value() == id.value());
    }
}

TEST_CASE("UrlSafeId: flake round trip", "[UrlSafeId]") {
    for (int i = 0; i < 1000; ++i) {
        const FlakeBytes flake = randomFlake();
        const UUID stored = embedFlake(flake);
        REQUIRE(classify(stored) == IdKind::Flake);
        CHECK(extractFlake(stored) == flake);

        const auto hex = stored.toHex();
        INFO("hex = " << hex);

        auto id = encode(hex);
        REQUIRE(id.ok());
        CHECK(id.value().size() == kFlakeIdLength);

        auto back = decode(id.value());
        REQUIRE(back.ok());
        CHECK(back.value() == hex);
        CHECK(encode(back.value()).value() == id.value());
    }
}

TEST_CASE("UrlSafeId: repeated e5 pattern is a genuine UUID", "[UrlSafeId]") {
    // Nibble 12 is 'e' but nibble 16 is 'e' too, so this is not a flake ID
    const std::string hex = "e5e5e5e5e5e5e5e5e5e5e5e5e5e5e5e5";

    auto id = encode(hex);
    REQUIRE(id.ok());
    CHECK(id.value() == "5eXl5eXl5eXl5eXl5eXl5Q");

    auto back = decode(id.value());
    REQUIRE(back.ok());
    CHECK(back.value() == hex);
}

TEST_CASE("UrlSafeId: decode rejects other lengths", "[UrlSafeId]") {
    const std::string valid = "VQ6EAOKbQdSnFkRmVUQAAA";

    for (size_t length = 0; length <= 40; ++length) {
        if (length == kUuidIdLength || length == kFlakeIdLength) {
            continue;
        }
        std::string text;
        while (text.size() < length) {
            text += valid;
        }
        text.resize(length);

        INFO("text = '" << text << "'");
        auto decoded = decode(text);
        REQUIRE(decoded.isError());
        CHECK(decoded.error().code() == ErrorCode::InvalidIdentifier);
    }
}

TEST_CASE("UrlSafeId: decode rejects malformed base64", "[UrlSafeId]") {
    for (const char* text : {"VQ6EAOKbQdSnFkRmVUQA+A",
                             "VQ6EAOKbQdSnFkRmVUQA/A",
                             "VQ6EAOKbQdSnFkRmVU AAA",
                             "VQ6EAOKbQdSnFkRmVUQA=A",
                             "AVYr35jQRM!Y5O0xdC8F",
                             "AAAAAAAAAAAAAAAAAAAA==",
                             "AAAAAAAAAAAAAAAAAA=="}) {
        INFO("text = " << text);
        auto decoded = decode(text);
        REQUIRE(decoded.isError());
        CHECK(decoded.error().code() == ErrorCode::InvalidIdentifier);
    }
}

TEST_CASE("UrlSafeId: decode ignores unused trailing bits", "[UrlSafeId]") {
    auto decoded = decode("AAAAAAAAAAAAAAAAAAAAAB");
    REQUIRE(decoded.ok());
    CHECK(decoded.value() == std::string(32, '0'));
}

TEST_CASE("UrlSafeId: encode rejects non-UUIDs", "[UrlSafeId]") {
    for (const char* text : {"", "not a uuid", "VQ6EAOKbQdSnFkRmVUQAAA", "550e8400e29b41d4a71644665544000"}) {
        INFO("text = " << text);
        auto encoded = encode(text);
        REQUIRE(encoded.isError());
        CHECK(encoded.error().code() == ErrorCode::InvalidIdentifier);
    }
}

TEST_CASE("UrlSafeId: decodeValue type guard", "[UrlSafeId]") {
    SECTION("Non-string values are InvalidInput") {
        for (const auto& value : {nlohmann::json(123), nlohmann::json(nullptr), nlohmann::json(true),
                                  nlohmann::json::array(), nlohmann::json::object()}) {
            INFO("value = " << value.dump());
            auto decoded = decodeValue(value);
            REQUIRE(decoded.isError());
            CHECK(decoded.error().code() == ErrorCode::InvalidInput);
        }
    }

    SECTION("Strings are decoded") {
        auto decoded = decodeValue(nlohmann::json("VQ6EAOKbQdSnFkRmVUQAAA"));
        REQUIRE(decoded.ok());
        CHECK(decoded.value() == "550e8400e29b41d4a716446655440000");
    }

    SECTION("Bad strings are InvalidIdentifier") {
        auto decoded = decodeValue(nlohmann::json("123"));
        REQUIRE(decoded.isError());
        CHECK(decoded.error().code() == ErrorCode::InvalidIdentifier);
    }
}

TEST_CASE("UrlSafeId: format stored UUIDs", "[UrlSafeId]") {
    auto uuid = UUID::fromString("550e8400-e29b-41d4-a716-446655440000").value();
    CHECK(format(uuid) == "VQ6EAOKbQdSnFkRmVUQAAA");

    auto flake = parse("AVYr35jQRM-Y5O0xdC8F");
    REQUIRE(flake.ok());
    CHECK(format(flake.value()) == "AVYr35jQRM-Y5O0xdC8F");
}
