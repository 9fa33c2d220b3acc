/**
 * @file ResultTest.cc
 * @brief Result and Error tests
 */

#include <marginalia/core/result.hpp>
#include <marginalia/core/uuid.hpp>
#include <marginalia/ids/url_safe_id.hpp>

#include <catch2/catch.hpp>

#include <string>

using namespace marginalia;

TEST_CASE("Result: value access", "[Result]") {
    Result<int> good = Ok(7);
    Result<int> bad = Err<int>(ErrorCode::InvalidInput, "no number");

    CHECK(good.ok());
    CHECK(good.value() == 7);
    CHECK(good.valueOr(-1) == 7);

    CHECK(bad.isError());
    CHECK(bad.valueOr(-1) == -1);
    CHECK(bad.error().code() == ErrorCode::InvalidInput);
    CHECK_THROWS_AS(bad.value(), BadResultAccess);
    CHECK_THROWS_AS(good.error(), std::logic_error);
}

TEST_CASE("Result: chaining identifier conversions", "[Result]") {
    auto toUuid = [](const std::string& hex) { return UUID::fromString(hex); };

    SECTION("Success flows through") {
        auto uuid = ids::decode("AVYr35jQRM-Y5O0xdC8F").andThen(toUuid);
        REQUIRE(uuid.ok());
        CHECK(uuid.value().toString() == "01562bdf-98d0-e44c-5f98-e4ed31742f05");
    }

    SECTION("First error short-circuits") {
        bool called = false;
        auto uuid = ids::decode("bad").andThen([&](const std::string& hex) {
            called = true;
            return UUID::fromString(hex);
        });
        REQUIRE(uuid.isError());
        CHECK(uuid.error().code() == ErrorCode::InvalidIdentifier);
        CHECK_FALSE(called);
    }

    SECTION("valueOr after a chain") {
        const std::string hex = ids::decode("AAAA").valueOr(std::string(32, '0'));
        CHECK(hex == std::string(32, '0'));
    }
}

TEST_CASE("Result: void results", "[Result]") {
    Result<void> done = Ok();
    Result<void> failed = Err(ErrorCode::FileNotFound, "missing");

    CHECK(done.ok());
    CHECK_FALSE(failed);
    CHECK(failed.error().code() == ErrorCode::FileNotFound);
    CHECK(failed.error().message() == "missing");
}
