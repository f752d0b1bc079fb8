#include <catch2/catch_test_macros.hpp>

#include "base64.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return {s.begin(), s.end()};
}

} // namespace

TEST_CASE("base64", "[base64]") {

    SECTION("EncodeRfcVectors") {
        REQUIRE(base64::encode(bytes("")) == "");
        REQUIRE(base64::encode(bytes("f")) == "Zg==");
        REQUIRE(base64::encode(bytes("fo")) == "Zm8=");
        REQUIRE(base64::encode(bytes("foo")) == "Zm9v");
        REQUIRE(base64::encode(bytes("foobar")) == "Zm9vYmFy");
    }

    SECTION("DecodePadded") {
        auto out = base64::decode("Zm9vYg==");
        REQUIRE(out.has_value());
        REQUIRE(*out == bytes("foob"));
    }

    SECTION("DecodeUnpadded") {
        auto out = base64::decode("Zm9vYg");
        REQUIRE(out.has_value());
        REQUIRE(*out == bytes("foob"));
    }

    SECTION("DecodeSkipsLineBreaks") {
        auto out = base64::decode("Zm9v\r\nYmFy\n");
        REQUIRE(out.has_value());
        REQUIRE(*out == bytes("foobar"));
    }

    SECTION("DecodeBinary") {
        std::vector<uint8_t> data = {0x00, 0xff, 0x10, 0x80, 0x7f};
        auto out = base64::decode(base64::encode(data));
        REQUIRE(out.has_value());
        REQUIRE(*out == data);
    }

    SECTION("DecodeEmpty") {
        auto out = base64::decode("");
        REQUIRE(out.has_value());
        REQUIRE(out->empty());
    }

    SECTION("RejectsInvalidCharacters") {
        REQUIRE_FALSE(base64::decode("Zm9v!").has_value());
        REQUIRE_FALSE(base64::decode("Zm-v").has_value());
    }

    SECTION("RejectsDataAfterPadding") {
        REQUIRE_FALSE(base64::decode("Zg==Zg").has_value());
    }

    SECTION("RejectsDanglingSextet") {
        REQUIRE_FALSE(base64::decode("Zm9vY").has_value());
    }
}
