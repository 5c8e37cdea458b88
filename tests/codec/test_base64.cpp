#include <catch2/catch_test_macros.hpp>
#include "codec/Base64.hpp"

#include <string>

using namespace codec;

namespace
{
Bytes bytesOf(const std::string& s)
{
    return Bytes(s.begin(), s.end());
}
} // namespace

TEST_CASE("Base64 - encodes with padding", "[codec][base64]")
{
    REQUIRE(base64Encode(bytesOf("")) == "");
    REQUIRE(base64Encode(bytesOf("M")) == "TQ==");
    REQUIRE(base64Encode(bytesOf("Ma")) == "TWE=");
    REQUIRE(base64Encode(bytesOf("Man")) == "TWFu");
    REQUIRE(base64Encode(Bytes{ 0xFB, 0xFF }) == "+/8=");
}

TEST_CASE("Base64 - decodes the standard alphabet", "[codec][base64]")
{
    auto result = base64Decode("TWFu");
    REQUIRE(result);
    REQUIRE(result.value == bytesOf("Man"));

    auto padded = base64Decode("TQ==");
    REQUIRE(padded);
    REQUIRE(padded.value == bytesOf("M"));

    auto symbols = base64Decode("+/8=");
    REQUIRE(symbols);
    REQUIRE(symbols.value == Bytes{ 0xFB, 0xFF });

    SECTION("ASCII whitespace is skipped") {
        auto spaced = base64Decode("TW\r\nE= ");
        REQUIRE(spaced);
        REQUIRE(spaced.value == bytesOf("Ma"));
    }
}

TEST_CASE("Base64 - malformed input", "[codec][base64]")
{
    SECTION("Truncated quantum") {
        auto result = base64Decode("TWF");
        REQUIRE_FALSE(result);
        REQUIRE(result.error_kind == CodecError::InvalidBase64);
    }

    SECTION("Character outside the alphabet") {
        REQUIRE_FALSE(base64Decode("TW*u"));
        REQUIRE_FALSE(base64Decode("TWF-"));
    }

    SECTION("Padding in the middle") {
        REQUIRE_FALSE(base64Decode("TW=u"));
        REQUIRE_FALSE(base64Decode("TQ==TQ=="));
        REQUIRE_FALSE(base64Decode("T==="));
    }
}
