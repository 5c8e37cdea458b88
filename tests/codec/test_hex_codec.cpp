#include <catch2/catch_test_macros.hpp>
#include "codec/HexCodec.hpp"

using namespace codec;

TEST_CASE("HexCodec - encodes UTF-8 bytes as uppercase hex", "[codec][hex]")
{
    REQUIRE(toHex("") == "");
    REQUIRE(toHex("Hi") == "4869");
    REQUIRE(toHex("\xC3\xA9") == "C3A9");
    REQUIRE(toHex("\n") == "0A");
}

TEST_CASE("HexCodec - decodes either digit case", "[codec][hex]")
{
    auto upper = fromHex("48656C6C6F");
    REQUIRE(upper);
    REQUIRE(upper.value == "Hello");

    auto lower = fromHex("c3a9");
    REQUIRE(lower);
    REQUIRE(lower.value == "\xC3\xA9");

    auto empty = fromHex("");
    REQUIRE(empty);
    REQUIRE(empty.value.empty());
}

TEST_CASE("HexCodec - round trip preserves multi-byte text", "[codec][hex]")
{
    const std::string text = "こんにちは \xF0\x9F\x98\x80 world";
    auto decoded = fromHex(toHex(text));
    REQUIRE(decoded);
    REQUIRE(decoded.value == text);
}

TEST_CASE("HexCodec - malformed input", "[codec][hex]")
{
    SECTION("Odd number of digits") {
        auto result = fromHex("486");
        REQUIRE_FALSE(result);
        REQUIRE(result.error_kind == CodecError::OddLength);
        REQUIRE(result.isMalformedInput());
        REQUIRE(result.value.empty());
    }

    SECTION("Non-hex character") {
        auto result = fromHex("4G");
        REQUIRE_FALSE(result);
        REQUIRE(result.error_kind == CodecError::InvalidDigit);
    }

    SECTION("Whitespace is not a digit") {
        auto result = fromHex("48 69");
        REQUIRE_FALSE(result);
    }

    SECTION("Bytes that are not UTF-8") {
        auto result = fromHex("FF");
        REQUIRE_FALSE(result);
        REQUIRE(result.error_kind == CodecError::InvalidEncoding);
        REQUIRE(result.error.has_value());
    }
}
