#include <catch2/catch_test_macros.hpp>
#include "codec/BinaryCodec.hpp"

using namespace codec;

TEST_CASE("BinaryCodec - one 8-bit token per ASCII character", "[codec][binary]")
{
    REQUIRE(toBinary("") == "");
    REQUIRE(toBinary("A") == "01000001");
    REQUIRE(toBinary("Hi") == "01001000 01101001");
    REQUIRE(toBinary(" ") == "00100000");
}

TEST_CASE("BinaryCodec - code points past U+00FF widen their token", "[codec][binary]")
{
    REQUIRE(toBinary("\xC3\xA9") == "11101001");          // U+00E9
    REQUIRE(toBinary("\xC4\x81") == "100000001");         // U+0101

    auto result = fromBinary("100000001");
    REQUIRE_FALSE(result);
    REQUIRE(result.error_kind == CodecError::InvalidToken);
}

TEST_CASE("BinaryCodec - ASCII round trip", "[codec][binary]")
{
    const std::string text = "Hello, World! 123";
    auto decoded = fromBinary(toBinary(text));
    REQUIRE(decoded);
    REQUIRE(decoded.value == text);
}

TEST_CASE("BinaryCodec - decoding", "[codec][binary]")
{
    SECTION("Empty input decodes to empty text") {
        auto result = fromBinary("");
        REQUIRE(result);
        REQUIRE(result.value.empty());
    }

    SECTION("Bytes above 0x7F narrow to '?'") {
        auto result = fromBinary("01000001 11111111");
        REQUIRE(result);
        REQUIRE(result.value == "A?");
    }

    SECTION("Short token") {
        auto result = fromBinary("0100000");
        REQUIRE_FALSE(result);
        REQUIRE(result.error_kind == CodecError::InvalidToken);
    }

    SECTION("Non-binary digit") {
        auto result = fromBinary("01000002");
        REQUIRE_FALSE(result);
        REQUIRE(result.error_kind == CodecError::InvalidToken);
    }

    SECTION("Doubled separator") {
        REQUIRE_FALSE(fromBinary("01000001  01000010"));
    }

    SECTION("Trailing separator") {
        REQUIRE_FALSE(fromBinary("01000001 "));
    }
}
