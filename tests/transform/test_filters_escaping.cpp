#include <catch2/catch_test_macros.hpp>
#include "transform/CharacterFilters.hpp"
#include "transform/Escaping.hpp"

using namespace transform;

TEST_CASE("CharacterFilters - remove character classes", "[transform][filter]")
{
    REQUIRE(removeNonAlphanumeric("a-b_c 1!") == "abc1");
    REQUIRE(removeNonAscii("caf\xC3\xA9 \xF0\x9F\x98\x80") == "caf ");
    REQUIRE(removeDigits("a1b2\xD9\xA3") == "ab");
    REQUIRE(removeLetters("a1b2") == "12");
    REQUIRE(removeSpecialCharacters("Hi, you!\tok") == "Hi you\tok");

    SECTION("Blank input is returned unchanged") {
        REQUIRE(removeNonAlphanumeric("  ") == "  ");
        REQUIRE(removeDigits("") == "");
    }
}

TEST_CASE("Escaping - JSON", "[transform][escape]")
{
    REQUIRE(toJsonEscaped("") == "");
    REQUIRE(toJsonEscaped("plain") == "plain");
    REQUIRE(toJsonEscaped("a\"b\\c") == "a\\\"b\\\\c");
    REQUIRE(toJsonEscaped("line\nbreak\ttab\r") == "line\\nbreak\\ttab\\r");
    REQUIRE(toJsonEscaped("\x01") == "\\u0001");
    REQUIRE(toJsonEscaped("caf\xC3\xA9") == "caf\\u00E9");
    REQUIRE(toJsonEscaped("\xF0\x9F\x98\x80") == "\\uD83D\\uDE00");
    REQUIRE(toJsonEscaped("/") == "/");
}

TEST_CASE("Escaping - XML", "[transform][escape]")
{
    REQUIRE(toXmlEscaped("") == "");
    REQUIRE(toXmlEscaped("<a href=\"x\">'&'</a>")
            == "&lt;a href=&quot;x&quot;&gt;&apos;&amp;&apos;&lt;/a&gt;");
    REQUIRE(toXmlEscaped("caf\xC3\xA9") == "caf\xC3\xA9");
}
