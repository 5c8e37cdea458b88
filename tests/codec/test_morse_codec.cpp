#include <catch2/catch_test_macros.hpp>
#include "codec/MorseCodec.hpp"
#include "codec/MorseTable.hpp"

#include <string>

using namespace codec;

TEST_CASE("MorseTable - covers A-Z and 0-9 in both directions", "[codec][morse]")
{
    const MorseTable& table = MorseTable::Instance();
    REQUIRE(table.size() == 36);

    const std::u32string symbols = U"ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
    for (char32_t symbol : symbols)
    {
        const std::string* token = table.tokenFor(symbol);
        REQUIRE(token != nullptr);
        REQUIRE(table.symbolFor(*token) == symbol);
    }

    REQUIRE(table.tokenFor(U'a') == nullptr);
    REQUIRE(table.tokenFor(U'?') == nullptr);
    REQUIRE(table.symbolFor("......") == U'\0');
}

TEST_CASE("MorseCodec - encoding", "[codec][morse]")
{
    REQUIRE(toMorse("SOS") == "... --- ...");
    REQUIRE(toMorse("sos") == "... --- ...");
    REQUIRE(toMorse("E5") == ". .....");
    REQUIRE(toMorse("") == "");

    SECTION("Characters outside the alphabet are dropped") {
        REQUIRE(toMorse("a b!") == ".- -...");
        REQUIRE(toMorse("?!") == "");
    }
}

TEST_CASE("MorseCodec - decoding", "[codec][morse]")
{
    REQUIRE(fromMorse("... --- ...") == "SOS");
    REQUIRE(fromMorse(".---- ..---") == "12");
    REQUIRE(fromMorse("") == "");

    SECTION("Unknown tokens are dropped") {
        REQUIRE(fromMorse("... ...... ---") == "SO");
    }
}

TEST_CASE("MorseCodec - round trip of upper-case alphanumerics", "[codec][morse]")
{
    const std::string text = "THEQUICKBROWNFOX0123456789";
    REQUIRE(fromMorse(toMorse(text)) == text);
}
