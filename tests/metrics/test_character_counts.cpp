#include <catch2/catch_test_macros.hpp>
#include "metrics/CharacterCounts.hpp"
#include "metrics/TextStatistics.hpp"

#include <string>

using namespace metrics;

TEST_CASE("CharacterCounts - lengths in bytes, code points and graphemes", "[metrics][length]")
{
    SECTION("ASCII") {
        REQUIRE(codeUnitLength("hello") == 5);
        REQUIRE(codePointLength("hello") == 5);
        REQUIRE(logicalLength("hello") == 5);
        REQUIRE(countCharacters("hello") == 5);
    }

    SECTION("Precomposed accent") {
        REQUIRE(codeUnitLength("h\xC3\xA9llo") == 6);
        REQUIRE(codePointLength("h\xC3\xA9llo") == 5);
        REQUIRE(logicalLength("h\xC3\xA9llo") == 5);
    }

    SECTION("Combining accent") {
        const std::string text = "e\xCC\x81";
        REQUIRE(codePointLength(text) == 2);
        REQUIRE(logicalLength(text) == 1);
    }

    SECTION("Flag emoji") {
        const std::string flag = "\xF0\x9F\x87\xAF\xF0\x9F\x87\xB5";
        REQUIRE(codeUnitLength(flag) == 8);
        REQUIRE(codePointLength(flag) == 2);
        REQUIRE(logicalLength(flag) == 1);
    }

    SECTION("Ill-formed byte counts once") {
        REQUIRE(codePointLength("a\xFF" "b") == 3);
    }

    SECTION("Empty") {
        REQUIRE(codeUnitLength("") == 0);
        REQUIRE(codePointLength("") == 0);
        REQUIRE(logicalLength("") == 0);
    }
}

TEST_CASE("CharacterCounts - class counters", "[metrics][counts]")
{
    const std::string text = "Hello World";
    REQUIRE(countVowels(text) == 3);
    REQUIRE(countConsonants(text) == 7);
    REQUIRE(countUppercase(text) == 2);
    REQUIRE(countLowercase(text) == 8);
    REQUIRE(countWhitespace(text) == 1);
    REQUIRE(countDigits(text) == 0);
    REQUIRE(countPunctuation(text) == 0);

    REQUIRE(countDigits("a1b2\xD9\xA3") == 3);
    REQUIRE(countWhitespace("a b\tc\nd\r") == 4);
    REQUIRE(countPunctuation("Hi, there! ok?") == 3);
    REQUIRE(countPunctuation("1 + 1 = $2") == 0);

    SECTION("Non-ASCII letters are consonants unless they are ASCII vowels") {
        REQUIRE(countVowels("\xC3\xA9t\xC3\xA9") == 0);
        REQUIRE(countConsonants("\xC3\xA9t\xC3\xA9") == 3);
    }

    SECTION("Empty input counts nothing") {
        REQUIRE(countVowels("") == 0);
        REQUIRE(countConsonants("") == 0);
        REQUIRE(countCharacters("") == 0);
    }
}

TEST_CASE("TextStatistics - aggregates every metric", "[metrics][stats]")
{
    const TextStatistics stats = analyze("The cat sat.\n\nThe dog ran!");
    REQUIRE(stats.words == 6);
    REQUIRE(stats.sentences == 2);
    REQUIRE(stats.paragraphs == 2);
    REQUIRE(stats.uppercase == 2);
    REQUIRE(stats.punctuation == 2);
    REQUIRE(stats.most_frequent_word == "The");
    REQUIRE(stats.least_frequent_word == "cat");

    const std::string formatted = formatStatistics(stats);
    REQUIRE(formatted.find("words: 6") != std::string::npos);
    REQUIRE(formatted.find("paragraphs: 2") != std::string::npos);
}
