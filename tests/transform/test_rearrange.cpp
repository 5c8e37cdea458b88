#include <catch2/catch_test_macros.hpp>
#include "transform/Rearrange.hpp"
#include "unicode/Graphemes.hpp"

#include <algorithm>
#include <random>

using namespace transform;

TEST_CASE("Rearrange - reverse keeps grapheme clusters intact", "[transform][rearrange]")
{
    REQUIRE(reverse("") == "");
    REQUIRE(reverse("abc") == "cba");
    REQUIRE(reverse("e\xCC\x81x") == "xe\xCC\x81");
    REQUIRE(reverse("a\xF0\x9F\x87\xAF\xF0\x9F\x87\xB5") == "\xF0\x9F\x87\xAF\xF0\x9F\x87\xB5" "a");
    REQUIRE(reverse(reverse("h\xC3\xA9llo")) == "h\xC3\xA9llo");
}

TEST_CASE("Rearrange - shuffle permutes clusters", "[transform][rearrange]")
{
    const std::string text = "The quick brown fox e\xCC\x81 \xF0\x9F\x98\x80";

    SECTION("Same seed, same permutation") {
        std::mt19937 first(42);
        std::mt19937 second(42);
        REQUIRE(shuffle(text, first) == shuffle(text, second));
    }

    SECTION("The multiset of clusters is preserved") {
        std::mt19937 rng(7);
        auto original = unicode::splitGraphemes(text);
        auto shuffled = unicode::splitGraphemes(shuffle(text, rng));
        std::sort(original.begin(), original.end());
        std::sort(shuffled.begin(), shuffled.end());
        REQUIRE(original == shuffled);
    }

    SECTION("Trivial inputs") {
        std::mt19937 rng(1);
        REQUIRE(shuffle("", rng) == "");
        REQUIRE(shuffle("x", rng) == "x");
    }
}
