#include <catch2/catch_test_macros.hpp>
#include "ops/OperationRegistry.hpp"

#include <set>
#include <string>

using namespace ops;

TEST_CASE("OperationRegistry - lookup", "[ops][registry]")
{
    OperationRegistry registry;

    SECTION("Known operations resolve") {
        const auto* def = registry.findOperation("to-hex");
        REQUIRE(def != nullptr);
        REQUIRE(def->category == OperationCategory::Codec);
        REQUIRE(def->handler);

        const auto* words = registry.findOperation("count-words");
        REQUIRE(words != nullptr);
        REQUIRE(words->category == OperationCategory::Metrics);

        const auto* snake = registry.findOperation("snake-case");
        REQUIRE(snake != nullptr);
        REQUIRE(snake->category == OperationCategory::Transform);
    }

    SECTION("Unknown operations do not") {
        REQUIRE(registry.findOperation("to-klingon") == nullptr);
        REQUIRE_FALSE(registry.run("to-klingon", "x").has_value());
    }

    SECTION("Names are unique and every entry has a handler") {
        std::set<std::string> names;
        for (const auto& def : registry.operations())
        {
            REQUIRE(names.insert(def.name).second);
            REQUIRE(def.handler);
            REQUIRE_FALSE(def.summary.empty());
        }
        REQUIRE(names.size() == registry.operations().size());
    }
}

TEST_CASE("OperationRegistry - running operations", "[ops][registry]")
{
    OperationRegistry registry;

    SECTION("Codec operations") {
        auto hex = registry.run("to-hex", "Hi");
        REQUIRE(hex.has_value());
        REQUIRE(*hex);
        REQUIRE(hex->value == "4869");

        auto back = registry.run("from-hex", hex->value);
        REQUIRE(back->value == "Hi");
    }

    SECTION("Decode failures propagate") {
        auto bad = registry.run("from-hex", "ZZ");
        REQUIRE(bad.has_value());
        REQUIRE_FALSE(*bad);
        REQUIRE(bad->error_kind == codec::CodecError::InvalidDigit);
    }

    SECTION("Counts are rendered in decimal") {
        REQUIRE(registry.run("count-words", "a b c")->value == "3");
        REQUIRE(registry.run("logical-length", "e\xCC\x81")->value == "1");
        REQUIRE(registry.run("length", "\xC3\xA9")->value == "2");
    }

    SECTION("Compression round trip") {
        auto packed = registry.run("compress", "registry payload");
        REQUIRE(*packed);
        auto unpacked = registry.run("decompress", packed->value);
        REQUIRE(*unpacked);
        REQUIRE(unpacked->value == "registry payload");
    }

    SECTION("Statistics") {
        auto stats = registry.run("stats", "One two. Three!");
        REQUIRE(*stats);
        REQUIRE(stats->value.find("words: 3") != std::string::npos);
        REQUIRE(stats->value.find("sentences: 2") != std::string::npos);
    }
}

TEST_CASE("OperationRegistry - seeded shuffle is reproducible", "[ops][registry]")
{
    RegistryOptions options;
    options.shuffle_seed = 1234;

    OperationRegistry first(options);
    OperationRegistry second(options);

    const std::string text = "abcdefghijklmnopqrstuvwxyz";
    REQUIRE(first.run("shuffle", text)->value == second.run("shuffle", text)->value);
}

TEST_CASE("OperationRegistry - category names", "[ops][registry]")
{
    REQUIRE(std::string(OperationRegistry::CategoryToString(OperationCategory::Codec)) == "codec");
    REQUIRE(std::string(OperationRegistry::CategoryToString(OperationCategory::Metrics)) == "metrics");
    REQUIRE(std::string(OperationRegistry::CategoryToString(OperationCategory::Transform)) == "transform");
}
