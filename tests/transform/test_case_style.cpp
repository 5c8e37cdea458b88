#include <catch2/catch_test_macros.hpp>
#include "transform/CaseStyle.hpp"

using namespace transform;

TEST_CASE("CaseStyle - separated styles", "[transform][case]")
{
    REQUIRE(toSnakeCase("helloWorld") == "hello_world");
    REQUIRE(toSnakeCase("Hello World") == "hello_world");
    REQUIRE(toSnakeCase("hello-world") == "hello_world");
    REQUIRE(toKebabCase("helloWorld") == "hello-world");
    REQUIRE(toKebabCase("hello_big world") == "hello-big-world");
}

TEST_CASE("CaseStyle - joined styles", "[transform][case]")
{
    REQUIRE(toCamelCase("hello world") == "helloWorld");
    REQUIRE(toCamelCase("Hello_WORLD") == "helloWorld");
    REQUIRE(toPascalCase("hello world") == "HelloWorld");
    REQUIRE(toPascalCase("hello-big_world") == "HelloBigWorld");
    REQUIRE(toTitleCase("hello_world") == "Hello World");
    REQUIRE(toTitleCase("the QUICK fox") == "The Quick Fox");

    SECTION("Leading separators do not produce empty words") {
        REQUIRE(toCamelCase("  hello world") == "helloWorld");
        REQUIRE(toPascalCase("_private_name") == "PrivateName");
    }
}

TEST_CASE("CaseStyle - blank input is returned unchanged", "[transform][case]")
{
    REQUIRE(toSnakeCase("") == "");
    REQUIRE(toCamelCase("   ") == "   ");
    REQUIRE(toTitleCase("\t") == "\t");
    REQUIRE(swapCase(" ") == " ");
}

TEST_CASE("CaseStyle - per-character mappings", "[transform][case]")
{
    REQUIRE(swapCase("Hello World") == "hELLO wORLD");
    REQUIRE(swapCase("\xC3\xA9\xC3\x89") == "\xC3\x89\xC3\xA9");
    REQUIRE(toSarcasm("hello") == "hElLo");
    REQUIRE(toSarcasm("HELLO") == "hElLo");
    REQUIRE(toUpper("caf\xC3\xA9") == "CAF\xC3\x89");
    REQUIRE(toLower("ABC") == "abc");
    REQUIRE(isBlank(" \n\t"));
    REQUIRE_FALSE(isBlank(" x "));
}
