// Catch2WithMain provides main(); this file only holds the framework smoke test.

#include <catch2/catch_test_macros.hpp>

#include <string_view>

TEST_CASE("Framework smoke test", "[smoke]") {
    REQUIRE(std::string_view(STRINGITY_VERSION_STRING).size() > 0);
}
