#include <catch2/catch_test_macros.hpp>
#include "codec/Sha256.hpp"

using namespace codec;

TEST_CASE("Sha256 - known digests", "[codec][sha256]")
{
    REQUIRE(sha256("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Sha256 - digest is 64 lowercase hex digits", "[codec][sha256]")
{
    const std::string digest = sha256("\xE6\x97\xA5\xE6\x9C\xAC");
    REQUIRE(digest.size() == 64);
    REQUIRE(digest.find_first_not_of("0123456789abcdef") == std::string::npos);
}
