#include <catch2/catch_test_macros.hpp>
#include "chainlog/crypto.hpp"
#include <format>
#include <string>

using namespace chainlog::crypto;

TEST_CASE("SHA-256 known vectors", "[crypto]")
{
    REQUIRE(SHA256::hex_digest("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(SHA256::hex_digest("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA-256 hex conversion", "[crypto]")
{
    auto hash = SHA256::hash(std::string("test data"));
    REQUIRE(hash.size() == 32);

    std::string hex = SHA256::to_hex(hash);
    REQUIRE(hex.length() == SHA256::kHexLength);
    REQUIRE(SHA256::is_hex_digest(hex));
    REQUIRE(hex == SHA256::hex_digest("test data"));
    REQUIRE(hex.substr(0, 2) == std::format("{:02x}", hash[0]));
}

TEST_CASE("Hex digest shape check", "[crypto]")
{
    REQUIRE(SHA256::is_hex_digest(std::string(64, '0')));
    REQUIRE(SHA256::is_hex_digest("0123456789abcdef", 16));
    REQUIRE_FALSE(SHA256::is_hex_digest("0123456789ABCDEF", 16));
    REQUIRE_FALSE(SHA256::is_hex_digest(std::string(63, '0')));
    REQUIRE_FALSE(SHA256::is_hex_digest(""));
}
