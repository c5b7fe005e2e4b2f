// tests/encoding.cpp
#include <catch2/catch_all.hpp>
#include "Encoding.hpp"
#include "secret_gen.hpp"

#include <stdexcept>
#include <string>
#include <vector>

static std::vector<std::uint8_t> bytes(const std::string& s) {
    return { s.begin(), s.end() };
}

TEST_CASE("Base32: RFC 4648 vectors", "[encoding][base32]") {
    REQUIRE(base32_encode(bytes("f")) == "MY======");
    REQUIRE(base32_encode(bytes("fo")) == "MZXQ====");
    REQUIRE(base32_encode(bytes("foobar")) == "MZXW6YTBOI======");

    REQUIRE(base32_decode("MZXW6YTBOI======") == bytes("foobar"));
    REQUIRE(base32_decode("MZXW6YTBOI") == bytes("foobar"));   // padding optional
    REQUIRE(base32_decode("mzxw6ytboi") == bytes("foobar"));   // case-insensitive
    REQUIRE(base32_decode("JBSWY3DPEHPK3PXP") == bytes("Hello!\xDE\xAD\xBE\xEF"));
}

TEST_CASE("Base32: rejects bad input", "[encoding][base32]") {
    REQUIRE_THROWS_AS(base32_decode("MZXW1"), std::invalid_argument);  // '1' not in alphabet
    REQUIRE_THROWS_AS(base32_decode("A"), std::invalid_argument);      // impossible tail
    REQUIRE(is_base32("jbswy3dpehpk3pxp"));
    REQUIRE(is_base32("JBSWY3DPEBLW64TMMQ======"));
    REQUIRE_FALSE(is_base32("JBSW Y3DP"));
    REQUIRE_FALSE(is_base32("MZ=XW"));
}

TEST_CASE("Base64: standard and URL-safe forms", "[encoding][base64]") {
    REQUIRE(base64_encode(bytes("foob")) == "Zm9vYg==");
    REQUIRE(base64_decode("Zm9vYg==") == bytes("foob"));
    REQUIRE(base64_decode("  Zm9v\nYmFy\n") == bytes("foobar"));
    REQUIRE(base64_decode("").empty());
    REQUIRE_THROWS_AS(base64_decode("Zm9"), std::invalid_argument);

    const std::vector<std::uint8_t> raw = { 0xfb, 0xff, 0xbf };
    REQUIRE(base64_encode(raw) == "+/+/");
    REQUIRE(base64url_encode(raw) == "-_-_");
}

TEST_CASE("Percent-encoding", "[encoding][uri]") {
    REQUIRE(percent_encode("user@example.com") == "user%40example.com");
    REQUIRE(percent_encode("a b:c") == "a%20b%3Ac");
    REQUIRE(percent_encode("safe-._~AZ09") == "safe-._~AZ09");
    REQUIRE(percent_decode("user%40example.com") == "user@example.com");
    REQUIRE(percent_decode("a+b") == "a+b");
    REQUIRE(percent_decode("a+b", true) == "a b");
    REQUIRE(percent_decode("100%") == "100%");
}

TEST_CASE("Integer parsing is strict", "[encoding]") {
    REQUIRE(parse_integer("30") == 30);
    REQUIRE(parse_integer(" -1 ") == -1);
    REQUIRE_FALSE(parse_integer("").has_value());
    REQUIRE_FALSE(parse_integer("6x").has_value());
    REQUIRE_FALSE(parse_integer("1.5").has_value());
}

TEST_CASE("Secret generator: random Base32 secrets", "[encoding][secret]") {
    const std::string a = generate_base32_secret();
    const std::string b = generate_base32_secret();
    REQUIRE(a.size() == 32);                  // 20 bytes, no padding
    REQUIRE(a.find('=') == std::string::npos);
    REQUIRE(is_base32(a));
    REQUIRE(base32_decode(a).size() == 20);
    REQUIRE(a != b);

    REQUIRE(base32_decode(generate_base32_secret(16)).size() == 16);
    REQUIRE_THROWS_AS(generate_base32_secret(0), std::invalid_argument);
}
