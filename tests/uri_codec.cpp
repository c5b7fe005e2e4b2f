// tests/uri_codec.cpp
#include <catch2/catch_all.hpp>
#include "OtpError.hpp"
#include "UriCodec.hpp"

#include <string>

static ErrorKind parse_error(const std::string& uri) {
    try {
        UriCodec::parse(uri);
    } catch (const OtpError& ex) {
        return ex.kind();
    }
    FAIL("parse accepted " << uri);
    return ErrorKind::InvalidUri;
}

static const std::string BASE = "otpauth://totp/Acme:alice?secret=JBSWY3DPEHPK3PXP";

TEST_CASE("URI: GitHub example parses field by field", "[uri]") {
    const auto c = UriCodec::parse(
        "otpauth://totp/GitHub:user%40example.com?secret=JBSWY3DPEBLW64TMMQ======"
        "&issuer=GitHub&algorithm=SHA1&digits=6&period=30");

    REQUIRE(c.kind() == OtpKind::Totp);
    REQUIRE(c.label == "user@example.com");
    REQUIRE(c.issuer == "GitHub");
    REQUIRE(c.secret == "JBSWY3DPEBLW64TMMQ======");
    REQUIRE(c.algorithm == HashAlgorithm::SHA1);
    REQUIRE(c.digits == 6);
    REQUIRE(c.period() == 30);
    REQUIRE_THROWS_AS(c.counter(), std::logic_error);
}

TEST_CASE("URI: defaults and fallbacks", "[uri]") {
    SECTION("Bare label, no issuer anywhere") {
        const auto c = UriCodec::parse("otpauth://totp/alice?secret=jbswy3dpehpk3pxp");
        REQUIRE(c.label == "alice");
        REQUIRE(c.issuer == "Unknown");
        REQUIRE(c.secret == "JBSWY3DPEHPK3PXP");  // upper-cased
        REQUIRE(c.algorithm == HashAlgorithm::SHA1);
        REQUIRE(c.digits == 6);
        REQUIRE(c.period() == 30);
    }
    SECTION("Path issuer used when the query has none") {
        REQUIRE(UriCodec::parse(BASE).issuer == "Acme");
    }
    SECTION("Query issuer wins over the path") {
        REQUIRE(UriCodec::parse(BASE + "&issuer=Other").issuer == "Other");
    }
    SECTION("Kind and algorithm are case-insensitive") {
        const auto c = UriCodec::parse("otpauth://HOTP/bob?secret=JBSWY3DPEHPK3PXP&algorithm=sha256&counter=7");
        REQUIRE(c.kind() == OtpKind::Hotp);
        REQUIRE(c.algorithm == HashAlgorithm::SHA256);
        REQUIRE(c.counter() == 7);
    }
    SECTION("HOTP without counter starts at zero") {
        REQUIRE(UriCodec::parse("otpauth://hotp/bob?secret=JBSWY3DPEHPK3PXP").counter() == 0);
    }
}

TEST_CASE("URI: digits, period and counter boundaries", "[uri]") {
    REQUIRE(parse_error(BASE + "&digits=3") == ErrorKind::InvalidDigits);
    REQUIRE(parse_error(BASE + "&digits=11") == ErrorKind::InvalidDigits);
    REQUIRE(parse_error(BASE + "&digits=six") == ErrorKind::InvalidDigits);
    REQUIRE(UriCodec::parse(BASE + "&digits=4").digits == 4);
    REQUIRE(UriCodec::parse(BASE + "&digits=10").digits == 10);

    REQUIRE(parse_error(BASE + "&period=0") == ErrorKind::InvalidPeriod);
    REQUIRE(UriCodec::parse(BASE + "&period=1").period() == 1);

    REQUIRE(parse_error("otpauth://hotp/bob?secret=JBSWY3DPEHPK3PXP&counter=-1") == ErrorKind::InvalidCounter);
    REQUIRE(parse_error(BASE + "&algorithm=AES") == ErrorKind::InvalidAlgorithm);
}

TEST_CASE("URI: rejection kinds follow the check order", "[uri]") {
    REQUIRE(parse_error("") == ErrorKind::InvalidUri);
    REQUIRE(parse_error("https://example.com/?secret=JBSWY3DPEHPK3PXP") == ErrorKind::InvalidUri);
    REQUIRE(parse_error("otpauth://motp/alice?secret=JBSWY3DPEHPK3PXP") == ErrorKind::InvalidUri);
    REQUIRE(parse_error("otpauth://totp/alice?issuer=Acme") == ErrorKind::MissingField);
    REQUIRE(parse_error("otpauth://totp/alice?secret=") == ErrorKind::MissingField);
    REQUIRE(parse_error("otpauth://totp/?secret=JBSWY3DPEHPK3PXP") == ErrorKind::MissingField);
    REQUIRE(parse_error("otpauth://totp/alice?secret=NOT-BASE32!") == ErrorKind::InvalidSecret);

    // missing secret is reported before a bad digits value
    REQUIRE(parse_error("otpauth://totp/alice?digits=99") == ErrorKind::MissingField);
    // a bad secret is reported before a bad algorithm
    REQUIRE(parse_error("otpauth://totp/alice?secret=189&algorithm=AES") == ErrorKind::InvalidSecret);
}

TEST_CASE("URI: build then parse gives the same credential", "[uri]") {
    SECTION("TOTP with characters that need escaping") {
        const auto c = Credential::totp("me & you@example.com", "GEZDGNBVGY3TQOJQ", "ACME Corp: EU",
                                        HashAlgorithm::SHA512, 8, 60);
        REQUIRE(UriCodec::parse(UriCodec::build(c)) == c);
    }
    SECTION("HOTP keeps its counter") {
        const auto c = Credential::hotp("ops", "JBSWY3DPEHPK3PXP", "Vendor", HashAlgorithm::MD5, 7, 42);
        const auto back = UriCodec::parse(UriCodec::build(c));
        REQUIRE(back == c);
        REQUIRE(back.counter() == 42);
    }
    SECTION("Empty issuer reads back as Unknown") {
        const auto c = Credential::totp("solo", "JBSWY3DPEHPK3PXP", "");
        REQUIRE(c.issuer == "Unknown");
        REQUIRE(UriCodec::parse(UriCodec::build(c)) == c);
    }
}

TEST_CASE("URI: validate reports instead of throwing", "[uri]") {
    REQUIRE_FALSE(UriCodec::validate(BASE).has_value());
    const auto err = UriCodec::validate(BASE + "&digits=3");
    REQUIRE(err.has_value());
    REQUIRE(err->find("digits") != std::string::npos);
}

TEST_CASE("URI: error kinds have printable names", "[uri]") {
    try {
        UriCodec::parse(BASE + "&period=0");
        FAIL("period=0 accepted");
    } catch (const OtpError& ex) {
        REQUIRE(std::string(errorKindName(ex.kind())) == "InvalidPeriod");
    }
}
