// tests/crypto_envelope.cpp
#include <catch2/catch_all.hpp>
#include "Encoding.hpp"
#include "EncryptionManager.hpp"
#include "OtpError.hpp"

#include <cstring>

static std::vector<std::uint8_t> toBytes(const char* s) {
    return std::vector<std::uint8_t>(reinterpret_cast<const std::uint8_t*>(s),
                                     reinterpret_cast<const std::uint8_t*>(s) + std::strlen(s));
}

static ErrorKind open_error(const EncryptedEnvelope& env, const std::string& password) {
    try {
        EncryptionManager::open(env, password);
    } catch (const OtpError& ex) {
        return ex.kind();
    }
    FAIL("open() accepted the envelope");
    return ErrorKind::IoFailure;
}

TEST_CASE("PBKDF2: SHA-256 derivation matches RFC 7914 and differs from SHA-512", "[crypto][kdf]") {
    const auto key = EncryptionManager::deriveKey("passwd", toBytes("salt"), 1);
    const std::vector<std::uint8_t> expected = {
        0x55, 0xac, 0x04, 0x6e, 0x56, 0xe3, 0x08, 0x9f, 0xec, 0x16, 0x91, 0xc2, 0x25, 0x44, 0xb6, 0x05,
        0xf9, 0x41, 0x85, 0x21, 0x6d, 0xde, 0x04, 0x65, 0xe6, 0x8b, 0x9d, 0x57, 0xc2, 0x0d, 0xac, 0xbc
    };
    REQUIRE(key == expected);

    std::vector<std::uint8_t> salt(16, 0x11);
    const auto k256 = EncryptionManager::deriveKey("correct horse battery staple", salt);
    const auto k512 = EncryptionManager::deriveKeySha512("correct horse battery staple", salt);
    REQUIRE(k256.size() == 32);
    REQUIRE(k512.size() == 32);
    REQUIRE(k256 != k512);
    REQUIRE(k256 == EncryptionManager::deriveKey("correct horse battery staple", salt));
}

TEST_CASE("AES-GCM with a derived key: round-trip succeeds; tamper fails", "[crypto]") {
    std::vector<std::uint8_t> kdfSalt(16, 0x11);
    EncryptionManager enc(EncryptionManager::deriveKey("correct horse battery staple", kdfSalt));

    auto pt  = toBytes("otpauth-secret-123!");
    auto aad = toBytes("profile-name");

    auto encRes = enc.encrypt(pt, aad);
    REQUIRE(encRes.iv.size() == 12);
    REQUIRE(encRes.encAndTag.size() == pt.size() + 16);
    REQUIRE(enc.decrypt(encRes.iv, encRes.encAndTag, aad) == pt);

    auto bad = encRes.encAndTag;
    bad[0] ^= 0x01;
    REQUIRE_THROWS_AS(enc.decrypt(encRes.iv, bad, aad), OtpError);
    REQUIRE_THROWS_AS(enc.decrypt(encRes.iv, encRes.encAndTag, toBytes("other-profile")), OtpError);
}

TEST_CASE("Envelope: seal/open with the master password", "[crypto][envelope]") {
    const auto pt = toBytes("{\"type\":\"totp\",\"label\":\"alice\"}");

    SECTION("Round trip and layout") {
        const auto env = EncryptionManager::seal(pt, "pw-one");
        REQUIRE(env.salt.size() == 16);
        REQUIRE(env.nonce.size() == 12);
        REQUIRE(env.toBytes().size() == 16 + 12 + pt.size() + 16);
        REQUIRE(EncryptionManager::open(env, "pw-one") == pt);
        REQUIRE(EncryptionManager::open(EncryptedEnvelope::fromBytes(env.toBytes()), "pw-one") == pt);
    }
    SECTION("Wrong password is a DecryptionFailure") {
        const auto env = EncryptionManager::seal(pt, "pw-one");
        REQUIRE(open_error(env, "pw-two") == ErrorKind::DecryptionFailure);
    }
    SECTION("Two seals of the same input differ") {
        const auto a = EncryptionManager::seal(pt, "pw-one");
        const auto b = EncryptionManager::seal(pt, "pw-one");
        REQUIRE(a.salt != b.salt);
        REQUIRE(a.nonce != b.nonce);
        REQUIRE(a.toBytes() != b.toBytes());
    }
    SECTION("Tampered ciphertext and wrong password give the same message") {
        auto env = EncryptionManager::seal(pt, "pw-one");
        std::string wrongPassword;
        try { EncryptionManager::open(env, "pw-two"); }
        catch (const OtpError& ex) { wrongPassword = ex.what(); }

        env.encAndTag.back() ^= 0x80;
        REQUIRE(open_error(env, "pw-one") == ErrorKind::DecryptionFailure);
        try { EncryptionManager::open(env, "pw-one"); }
        catch (const OtpError& ex) { REQUIRE(wrongPassword == ex.what()); }
    }
    SECTION("Short buffers are malformed") {
        const std::vector<std::uint8_t> tooShort(16 + 12 + 15, 0x00);
        REQUIRE_THROWS_AS(EncryptedEnvelope::fromBytes(tooShort), OtpError);
        REQUIRE_THROWS_AS(EncryptionManager::openText("", "pw-one"), OtpError);
        REQUIRE_THROWS_AS(EncryptionManager::openText("not base64 at all!", "pw-one"), OtpError);
    }
    SECTION("Binary payloads survive the text form") {
        std::vector<std::uint8_t> blob(300);
        for (std::size_t i = 0; i < blob.size(); ++i) blob[i] = static_cast<std::uint8_t>(i);
        const std::string text = EncryptionManager::sealText(blob, "pw-one");
        REQUIRE(EncryptionManager::openText(text + "\n", "pw-one") == blob);
    }
}
