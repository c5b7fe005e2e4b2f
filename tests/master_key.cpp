// tests/master_key.cpp
#include <catch2/catch_all.hpp>
#include "EncryptionManager.hpp"
#include "MasterKeyManager.hpp"
#include "OtpError.hpp"
#include "temp_dir.hpp"

#include <functional>
#include <string>

static const std::string PW  = "Tr0ub4dor&3-Horse!";
static const std::string PW2 = "N3w!Master#Pass-99";

static ErrorKind error_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const OtpError& ex) {
        return ex.kind();
    }
    FAIL("expected an OtpError");
    return ErrorKind::IoFailure;
}

TEST_CASE("Master key: first run gate", "[master]") {
    TempDir tmp;
    MasterKeyManager master(tmp.path() / ".master");
    REQUIRE_FALSE(master.exists());

    SECTION("Weak password is refused with feedback") {
        try {
            master.bootstrap("password", "password");
            FAIL("weak password accepted");
        } catch (const OtpError& ex) {
            REQUIRE(ex.kind() == ErrorKind::WeakPassword);
            REQUIRE_FALSE(ex.details().empty());
        }
        REQUIRE_FALSE(master.exists());
    }
    SECTION("Confirmation must match") {
        REQUIRE(error_of([&] { master.bootstrap(PW, PW + "x"); }) == ErrorKind::PasswordMismatch);
        REQUIRE_FALSE(master.exists());
    }
    SECTION("Accepted password stores a 256-bit secret") {
        const std::string secret = master.bootstrap(PW, PW);
        REQUIRE(master.exists());
        REQUIRE(secret.size() == 44);  // base64url of 32 bytes
        REQUIRE(secret.find_first_of("+/") == std::string::npos);

        const std::string onDisk = read_text_file(master.path());
        REQUIRE(onDisk.find(secret) == std::string::npos);
        REQUIRE(master.authenticate(PW) == secret);
    }
}

TEST_CASE("Master key: authentication failures", "[master]") {
    TempDir tmp;
    MasterKeyManager master(tmp.path() / ".master");

    REQUIRE(error_of([&] { master.authenticate(PW); }) == ErrorKind::IoFailure);

    master.bootstrap(PW, PW);
    REQUIRE(error_of([&] { master.authenticate(PW2); }) == ErrorKind::DecryptionFailure);

    write_file_atomically(master.path(), "corrupted");
    REQUIRE(error_of([&] { master.authenticate(PW); }) == ErrorKind::DecryptionFailure);
}

TEST_CASE("Master key: change password with password-keyed profiles", "[master][rotation]") {
    TempDir tmp;
    MasterKeyManager master(tmp.path() / ".master");
    auto vault = VaultStore::open(tmp.path());
    const std::string secret = master.bootstrap(PW, PW);

    vault->setKey(PW);
    for (const char* name : { "alice", "bob", "carol" }) {
        vault->save(name, Credential::totp(name, "JBSWY3DPEHPK3PXP", "Acme"));
    }

    SECTION("All profiles decrypt: files and master key move together") {
        const auto result = master.changePassword(PW, PW2, PW2, *vault, VaultKeySource::MasterPassword);
        REQUIRE(result.committed);
        REQUIRE(result.succeeded.size() == 3);
        REQUIRE(master.authenticate(PW2) == secret);
        REQUIRE(error_of([&] { master.authenticate(PW); }) == ErrorKind::DecryptionFailure);
        REQUIRE(vault->load("alice").has_value());
    }
    SECTION("Two foreign profiles: nothing changes") {
        for (const char* name : { "dave", "erin" }) {
            const std::string json = credentialToJson(Credential::totp(name, "JBSWY3DPEHPK3PXP", "X"));
            write_file_atomically(tmp.path() / (std::string(name) + ".enc"),
                                  EncryptionManager::sealText(std::vector<std::uint8_t>(json.begin(), json.end()),
                                                              "foreign"));
        }
        const std::string masterBefore = read_text_file(master.path());
        const std::string aliceBefore  = read_text_file(tmp.path() / "alice.enc");

        try {
            master.changePassword(PW, PW2, PW2, *vault, VaultKeySource::MasterPassword);
            FAIL("rotation reported success");
        } catch (const OtpError& ex) {
            REQUIRE(ex.kind() == ErrorKind::PartialReencryptionFailure);
            REQUIRE(ex.details() == std::vector<std::string>{ "dave", "erin" });
        }
        REQUIRE(read_text_file(master.path()) == masterBefore);
        REQUIRE(read_text_file(tmp.path() / "alice.enc") == aliceBefore);
        REQUIRE(master.authenticate(PW) == secret);
    }
    SECTION("Wrong current password never touches profiles") {
        const std::string aliceBefore = read_text_file(tmp.path() / "alice.enc");
        REQUIRE(error_of([&] { master.changePassword(PW2, PW2, PW2, *vault, VaultKeySource::MasterPassword); })
                == ErrorKind::DecryptionFailure);
        REQUIRE(read_text_file(tmp.path() / "alice.enc") == aliceBefore);
    }
    SECTION("New password goes through the same gate") {
        REQUIRE(error_of([&] { master.changePassword(PW, "short", "short", *vault, VaultKeySource::MasterPassword); })
                == ErrorKind::WeakPassword);
        REQUIRE(error_of([&] { master.changePassword(PW, PW2, PW, *vault, VaultKeySource::MasterPassword); })
                == ErrorKind::PasswordMismatch);
    }
}

TEST_CASE("Master key: secret-keyed profiles are not rewritten", "[master][rotation]") {
    TempDir tmp;
    MasterKeyManager master(tmp.path() / ".master");
    auto vault = VaultStore::open(tmp.path());
    const std::string secret = master.bootstrap(PW, PW);

    vault->setKey(secret);
    vault->save("alice", Credential::totp("alice", "JBSWY3DPEHPK3PXP", "Acme"));
    const std::string aliceBefore = read_text_file(tmp.path() / "alice.enc");

    const auto result = master.changePassword(PW, PW2, PW2, *vault, VaultKeySource::MasterSecret);
    REQUIRE(result.committed);
    REQUIRE(read_text_file(tmp.path() / "alice.enc") == aliceBefore);
    REQUIRE(master.authenticate(PW2) == secret);
    REQUIRE(vault->load("alice").has_value());
}

TEST_CASE("Master key: reset deletes the file", "[master]") {
    TempDir tmp;
    MasterKeyManager master(tmp.path() / ".master");
    master.bootstrap(PW, PW);
    master.reset();
    REQUIRE_FALSE(master.exists());
}
