#pragma once
#include "VaultKeySource.hpp"
#include "VaultStore.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

// Owns the master-key file: base64 text of an EncryptedEnvelope (keyed by the
// master password) wrapping a random 256-bit secret in base64url form.
class MasterKeyManager {
public:
    static constexpr std::size_t SECRET_LEN = 32;

    explicit MasterKeyManager(std::filesystem::path masterKeyFile,
                              std::size_t minPasswordLength = 8);

    bool exists() const;

    // First run: gate the password, generate the secret, persist it.
    // Throws OtpError(WeakPassword | PasswordMismatch | IoFailure).
    // Returns the new master secret.
    std::string bootstrap(const std::string& password, const std::string& confirmation) const;

    // Login and idle re-authentication. Throws OtpError(DecryptionFailure) for a
    // wrong password or damaged file, OtpError(IoFailure) when unreadable.
    std::string authenticate(const std::string& password) const;

    // Verifies oldPassword, gates newPassword, then:
    //  MasterPassword: staged re-encryption of every profile; the master-key
    //                  file is rewritten only after all profiles were.
    //  MasterSecret:   profiles are untouched; only the master-key file changes.
    // Throws OtpError(PartialReencryptionFailure) with the failed names in
    // details() when any profile could not be decrypted; nothing is changed.
    RotationResult changePassword(const std::string& oldPassword,
                                  const std::string& newPassword,
                                  const std::string& confirmation,
                                  VaultStore& vault,
                                  VaultKeySource source) const;

    // Deletes the master-key file.
    void reset() const;

    const std::filesystem::path& path() const { return m_path; }

    static std::string generateMasterSecret();

private:
    void checkNewPassword(const std::string& password, const std::string& confirmation) const;
    void store(const std::string& secret, const std::string& password) const;

    std::filesystem::path m_path;
    std::size_t m_minLength;
};
