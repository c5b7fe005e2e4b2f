#pragma once
#include <cstdint>
#include <vector>
#include <string>

// Self-contained container: salt(16) || nonce(12) || ciphertext || tag(16).
struct EncryptedEnvelope {
    std::vector<std::uint8_t> salt;       // PBKDF2 salt
    std::vector<std::uint8_t> nonce;      // GCM IV
    std::vector<std::uint8_t> encAndTag;  // ciphertext || tag

    std::vector<std::uint8_t> toBytes() const;
    // Throws OtpError(DecryptionFailure) when the buffer cannot hold an envelope.
    static EncryptedEnvelope fromBytes(const std::vector<std::uint8_t>& raw);
};

// Handles key derivation (PBKDF2) and AES-256-GCM encrypt/decrypt.
// Keep derived keys only in RAM.
class EncryptionManager {
public:
    static constexpr std::size_t   KEY_LEN  = 32;
    static constexpr std::size_t   SALT_LEN = 16;
    static constexpr std::size_t   IV_LEN   = 12;
    static constexpr std::size_t   TAG_LEN  = 16;
    static constexpr std::uint32_t PBKDF2_ITERATIONS = 100000;

    // PBKDF2-HMAC-SHA256 -> 32-byte key. Used for every vault envelope.
    static std::vector<std::uint8_t> deriveKey(
        const std::string& password,
        const std::vector<std::uint8_t>& salt,
        std::uint32_t iterations = PBKDF2_ITERATIONS
    );

    // PBKDF2-HMAC-SHA512 -> 32-byte key. Kept apart from deriveKey(); the two
    // produce different keys for the same input.
    static std::vector<std::uint8_t> deriveKeySha512(
        const std::string& password,
        const std::vector<std::uint8_t>& salt,
        std::uint32_t iterations = PBKDF2_ITERATIONS
    );

    // Construct with 32-byte key.
    explicit EncryptionManager(const std::vector<std::uint8_t>& key);
    ~EncryptionManager();

    EncryptionManager(const EncryptionManager&) = delete;
    EncryptionManager& operator=(const EncryptionManager&) = delete;

    struct EncResult {
        std::vector<std::uint8_t> iv;         // 12-byte random IV
        std::vector<std::uint8_t> encAndTag;  // ciphertext || 16-byte tag
    };

    // Optional AAD lets you bind extra metadata; can be empty.
    EncResult encrypt(const std::vector<std::uint8_t>& plaintext,
                      const std::vector<std::uint8_t>& aad = {}) const;

    // Throws OtpError(DecryptionFailure) on tag verification failure or bad sizes,
    // std::runtime_error on an OpenSSL API error.
    std::vector<std::uint8_t> decrypt(const std::vector<std::uint8_t>& iv,
                                      const std::vector<std::uint8_t>& encAndTag,
                                      const std::vector<std::uint8_t>& aad = {}) const;

    // ---- Password envelopes

    // Fresh salt and nonce on every call.
    static EncryptedEnvelope seal(const std::vector<std::uint8_t>& plaintext,
                                  const std::string& password);

    // Wrong password and corrupt data both surface as the same
    // OtpError(DecryptionFailure, "decryption failed").
    static std::vector<std::uint8_t> open(const EncryptedEnvelope& envelope,
                                          const std::string& password);

    // Base64 text form used by the vault and master-key files.
    static std::string sealText(const std::vector<std::uint8_t>& plaintext,
                                const std::string& password);
    static std::vector<std::uint8_t> openText(const std::string& text,
                                              const std::string& password);

    static std::vector<std::uint8_t> randomBytes(std::size_t count);

private:
    std::vector<std::uint8_t> m_key;
};
