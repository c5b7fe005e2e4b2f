#include "EncryptionManager.hpp"

#include "Encoding.hpp"
#include "OtpError.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>

namespace {
    const char* kDecryptionFailed = "decryption failed";

    std::vector<std::uint8_t> pbkdf2(const std::string& password,
                                     const std::vector<std::uint8_t>& salt,
                                     std::uint32_t iterations,
                                     const EVP_MD* md,
                                     const char* what) {
        if (salt.empty()) {
            throw std::invalid_argument(std::string(what) + ": salt must not be empty");
        }
        std::vector<std::uint8_t> key(EncryptionManager::KEY_LEN);
        if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                              salt.data(), static_cast<int>(salt.size()),
                              static_cast<int>(iterations), md,
                              static_cast<int>(key.size()), key.data()) != 1) {
            throw std::runtime_error(std::string(what) + ": PKCS5_PBKDF2_HMAC failed");
        }
        return key;
    }
}

// ---- Envelope layout

std::vector<std::uint8_t> EncryptedEnvelope::toBytes() const {
    std::vector<std::uint8_t> out;
    out.reserve(salt.size() + nonce.size() + encAndTag.size());
    out.insert(out.end(), salt.begin(), salt.end());
    out.insert(out.end(), nonce.begin(), nonce.end());
    out.insert(out.end(), encAndTag.begin(), encAndTag.end());
    return out;
}

EncryptedEnvelope EncryptedEnvelope::fromBytes(const std::vector<std::uint8_t>& raw) {
    constexpr std::size_t header = EncryptionManager::SALT_LEN + EncryptionManager::IV_LEN;
    if (raw.size() < header + EncryptionManager::TAG_LEN) {
        throw OtpError(ErrorKind::DecryptionFailure, kDecryptionFailed);
    }
    EncryptedEnvelope env;
    env.salt.assign(raw.begin(), raw.begin() + EncryptionManager::SALT_LEN);
    env.nonce.assign(raw.begin() + EncryptionManager::SALT_LEN, raw.begin() + header);
    env.encAndTag.assign(raw.begin() + header, raw.end());
    return env;
}

// ---- Key derivation

std::vector<std::uint8_t> EncryptionManager::deriveKey(const std::string& password,
                                                       const std::vector<std::uint8_t>& salt,
                                                       std::uint32_t iterations) {
    return pbkdf2(password, salt, iterations, EVP_sha256(), "deriveKey");
}

std::vector<std::uint8_t> EncryptionManager::deriveKeySha512(const std::string& password,
                                                             const std::vector<std::uint8_t>& salt,
                                                             std::uint32_t iterations) {
    return pbkdf2(password, salt, iterations, EVP_sha512(), "deriveKeySha512");
}

std::vector<std::uint8_t> EncryptionManager::randomBytes(std::size_t count) {
    std::vector<std::uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

// ---- AES-256-GCM with a fixed key

EncryptionManager::EncryptionManager(const std::vector<std::uint8_t>& key)
    : m_key(key)
{
    if (m_key.size() != KEY_LEN) {
        throw std::invalid_argument("EncryptionManager: key must be 32 bytes");
    }
}

EncryptionManager::~EncryptionManager() {
    OPENSSL_cleanse(m_key.data(), m_key.size());
}

EncryptionManager::EncResult EncryptionManager::encrypt(
    const std::vector<std::uint8_t>& plaintext,
    const std::vector<std::uint8_t>& aad
) const {
    EncResult out;
    out.iv = randomBytes(IV_LEN);

    // allocate: ciphertext same size as plaintext + 16B tag (final resize after Final)
    out.encAndTag.resize(plaintext.size() + TAG_LEN);

    EVP_CIPHER_CTX* raw = EVP_CIPHER_CTX_new();
    if (!raw) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(raw, &EVP_CIPHER_CTX_free);

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("EncryptInit cipher failed");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN, nullptr) != 1)
        throw std::runtime_error("SET_IVLEN failed");
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), out.iv.data()) != 1)
        throw std::runtime_error("EncryptInit key/iv failed");

    int len = 0;
    if (!aad.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1)
            throw std::runtime_error("EncryptUpdate AAD failed");
    }

    int outLen1 = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(),
                          out.encAndTag.data(), &outLen1,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        throw std::runtime_error("EncryptUpdate data failed");
    }

    int outLen2 = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.encAndTag.data() + outLen1, &outLen2) != 1) {
        throw std::runtime_error("EncryptFinal failed");
    }

    std::uint8_t tag[TAG_LEN];
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_LEN, tag) != 1)
        throw std::runtime_error("GET_TAG failed");

    out.encAndTag.resize(static_cast<std::size_t>(outLen1 + outLen2) + TAG_LEN);
    std::memcpy(out.encAndTag.data() + (out.encAndTag.size() - TAG_LEN), tag, TAG_LEN);

    return out;
}

std::vector<std::uint8_t> EncryptionManager::decrypt(
    const std::vector<std::uint8_t>& iv,
    const std::vector<std::uint8_t>& encAndTag,
    const std::vector<std::uint8_t>& aad
) const {
    if (iv.size() != IV_LEN || encAndTag.size() < TAG_LEN) {
        throw OtpError(ErrorKind::DecryptionFailure, kDecryptionFailed);
    }

    const std::size_t cLen = encAndTag.size() - TAG_LEN;
    const std::uint8_t* ciphertext = encAndTag.data();
    const std::uint8_t* tag        = encAndTag.data() + cLen;

    // +1 keeps data() non-null for an empty payload
    std::vector<std::uint8_t> plaintext(cLen + 1);

    EVP_CIPHER_CTX* raw = EVP_CIPHER_CTX_new();
    if (!raw) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)> ctx(raw, &EVP_CIPHER_CTX_free);

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1)
        throw std::runtime_error("DecryptInit cipher failed");
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, IV_LEN, nullptr) != 1)
        throw std::runtime_error("SET_IVLEN failed");
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, m_key.data(), iv.data()) != 1)
        throw std::runtime_error("DecryptInit key/iv failed");

    int len = 0;
    if (!aad.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(), static_cast<int>(aad.size())) != 1)
            throw std::runtime_error("DecryptUpdate AAD failed");
    }

    int pLen1 = 0;
    if (cLen > 0 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &pLen1, ciphertext, static_cast<int>(cLen)) != 1)
        throw OtpError(ErrorKind::DecryptionFailure, kDecryptionFailed);

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_LEN, const_cast<std::uint8_t*>(tag)) != 1)
        throw std::runtime_error("SET_TAG failed");

    int pLen2 = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + pLen1, &pLen2) != 1) {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        throw OtpError(ErrorKind::DecryptionFailure, kDecryptionFailed);
    }

    plaintext.resize(static_cast<std::size_t>(pLen1 + pLen2));
    return plaintext;
}

// ---- Password envelopes

EncryptedEnvelope EncryptionManager::seal(const std::vector<std::uint8_t>& plaintext,
                                          const std::string& password) {
    EncryptedEnvelope env;
    env.salt = randomBytes(SALT_LEN);

    EncryptionManager enc(deriveKey(password, env.salt));
    EncResult res = enc.encrypt(plaintext);
    env.nonce     = std::move(res.iv);
    env.encAndTag = std::move(res.encAndTag);
    return env;
}

std::vector<std::uint8_t> EncryptionManager::open(const EncryptedEnvelope& envelope,
                                                  const std::string& password) {
    if (envelope.salt.size() != SALT_LEN) {
        throw OtpError(ErrorKind::DecryptionFailure, kDecryptionFailed);
    }
    EncryptionManager enc(deriveKey(password, envelope.salt));
    return enc.decrypt(envelope.nonce, envelope.encAndTag);
}

std::string EncryptionManager::sealText(const std::vector<std::uint8_t>& plaintext,
                                        const std::string& password) {
    return base64_encode(seal(plaintext, password).toBytes());
}

std::vector<std::uint8_t> EncryptionManager::openText(const std::string& text,
                                                      const std::string& password) {
    std::vector<std::uint8_t> raw;
    try {
        raw = base64_decode(text);
    } catch (const std::invalid_argument&) {
        throw OtpError(ErrorKind::DecryptionFailure, kDecryptionFailed);
    }
    return open(EncryptedEnvelope::fromBytes(raw), password);
}
