#include "CodeGenerator.hpp"

#include "Encoding.hpp"
#include "OtpError.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>
#include <stdexcept>

namespace {
    const EVP_MD* digest_for(HashAlgorithm alg) {
        switch (alg) {
        case HashAlgorithm::SHA1:   return EVP_sha1();
        case HashAlgorithm::SHA256: return EVP_sha256();
        case HashAlgorithm::SHA512: return EVP_sha512();
        case HashAlgorithm::MD5:    return EVP_md5();
        }
        return nullptr;
    }

    std::vector<std::uint8_t> decode_secret(const std::string& secret) {
        try {
            auto key = base32_decode(secret);
            if (key.empty()) throw std::invalid_argument("empty key");
            return key;
        } catch (const std::invalid_argument& ex) {
            throw OtpError(ErrorKind::CodeGenerationError,
                           std::string("undecodable secret: ") + ex.what());
        }
    }

    std::uint64_t time_counter(std::int64_t unixTime, std::uint32_t period) {
        if (period == 0) throw OtpError(ErrorKind::CodeGenerationError, "period must be positive");
        if (unixTime < 0) throw OtpError(ErrorKind::CodeGenerationError, "time before epoch");
        return static_cast<std::uint64_t>(unixTime) / period;
    }
}

std::string CodeGenerator::hotp(const std::vector<std::uint8_t>& key,
                                std::uint64_t counter,
                                int digits,
                                HashAlgorithm algorithm) {
    if (digits < 1 || digits > 10) {
        throw OtpError(ErrorKind::CodeGenerationError, "digits must be 1-10");
    }
    const EVP_MD* md = digest_for(algorithm);
    if (!md) throw OtpError(ErrorKind::CodeGenerationError, "unsupported algorithm");

    std::uint8_t msg[8];
    for (int i = 7; i >= 0; --i) {
        msg[i] = static_cast<std::uint8_t>(counter & 0xFF);
        counter >>= 8;
    }

    std::uint8_t mac[EVP_MAX_MD_SIZE];
    unsigned int macLen = 0;
    if (!HMAC(md, key.data(), static_cast<int>(key.size()), msg, sizeof(msg), mac, &macLen)) {
        throw OtpError(ErrorKind::CodeGenerationError, "HMAC failed");
    }

    const unsigned int offset = mac[macLen - 1] & 0x0F;
    // MD5 digests are 16 bytes; offsets 13-15 run past the end
    if (offset + 4 > macLen) {
        throw OtpError(ErrorKind::CodeGenerationError, "truncation offset past end of HMAC");
    }
    const std::uint32_t binary = (static_cast<std::uint32_t>(mac[offset] & 0x7F) << 24)
                               | (static_cast<std::uint32_t>(mac[offset + 1]) << 16)
                               | (static_cast<std::uint32_t>(mac[offset + 2]) << 8)
                               |  static_cast<std::uint32_t>(mac[offset + 3]);

    std::uint64_t mod = 1;
    for (int i = 0; i < digits; ++i) mod *= 10;

    std::string code = std::to_string(static_cast<std::uint64_t>(binary) % mod);
    if (code.size() < static_cast<std::size_t>(digits)) {
        code.insert(0, static_cast<std::size_t>(digits) - code.size(), '0');
    }
    return code;
}

std::uint32_t CodeGenerator::remainingSeconds(std::int64_t unixTime, std::uint32_t period) {
    if (period == 0 || unixTime < 0) return 0;
    return period - static_cast<std::uint32_t>(static_cast<std::uint64_t>(unixTime) % period);
}

OtpCode CodeGenerator::generate(const Credential& credential, std::int64_t unixTime) {
    const auto key = decode_secret(credential.secret);
    if (credential.kind() == OtpKind::Totp) {
        const std::uint32_t period = credential.period();
        return OtpCode{
            hotp(key, time_counter(unixTime, period), credential.digits, credential.algorithm),
            remainingSeconds(unixTime, period)
        };
    }
    return OtpCode{ hotp(key, credential.counter(), credential.digits, credential.algorithm), 0 };
}

OtpCode CodeGenerator::generateNow(const Credential& credential) {
    return generate(credential, currentUnixTime());
}

std::string CodeGenerator::displayCode(const Credential& credential, std::int64_t unixTime) {
    try {
        return generate(credential, unixTime).code;
    } catch (const OtpError&) {
        return UNAVAILABLE;
    }
}

std::string CodeGenerator::hmacOtp(const std::string& base32Secret,
                                   std::int64_t unixTime,
                                   int digits,
                                   std::uint32_t period,
                                   HashAlgorithm algorithm) {
    return hotp(decode_secret(base32Secret), time_counter(unixTime, period), digits, algorithm);
}

std::int64_t CodeGenerator::currentUnixTime() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}
