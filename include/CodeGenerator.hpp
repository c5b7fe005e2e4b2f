#pragma once
#include "Credential.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct OtpCode {
    std::string   code;              // zero-padded to the credential's digits
    std::uint32_t remainingSeconds;  // TOTP only; 0 for HOTP
};

// RFC 4226 (HOTP) / RFC 6238 (TOTP) code computation.
class CodeGenerator {
public:
    // What the display layer shows when a code cannot be computed.
    static constexpr const char* UNAVAILABLE = "code unavailable";

    // HMAC + dynamic truncation over an 8-byte big-endian counter.
    // Throws OtpError(CodeGenerationError) for digits outside [1, 10].
    static std::string hotp(const std::vector<std::uint8_t>& key,
                            std::uint64_t counter,
                            int digits,
                            HashAlgorithm algorithm);

    // TOTP uses floor(unixTime / period); HOTP uses the stored counter, which is
    // never advanced here.
    // Throws OtpError(CodeGenerationError) on an undecodable secret.
    static OtpCode generate(const Credential& credential, std::int64_t unixTime);
    static OtpCode generateNow(const Credential& credential);

    // Never throws on bad credentials: returns UNAVAILABLE instead.
    static std::string displayCode(const Credential& credential, std::int64_t unixTime);

    static std::uint32_t remainingSeconds(std::int64_t unixTime, std::uint32_t period);

    // Raw TOTP helper for a bare Base32 secret. Defaults to SHA-512; the
    // credential path above defaults to SHA-1 through Credential.
    static std::string hmacOtp(const std::string& base32Secret,
                               std::int64_t unixTime,
                               int digits = 6,
                               std::uint32_t period = 30,
                               HashAlgorithm algorithm = HashAlgorithm::SHA512);

    static std::int64_t currentUnixTime();
};
