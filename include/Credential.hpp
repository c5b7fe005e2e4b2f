#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json_fwd.hpp>

enum class OtpKind { Totp, Hotp };
enum class HashAlgorithm { SHA1, SHA256, SHA512, MD5 };

struct TotpParams {
    std::uint32_t period = 30; // seconds, >= 1
};

struct HotpParams {
    std::uint64_t counter = 0;
};

// One OTP account. The kind is carried by which parameter block is held,
// so a TOTP credential cannot carry a counter and vice versa.
struct Credential {
    std::string label;
    std::string secret;   // Base32, upper-case
    std::string issuer;
    HashAlgorithm algorithm = HashAlgorithm::SHA1;
    int digits = 6;       // [4, 10]
    std::variant<TotpParams, HotpParams> params;

    // Empty issuer becomes "Unknown", matching what the URI parser yields.
    static Credential totp(std::string label, std::string secret, std::string issuer,
                           HashAlgorithm algorithm = HashAlgorithm::SHA1,
                           int digits = 6, std::uint32_t period = 30);
    static Credential hotp(std::string label, std::string secret, std::string issuer,
                           HashAlgorithm algorithm = HashAlgorithm::SHA1,
                           int digits = 6, std::uint64_t counter = 0);

    OtpKind kind() const;
    // Throw std::logic_error when asked for the other kind's field.
    std::uint32_t period() const;
    std::uint64_t counter() const;
};

bool operator==(const Credential& a, const Credential& b);
bool operator!=(const Credential& a, const Credential& b);

const char* kindName(OtpKind kind);            // "totp" / "hotp"
const char* algorithmName(HashAlgorithm alg);  // "SHA1", ...
// Expects the canonical upper-case spelling.
std::optional<HashAlgorithm> algorithmFromName(const std::string& name);

// Field checks shared by the URI parser and the profile loader.
// Throw OtpError with the matching ErrorKind.
void validateCredential(const Credential& credential);

// Profile payload: {"type","label","secret","issuer","algorithm","digits","period"|"counter"}
void to_json(nlohmann::json& j, const Credential& c);
void from_json(const nlohmann::json& j, Credential& c);

std::string credentialToJson(const Credential& c);
// Throws OtpError (validation) or nlohmann::json::exception (malformed text).
Credential credentialFromJson(const std::string& text);
