#include "Credential.hpp"

#include "Encoding.hpp"
#include "OtpError.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>

namespace {
    // Profiles written by older builds store numbers as strings ("6", "30").
    long long read_number(const nlohmann::json& j, const char* key, long long fallback,
                          ErrorKind kind) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return fallback;
        if (it->is_number_integer()) return it->get<long long>();
        if (it->is_string()) {
            if (auto v = parse_integer(it->get<std::string>())) return *v;
        }
        throw OtpError(kind, std::string("invalid '") + key + "' in profile");
    }

    std::string read_string(const nlohmann::json& j, const char* key, const std::string& fallback) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return fallback;
        return it->get<std::string>();
    }
}

Credential Credential::totp(std::string label, std::string secret, std::string issuer,
                            HashAlgorithm algorithm, int digits, std::uint32_t period) {
    Credential c;
    c.label     = std::move(label);
    c.secret    = to_upper_ascii(std::move(secret));
    c.issuer    = issuer.empty() ? "Unknown" : std::move(issuer);
    c.algorithm = algorithm;
    c.digits    = digits;
    c.params    = TotpParams{ period };
    return c;
}

Credential Credential::hotp(std::string label, std::string secret, std::string issuer,
                            HashAlgorithm algorithm, int digits, std::uint64_t counter) {
    Credential c;
    c.label     = std::move(label);
    c.secret    = to_upper_ascii(std::move(secret));
    c.issuer    = issuer.empty() ? "Unknown" : std::move(issuer);
    c.algorithm = algorithm;
    c.digits    = digits;
    c.params    = HotpParams{ counter };
    return c;
}

OtpKind Credential::kind() const {
    return std::holds_alternative<TotpParams>(params) ? OtpKind::Totp : OtpKind::Hotp;
}

std::uint32_t Credential::period() const {
    if (const auto* p = std::get_if<TotpParams>(&params)) return p->period;
    throw std::logic_error("period requested on a HOTP credential");
}

std::uint64_t Credential::counter() const {
    if (const auto* p = std::get_if<HotpParams>(&params)) return p->counter;
    throw std::logic_error("counter requested on a TOTP credential");
}

bool operator==(const Credential& a, const Credential& b) {
    if (a.label != b.label || a.secret != b.secret || a.issuer != b.issuer ||
        a.algorithm != b.algorithm || a.digits != b.digits || a.kind() != b.kind()) {
        return false;
    }
    return a.kind() == OtpKind::Totp ? a.period() == b.period() : a.counter() == b.counter();
}

bool operator!=(const Credential& a, const Credential& b) {
    return !(a == b);
}

const char* kindName(OtpKind kind) {
    return kind == OtpKind::Totp ? "totp" : "hotp";
}

const char* algorithmName(HashAlgorithm alg) {
    switch (alg) {
    case HashAlgorithm::SHA1:   return "SHA1";
    case HashAlgorithm::SHA256: return "SHA256";
    case HashAlgorithm::SHA512: return "SHA512";
    case HashAlgorithm::MD5:    return "MD5";
    }
    return "SHA1";
}

std::optional<HashAlgorithm> algorithmFromName(const std::string& name) {
    if (name == "SHA1")   return HashAlgorithm::SHA1;
    if (name == "SHA256") return HashAlgorithm::SHA256;
    if (name == "SHA512") return HashAlgorithm::SHA512;
    if (name == "MD5")    return HashAlgorithm::MD5;
    return std::nullopt;
}

void validateCredential(const Credential& c) {
    if (c.label.empty()) {
        throw OtpError(ErrorKind::MissingField, "Missing label (account identifier)");
    }
    if (c.secret.empty()) {
        throw OtpError(ErrorKind::MissingField, "Missing required 'secret'");
    }
    if (!is_base32(c.secret)) {
        throw OtpError(ErrorKind::InvalidSecret, "Invalid secret format (must be base32-encoded)");
    }
    if (c.digits < 4 || c.digits > 10) {
        throw OtpError(ErrorKind::InvalidDigits, "Digits must be between 4 and 10");
    }
    if (c.kind() == OtpKind::Totp && c.period() < 1) {
        throw OtpError(ErrorKind::InvalidPeriod, "Period must be positive");
    }
}

void to_json(nlohmann::json& j, const Credential& c) {
    j = nlohmann::json{
        {"type",      kindName(c.kind())},
        {"label",     c.label},
        {"secret",    c.secret},
        {"issuer",    c.issuer},
        {"algorithm", algorithmName(c.algorithm)},
        {"digits",    c.digits}
    };
    if (c.kind() == OtpKind::Totp) j["period"]  = c.period();
    else                           j["counter"] = c.counter();
}

void from_json(const nlohmann::json& j, Credential& c) {
    const std::string type = to_lower_ascii(read_string(j, "type", "totp"));
    if (type != "totp" && type != "hotp") {
        throw OtpError(ErrorKind::InvalidUri, "Unsupported OTP type: " + type);
    }

    const std::string algName = to_upper_ascii(read_string(j, "algorithm", "SHA1"));
    auto alg = algorithmFromName(algName);
    if (!alg) throw OtpError(ErrorKind::InvalidAlgorithm, "Invalid algorithm: " + algName);

    const long long digits = read_number(j, "digits", 6, ErrorKind::InvalidDigits);
    if (digits < 4 || digits > 10) {
        throw OtpError(ErrorKind::InvalidDigits, "Digits must be between 4 and 10");
    }

    const std::string label  = read_string(j, "label", "");
    const std::string secret = read_string(j, "secret", "");
    const std::string issuer = read_string(j, "issuer", "");

    if (type == "totp") {
        const long long period = read_number(j, "period", 30, ErrorKind::InvalidPeriod);
        if (period < 1 || period > 0xFFFFFFFFLL) {
            throw OtpError(ErrorKind::InvalidPeriod, "Period must be positive");
        }
        c = Credential::totp(label, secret, issuer, *alg, static_cast<int>(digits),
                             static_cast<std::uint32_t>(period));
    } else {
        const long long counter = read_number(j, "counter", 0, ErrorKind::InvalidCounter);
        if (counter < 0) throw OtpError(ErrorKind::InvalidCounter, "Counter must be non-negative");
        c = Credential::hotp(label, secret, issuer, *alg, static_cast<int>(digits),
                             static_cast<std::uint64_t>(counter));
    }
    validateCredential(c);
}

std::string credentialToJson(const Credential& c) {
    return nlohmann::json(c).dump();
}

Credential credentialFromJson(const std::string& text) {
    return nlohmann::json::parse(text).get<Credential>();
}
