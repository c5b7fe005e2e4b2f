#pragma once
#include "Credential.hpp"

#include <optional>
#include <string>

// otpauth:// URI <-> Credential.
//   otpauth://{totp|hotp}/[{issuer}:]{label}?secret=..&issuer=..&algorithm=..
//            &digits=..&period=..|counter=..
class UriCodec {
public:
    static constexpr const char* SCHEME = "otpauth://";

    // Throws OtpError (InvalidUri, MissingField, InvalidSecret, InvalidAlgorithm,
    // InvalidDigits, InvalidPeriod, InvalidCounter).
    static Credential parse(const std::string& uri);

    // parse(build(c)) == c; the text itself is not required to match the input URI.
    static std::string build(const Credential& credential);

    // Returns the parse error message, or nullopt when the URI is acceptable.
    static std::optional<std::string> validate(const std::string& uri);

    static bool looksLikeOtpUri(const std::string& text);
};
