#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// ---- Base32 (RFC 4648 alphabet A-Z2-7, used for OTP secrets)

// Alphabet check only: [A-Z2-7]+=* after upper-casing.
bool is_base32(const std::string& text);

// Lenient about missing padding, strict about characters.
// Throws std::invalid_argument on a character outside the alphabet or an
// impossible tail length.
std::vector<std::uint8_t> base32_decode(const std::string& text);
std::string base32_encode(const std::vector<std::uint8_t>& data);

// ---- Base64 (OpenSSL EVP block codec)

std::string base64_encode(const std::vector<std::uint8_t>& data);
// Ignores surrounding whitespace. Throws std::invalid_argument on bad input.
std::vector<std::uint8_t> base64_decode(const std::string& text);
// URL-safe alphabet, padded (the master secret text form).
std::string base64url_encode(const std::vector<std::uint8_t>& data);

// ---- Percent-encoding for otpauth URIs

// Everything except RFC 3986 unreserved characters is escaped.
std::string percent_encode(const std::string& text);
// plusAsSpace: query-string semantics ('+' decodes to ' ').
std::string percent_decode(const std::string& text, bool plusAsSpace = false);

// ---- Small ASCII helpers

std::string to_upper_ascii(std::string text);
std::string to_lower_ascii(std::string text);
std::string trim_ascii(const std::string& text);

// Strict integer parse: optional sign, digits, surrounding blanks allowed.
std::optional<long long> parse_integer(const std::string& text);
