#include "Encoding.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <limits>
#include <stdexcept>

namespace {
    const char kBase32Alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

    int base32_value(char ch) {
        if (ch >= 'A' && ch <= 'Z') return ch - 'A';
        if (ch >= '2' && ch <= '7') return ch - '2' + 26;
        return -1;
    }

    bool is_unreserved(unsigned char ch) {
        return std::isalnum(ch) || ch == '-' || ch == '.' || ch == '_' || ch == '~';
    }

    int hex_value(char ch) {
        if (ch >= '0' && ch <= '9') return ch - '0';
        if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
        if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
        return -1;
    }
}

bool is_base32(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size() && text[i] != '=') {
        char ch = static_cast<char>(std::toupper(static_cast<unsigned char>(text[i])));
        if (base32_value(ch) < 0) return false;
        ++i;
    }
    if (i == 0) return false; // at least one data character
    for (; i < text.size(); ++i) {
        if (text[i] != '=') return false;
    }
    return true;
}

std::vector<std::uint8_t> base32_decode(const std::string& text) {
    std::string upper = to_upper_ascii(text);
    std::size_t end = upper.find('=');
    if (end == std::string::npos) end = upper.size();
    for (std::size_t i = end; i < upper.size(); ++i) {
        if (upper[i] != '=') throw std::invalid_argument("base32: data after padding");
    }

    // A tail of 1, 3 or 6 characters cannot come from whole bytes.
    const std::size_t tail = end % 8;
    if (tail == 1 || tail == 3 || tail == 6) {
        throw std::invalid_argument("base32: incorrect length");
    }

    std::vector<std::uint8_t> out;
    out.reserve(end * 5 / 8);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::size_t i = 0; i < end; ++i) {
        int v = base32_value(upper[i]);
        if (v < 0) throw std::invalid_argument("base32: invalid character");
        buffer = (buffer << 5) | static_cast<std::uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<std::uint8_t>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }
    return out;
}

std::string base32_encode(const std::vector<std::uint8_t>& data) {
    std::string out;
    out.reserve((data.size() + 4) / 5 * 8);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (std::uint8_t b : data) {
        buffer = (buffer << 8) | b;
        bits += 8;
        while (bits >= 5) {
            out.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1F]);
    }
    while (out.size() % 8 != 0) out.push_back('=');
    return out;
}

std::string base64_encode(const std::vector<std::uint8_t>& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            data.data(), static_cast<int>(data.size()));
    if (n < 0) throw std::runtime_error("EVP_EncodeBlock failed");
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::vector<std::uint8_t> base64_decode(const std::string& text) {
    std::string clean;
    clean.reserve(text.size());
    for (char ch : text) {
        if (!std::isspace(static_cast<unsigned char>(ch))) clean.push_back(ch);
    }
    if (clean.empty()) return {};
    if (clean.size() % 4 != 0) throw std::invalid_argument("base64: length not a multiple of 4");

    std::vector<std::uint8_t> out(clean.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if (n < 0) throw std::invalid_argument("base64: invalid input");

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t padding = 0;
    if (clean[clean.size() - 1] == '=') ++padding;
    if (clean[clean.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

std::string base64url_encode(const std::vector<std::uint8_t>& data) {
    std::string out = base64_encode(data);
    for (char& ch : out) {
        if (ch == '+') ch = '-';
        else if (ch == '/') ch = '_';
    }
    return out;
}

std::string percent_encode(const std::string& text) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size() * 3);
    for (char c : text) {
        auto ch = static_cast<unsigned char>(c);
        if (is_unreserved(ch)) {
            out.push_back(c);
        } else {
            out.push_back('%');
            out.push_back(kHex[ch >> 4]);
            out.push_back(kHex[ch & 0x0F]);
        }
    }
    return out;
}

std::string percent_decode(const std::string& text, bool plusAsSpace) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        char ch = text[i];
        if (ch == '%' && i + 2 < text.size()) {
            int hi = hex_value(text[i + 1]);
            int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (ch == '+' && plusAsSpace) {
            out.push_back(' ');
            continue;
        }
        // Malformed escapes are kept verbatim.
        out.push_back(ch);
    }
    return out;
}

std::string to_upper_ascii(std::string text) {
    for (char& ch : text) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return text;
}

std::string to_lower_ascii(std::string text) {
    for (char& ch : text) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return text;
}

std::string trim_ascii(const std::string& text) {
    std::size_t b = 0;
    std::size_t e = text.size();
    while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
    return text.substr(b, e - b);
}

std::optional<long long> parse_integer(const std::string& text) {
    const std::string s = trim_ascii(text);
    if (s.empty()) return std::nullopt;

    std::size_t i = 0;
    bool negative = false;
    if (s[0] == '+' || s[0] == '-') {
        negative = (s[0] == '-');
        i = 1;
    }
    if (i == s.size()) return std::nullopt;

    unsigned long long value = 0;
    const unsigned long long limit =
        static_cast<unsigned long long>(std::numeric_limits<long long>::max());
    for (; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
        value = value * 10 + static_cast<unsigned long long>(s[i] - '0');
        if (value > limit) return std::nullopt;
    }
    long long result = static_cast<long long>(value);
    return negative ? -result : result;
}
