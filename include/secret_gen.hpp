#pragma once
#include "Encoding.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/rand.h>

// Random OTP shared secret, Base32 without padding. 20 bytes (160 bits) is the
// RFC 4226 recommendation and what authenticator apps expect for SHA-1.
inline std::string generate_base32_secret(std::size_t numBytes = 20) {
    if (numBytes == 0) throw std::invalid_argument("Secret length must be positive");

    std::vector<std::uint8_t> buf(numBytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed in generate_base32_secret");
    }
    std::string out = base32_encode(buf);
    std::fill(buf.begin(), buf.end(), 0);

    out.erase(out.find_last_not_of('=') + 1);
    return out;
}
