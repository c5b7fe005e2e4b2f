#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// QR rendering/scanning is provided by the front end. Only this boundary is
// used by the session.
class QrCodec {
public:
    virtual ~QrCodec() = default;
    // Encoded image bytes (e.g. PNG) for the given text.
    virtual std::vector<std::uint8_t> imageFromText(const std::string& text) = 0;
    // Decoded text, or nullopt when no QR code is found.
    virtual std::optional<std::string> textFromImage(const std::vector<std::uint8_t>& image) = 0;
};
