#pragma once
#include "QrCodec.hpp"
#include "UriCodec.hpp"

// Console stand-in for a QR renderer: the "image" is the URI text itself, so
// exports from the terminal are encrypted URI blobs. Plain files are accepted
// when they contain an otpauth URI.
class TextPayloadCodec : public QrCodec {
public:
    std::vector<std::uint8_t> imageFromText(const std::string& text) override {
        return { text.begin(), text.end() };
    }

    std::optional<std::string> textFromImage(const std::vector<std::uint8_t>& image) override {
        std::string text(image.begin(), image.end());
        const auto first = text.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return std::nullopt;
        text.erase(0, first);
        text.erase(text.find_last_not_of(" \t\r\n") + 1);
        if (!UriCodec::looksLikeOtpUri(text)) return std::nullopt;
        return text;
    }
};
