#include "UriCodec.hpp"

#include "Encoding.hpp"
#include "OtpError.hpp"

#include <map>
#include <sstream>

namespace {
    struct SplitUri {
        std::string authority;
        std::string path;
        std::string query;
    };

    SplitUri split_uri(const std::string& uri) {
        std::string rest = uri.substr(std::char_traits<char>::length(UriCodec::SCHEME));
        std::size_t hash = rest.find('#');
        if (hash != std::string::npos) rest.resize(hash);

        SplitUri out;
        std::size_t q = rest.find('?');
        if (q != std::string::npos) {
            out.query = rest.substr(q + 1);
            rest.resize(q);
        }
        std::size_t slash = rest.find('/');
        if (slash != std::string::npos) {
            out.authority = rest.substr(0, slash);
            out.path      = rest.substr(slash);
        } else {
            out.authority = rest;
        }
        return out;
    }

    // First occurrence wins; blank values count as absent.
    std::map<std::string, std::string> parse_query(const std::string& query) {
        std::map<std::string, std::string> params;
        std::size_t pos = 0;
        while (pos <= query.size()) {
            std::size_t amp = query.find('&', pos);
            if (amp == std::string::npos) amp = query.size();
            std::string pair = query.substr(pos, amp - pos);
            pos = amp + 1;

            std::size_t eq = pair.find('=');
            if (eq == std::string::npos) continue;
            std::string key   = percent_decode(pair.substr(0, eq), true);
            std::string value = percent_decode(pair.substr(eq + 1), true);
            if (key.empty() || value.empty()) continue;
            params.emplace(std::move(key), std::move(value));
        }
        return params;
    }

    std::string param_or(const std::map<std::string, std::string>& params,
                         const std::string& key, const std::string& fallback) {
        auto it = params.find(key);
        return it == params.end() ? fallback : it->second;
    }
}

bool UriCodec::looksLikeOtpUri(const std::string& text) {
    return text.compare(0, std::char_traits<char>::length(SCHEME), SCHEME) == 0;
}

Credential UriCodec::parse(const std::string& uri) {
    if (uri.empty()) {
        throw OtpError(ErrorKind::InvalidUri, "URI must be a non-empty string");
    }
    if (!looksLikeOtpUri(uri)) {
        throw OtpError(ErrorKind::InvalidUri, "URI must start with 'otpauth://'");
    }

    const SplitUri parts = split_uri(uri);
    const std::string type = to_lower_ascii(parts.authority);
    if (type != "totp" && type != "hotp") {
        throw OtpError(ErrorKind::InvalidUri, "Unsupported OTP type: " + type);
    }

    // Path: "/issuer:label" or "/label"
    const std::size_t first = parts.path.find_first_not_of('/');
    const std::string path = first == std::string::npos ? std::string{} : parts.path.substr(first);
    std::string pathIssuer;
    std::string label;
    std::size_t colon = path.find(':');
    if (colon != std::string::npos) {
        pathIssuer = percent_decode(trim_ascii(path.substr(0, colon)));
        label      = path.substr(colon + 1);
    } else {
        label = trim_ascii(path);
    }
    label = percent_decode(label);

    const auto params = parse_query(parts.query);
    const std::string secret    = param_or(params, "secret", "");
    std::string issuer          = param_or(params, "issuer", pathIssuer);
    const std::string algorithm = to_upper_ascii(param_or(params, "algorithm", "SHA1"));
    const std::string digits    = param_or(params, "digits", "6");
    const std::string period    = param_or(params, "period", "30");
    const std::string counter   = param_or(params, "counter", "0");
    if (issuer.empty()) issuer = "Unknown";

    if (secret.empty()) {
        throw OtpError(ErrorKind::MissingField, "Missing required 'secret' parameter");
    }
    if (label.empty()) {
        throw OtpError(ErrorKind::MissingField, "Missing label (account identifier)");
    }
    if (!is_base32(secret)) {
        throw OtpError(ErrorKind::InvalidSecret, "Invalid secret format: " + secret);
    }
    auto alg = algorithmFromName(algorithm);
    if (!alg) {
        throw OtpError(ErrorKind::InvalidAlgorithm,
                       "Invalid algorithm: " + algorithm + ". Must be one of: SHA1, SHA256, SHA512, MD5");
    }

    auto digitsValue = parse_integer(digits);
    if (!digitsValue || *digitsValue < 4 || *digitsValue > 10) {
        throw OtpError(ErrorKind::InvalidDigits, "Invalid digits value: " + digits);
    }
    auto periodValue = parse_integer(period);
    if (!periodValue || *periodValue < 1 || *periodValue > 0xFFFFFFFFLL) {
        throw OtpError(ErrorKind::InvalidPeriod, "Invalid period value: " + period);
    }
    auto counterValue = parse_integer(counter);
    if (!counterValue || *counterValue < 0) {
        throw OtpError(ErrorKind::InvalidCounter, "Invalid counter value: " + counter);
    }

    if (type == "totp") {
        return Credential::totp(label, secret, issuer, *alg, static_cast<int>(*digitsValue),
                                static_cast<std::uint32_t>(*periodValue));
    }
    return Credential::hotp(label, secret, issuer, *alg, static_cast<int>(*digitsValue),
                            static_cast<std::uint64_t>(*counterValue));
}

std::string UriCodec::build(const Credential& c) {
    std::ostringstream uri;
    uri << SCHEME << kindName(c.kind()) << '/'
        << percent_encode(c.issuer) << ':' << percent_encode(c.label)
        << "?secret="    << c.secret
        << "&issuer="    << percent_encode(c.issuer)
        << "&algorithm=" << algorithmName(c.algorithm)
        << "&digits="    << c.digits;
    if (c.kind() == OtpKind::Totp) uri << "&period="  << c.period();
    else                           uri << "&counter=" << c.counter();
    return uri.str();
}

std::optional<std::string> UriCodec::validate(const std::string& uri) {
    try {
        parse(uri);
        return std::nullopt;
    } catch (const OtpError& ex) {
        return std::string(ex.what());
    }
}
