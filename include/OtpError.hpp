#pragma once
#include <stdexcept>
#include <string>
#include <vector>

// Failure categories surfaced by the vault, the URI codec and the crypto layer.
enum class ErrorKind {
    InvalidUri,
    MissingField,
    InvalidSecret,
    InvalidAlgorithm,
    InvalidDigits,
    InvalidPeriod,
    InvalidCounter,
    DecryptionFailure,
    IoFailure,
    WeakPassword,
    PasswordMismatch,
    PartialReencryptionFailure,
    CodeGenerationError,
    SessionLocked
};

const char* errorKindName(ErrorKind kind);

class OtpError : public std::runtime_error {
public:
    OtpError(ErrorKind kind, const std::string& message);
    // details: e.g. the profile names that failed during a rotation
    OtpError(ErrorKind kind, const std::string& message, std::vector<std::string> details);

    ErrorKind kind() const noexcept { return m_kind; }
    const std::vector<std::string>& details() const noexcept { return m_details; }

private:
    ErrorKind m_kind;
    std::vector<std::string> m_details;
};
