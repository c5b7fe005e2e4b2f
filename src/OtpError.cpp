#include "OtpError.hpp"

#include <utility>

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidUri:                 return "InvalidUri";
    case ErrorKind::MissingField:               return "MissingField";
    case ErrorKind::InvalidSecret:              return "InvalidSecret";
    case ErrorKind::InvalidAlgorithm:           return "InvalidAlgorithm";
    case ErrorKind::InvalidDigits:              return "InvalidDigits";
    case ErrorKind::InvalidPeriod:              return "InvalidPeriod";
    case ErrorKind::InvalidCounter:             return "InvalidCounter";
    case ErrorKind::DecryptionFailure:          return "DecryptionFailure";
    case ErrorKind::IoFailure:                  return "IoFailure";
    case ErrorKind::WeakPassword:               return "WeakPassword";
    case ErrorKind::PasswordMismatch:           return "PasswordMismatch";
    case ErrorKind::PartialReencryptionFailure: return "PartialReencryptionFailure";
    case ErrorKind::CodeGenerationError:        return "CodeGenerationError";
    case ErrorKind::SessionLocked:              return "SessionLocked";
    }
    return "Unknown";
}

OtpError::OtpError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), m_kind(kind)
{
}

OtpError::OtpError(ErrorKind kind, const std::string& message, std::vector<std::string> details)
    : std::runtime_error(message), m_kind(kind), m_details(std::move(details))
{
}
