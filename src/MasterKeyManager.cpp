#include "MasterKeyManager.hpp"

#include "Encoding.hpp"
#include "EncryptionManager.hpp"
#include "OtpError.hpp"
#include "PasswordStrength.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace {
    std::string join(const std::vector<std::string>& items, const char* sep) {
        std::string out;
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) out += sep;
            out += items[i];
        }
        return out;
    }
}

MasterKeyManager::MasterKeyManager(std::filesystem::path masterKeyFile, std::size_t minPasswordLength)
    : m_path(std::move(masterKeyFile)), m_minLength(minPasswordLength)
{
}

bool MasterKeyManager::exists() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(m_path, ec);
}

std::string MasterKeyManager::generateMasterSecret() {
    auto raw = EncryptionManager::randomBytes(SECRET_LEN);
    std::string secret = base64url_encode(raw);
    std::fill(raw.begin(), raw.end(), 0);
    return secret;
}

void MasterKeyManager::checkNewPassword(const std::string& password,
                                        const std::string& confirmation) const {
    if (!PasswordStrength::isAcceptable(password, m_minLength)) {
        const auto report = PasswordStrength::score(password);
        throw OtpError(ErrorKind::WeakPassword,
                       "Password is not strong enough (" + std::to_string(report.score)
                       + "/100, needs at least " + std::to_string(m_minLength)
                       + " characters and 60/100)",
                       report.feedback);
    }
    if (password != confirmation) {
        throw OtpError(ErrorKind::PasswordMismatch, "Passwords do not match");
    }
}

void MasterKeyManager::store(const std::string& secret, const std::string& password) const {
    const std::vector<std::uint8_t> plaintext(secret.begin(), secret.end());
    write_file_atomically(m_path, EncryptionManager::sealText(plaintext, password));
}

std::string MasterKeyManager::bootstrap(const std::string& password,
                                        const std::string& confirmation) const {
    checkNewPassword(password, confirmation);
    std::string secret = generateMasterSecret();
    store(secret, password);
    return secret;
}

std::string MasterKeyManager::authenticate(const std::string& password) const {
    const std::string text = read_text_file(m_path);
    auto plaintext = EncryptionManager::openText(text, password);
    std::string secret(plaintext.begin(), plaintext.end());
    std::fill(plaintext.begin(), plaintext.end(), 0);
    return secret;
}

RotationResult MasterKeyManager::changePassword(const std::string& oldPassword,
                                                const std::string& newPassword,
                                                const std::string& confirmation,
                                                VaultStore& vault,
                                                VaultKeySource source) const {
    // 0) current password first; a wrong one never reaches the profiles
    std::string secret = authenticate(oldPassword);

    // 1) gate the new password
    try {
        checkNewPassword(newPassword, confirmation);
    } catch (const OtpError&) {
        std::fill(secret.begin(), secret.end(), '\0');
        throw;
    }

    RotationResult result;
    if (source == VaultKeySource::MasterSecret) {
        // 2a) profiles are keyed by the secret, which does not change
        store(secret, newPassword);
        result.succeeded = vault.names();
        result.committed = true;
    } else {
        // 2b) rewrite every profile, then the master-key file, as one step
        result = vault.reencryptAll(oldPassword, newPassword,
                                    [&]() { store(secret, newPassword); });
    }
    std::fill(secret.begin(), secret.end(), '\0');

    if (!result.committed) {
        throw OtpError(ErrorKind::PartialReencryptionFailure,
                       "Password NOT changed. Profiles that could not be re-encrypted: "
                       + join(result.failed, ", "),
                       result.failed);
    }
    return result;
}

void MasterKeyManager::reset() const {
    std::error_code ec;
    std::filesystem::remove(m_path, ec);
    if (ec) throw OtpError(ErrorKind::IoFailure, "cannot delete master key file: " + m_path.string());
}
