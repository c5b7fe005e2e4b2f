#pragma once
#include "AppConfig.hpp"
#include "Credential.hpp"
#include "MasterKeyManager.hpp"
#include "QrCodec.hpp"
#include "Scheduler.hpp"
#include "StatusReporter.hpp"
#include "VaultStore.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct CodeRow {
    std::string name;
    OtpKind kind;
    std::string code;            // CodeGenerator::UNAVAILABLE when it cannot be computed
    std::uint32_t remaining;     // seconds, TOTP only
};

enum class ImportOutcome { Imported, Overwritten, Kept };

struct ImportResult {
    ImportOutcome outcome;
    std::string name;
};

// Asked before an existing profile is replaced; return true to overwrite.
using OverwritePrompt = std::function<bool(const std::string& name)>;

// Time sources, replaceable in tests.
struct SessionClocks {
    std::function<Scheduler::TimePoint()> monotonic = [] { return Scheduler::Clock::now(); };
    std::function<std::int64_t()> unixTime;  // defaults to the system clock
};

// One unlocked vault for one user. Holds the master password and secret in
// memory while unlocked and wipes them on lock. Vault operations on a locked
// session throw OtpError(SessionLocked).
class Session {
public:
    static constexpr const char* ENCRYPTED_EXPORT_SUFFIX = ".qrenc";

    Session(const AppConfig& config, VaultStore& vault, MasterKeyManager& master,
            StatusReporter& reporter, SessionClocks clocks = {});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // ---- Authentication
    bool needsSetup() const;
    // First run. Throws OtpError(WeakPassword | PasswordMismatch | IoFailure).
    void setup(const std::string& password, const std::string& confirmation);
    // Login and re-authentication after an idle lock. Throws
    // OtpError(DecryptionFailure | IoFailure); the caller ends the session.
    void unlock(const std::string& password);
    void lock();
    bool isLocked() const { return m_password.empty(); }

    // ---- Idle handling
    void recordActivity();
    // Locks when the last activity is older than the idle timeout.
    // Returns true when this call locked the session.
    bool checkIdle();

    // ---- Profiles
    LoadReport reloadProfiles();
    const std::map<std::string, Credential>& profiles() const { return m_profiles; }
    bool hasProfile(const std::string& name) const;

    // From the in-memory profiles only: no key derivation on this path.
    const std::vector<CodeRow>& refreshCodes();
    const std::vector<CodeRow>& codes() const { return m_codes; }

    // Throws OtpError for URI validation errors; the vault is untouched then.
    ImportResult importUri(const std::string& uri, const OverwritePrompt& confirmOverwrite);

    // Imports a clipboard text once. Non-otpauth text is ignored; invalid URIs
    // are reported and ignored. Returns the import when one happened.
    std::optional<ImportResult> scanClipboard(const std::string& text,
                                              const OverwritePrompt& confirmOverwrite);

    void deleteProfile(const std::string& name);
    std::string profileUri(const std::string& name) const;

    // ---- Encrypted QR exports (same envelope as the profiles, base64 text)
    std::filesystem::path defaultExportName(const std::string& name) const;
    void exportEncryptedQr(const std::string& name, const std::filesystem::path& path, QrCodec& codec);
    // *.qrenc files are decrypted first; anything else is treated as a plain image.
    ImportResult importQrFile(const std::filesystem::path& path, QrCodec& codec,
                              const OverwritePrompt& confirmOverwrite);

    // ---- Maintenance
    RotationResult changeMasterPassword(const std::string& oldPassword,
                                        const std::string& newPassword,
                                        const std::string& confirmation);
    // Deletes every profile and the master-key file, then locks.
    void resetVault();

    // Registers code refresh, idle check and (when a source is given) the
    // clipboard scan with their configured intervals.
    void schedule(Scheduler& scheduler,
                  std::function<std::string()> clipboardText,
                  OverwritePrompt confirmOverwrite);

private:
    void requireUnlocked() const;
    void activateKey(const std::string& password, std::string secret);
    std::string nameFor(const Credential& credential) const;
    ImportResult store(const Credential& credential, const OverwritePrompt& confirmOverwrite);

    const AppConfig& m_config;
    VaultStore& m_vault;
    MasterKeyManager& m_master;
    StatusReporter& m_reporter;
    SessionClocks m_clocks;

    std::string m_password;
    std::string m_secret;
    Scheduler::TimePoint m_lastActivity;
    std::string m_lastClipboard;

    std::map<std::string, Credential> m_profiles;
    std::vector<CodeRow> m_codes;
};
