#include "Session.hpp"

#include "CodeGenerator.hpp"
#include "Encoding.hpp"
#include "OtpError.hpp"
#include "UriCodec.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace {
    void wipe(std::string& s) {
        std::fill(s.begin(), s.end(), '\0');
        s.clear();
    }

    bool ends_with(const std::string& text, const std::string& suffix) {
        return text.size() >= suffix.size()
            && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::vector<std::uint8_t> read_binary_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) throw OtpError(ErrorKind::IoFailure, "cannot open file: " + path.string());
        return { std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
    }
}

Session::Session(const AppConfig& config, VaultStore& vault, MasterKeyManager& master,
                 StatusReporter& reporter, SessionClocks clocks)
    : m_config(config), m_vault(vault), m_master(master), m_reporter(reporter),
      m_clocks(std::move(clocks))
{
    if (!m_clocks.monotonic) m_clocks.monotonic = [] { return Scheduler::Clock::now(); };
    if (!m_clocks.unixTime)  m_clocks.unixTime  = [] { return CodeGenerator::currentUnixTime(); };
    m_lastActivity = m_clocks.monotonic();
}

Session::~Session() {
    lock();
}

// ---------- Authentication ----------

bool Session::needsSetup() const {
    return !m_master.exists();
}

void Session::setup(const std::string& password, const std::string& confirmation) {
    if (!needsSetup()) throw std::logic_error("master key already exists");
    std::string secret = m_master.bootstrap(password, confirmation);
    activateKey(password, std::move(secret));
    m_reporter.info("Master password set.");
}

void Session::unlock(const std::string& password) {
    std::string secret = m_master.authenticate(password);
    activateKey(password, std::move(secret));

    const auto report = reloadProfiles();
    if (!report.failed.empty()) {
        m_reporter.error(std::to_string(report.failed.size())
                         + " profile(s) could not be decrypted and were skipped");
    }
}

void Session::activateKey(const std::string& password, std::string secret) {
    wipe(m_password);
    wipe(m_secret);
    m_password = password;
    m_secret = std::move(secret);
    m_vault.setKey(m_config.keySource == VaultKeySource::MasterSecret ? m_secret : m_password);
    m_lastActivity = m_clocks.monotonic();
}

void Session::lock() {
    wipe(m_password);
    wipe(m_secret);
    m_vault.clearKey();
    m_profiles.clear();
    m_codes.clear();
}

void Session::requireUnlocked() const {
    if (isLocked()) throw OtpError(ErrorKind::SessionLocked, "Session is locked");
}

// ---------- Idle handling ----------

void Session::recordActivity() {
    m_lastActivity = m_clocks.monotonic();
}

bool Session::checkIdle() {
    if (isLocked()) return false;
    if (m_clocks.monotonic() - m_lastActivity < m_config.idleTimeout) return false;
    lock();
    m_reporter.info("Session locked after inactivity.");
    return true;
}

// ---------- Profiles ----------

LoadReport Session::reloadProfiles() {
    requireUnlocked();
    LoadReport report = m_vault.loadAll();
    m_profiles = report.credentials;
    refreshCodes();
    return report;
}

bool Session::hasProfile(const std::string& name) const {
    return m_profiles.count(name) != 0;
}

const std::vector<CodeRow>& Session::refreshCodes() {
    m_codes.clear();
    if (isLocked()) return m_codes;

    const std::int64_t now = m_clocks.unixTime();
    for (const auto& [name, cred] : m_profiles) {
        CodeRow row{ name, cred.kind(), CodeGenerator::UNAVAILABLE, 0 };
        try {
            const OtpCode code = CodeGenerator::generate(cred, now);
            row.code = code.code;
            row.remaining = code.remainingSeconds;
        } catch (const OtpError& ex) {
            m_reporter.error(name + ": " + ex.what());
        }
        m_codes.push_back(std::move(row));
    }
    return m_codes;
}

std::string Session::nameFor(const Credential& credential) const {
    return m_vault.sanitizeName(credential.label);
}

ImportResult Session::store(const Credential& credential, const OverwritePrompt& confirmOverwrite) {
    requireUnlocked();
    const std::string name = nameFor(credential);
    if (auto problem = m_vault.validateName(name)) {
        throw OtpError(ErrorKind::InvalidUri, *problem);
    }

    const bool existing = m_vault.exists(name);
    if (existing && !(confirmOverwrite && confirmOverwrite(name))) {
        m_reporter.info("Kept existing profile " + name + ".");
        return { ImportOutcome::Kept, name };
    }

    m_vault.save(name, credential);
    m_profiles.erase(name);
    m_profiles.emplace(name, credential);
    refreshCodes();

    m_reporter.info((existing ? "Overwrote profile " : "Imported profile ") + name + ".");
    return { existing ? ImportOutcome::Overwritten : ImportOutcome::Imported, name };
}

ImportResult Session::importUri(const std::string& uri, const OverwritePrompt& confirmOverwrite) {
    requireUnlocked();
    const Credential credential = UriCodec::parse(trim_ascii(uri));
    return store(credential, confirmOverwrite);
}

std::optional<ImportResult> Session::scanClipboard(const std::string& text,
                                                   const OverwritePrompt& confirmOverwrite) {
    if (isLocked()) return std::nullopt;
    const std::string candidate = trim_ascii(text);
    if (candidate == m_lastClipboard || !UriCodec::looksLikeOtpUri(candidate)) return std::nullopt;
    m_lastClipboard = candidate;

    if (auto problem = UriCodec::validate(candidate)) {
        m_reporter.error("Invalid OTP URI on clipboard: " + *problem);
        return std::nullopt;
    }
    try {
        return store(UriCodec::parse(candidate), confirmOverwrite);
    } catch (const OtpError& ex) {
        m_reporter.error("Clipboard import failed: " + std::string(ex.what()));
        return std::nullopt;
    }
}

void Session::deleteProfile(const std::string& name) {
    requireUnlocked();
    m_vault.remove(name);
    m_profiles.erase(name);
    refreshCodes();
    m_reporter.info("Deleted profile " + name + ".");
}

std::string Session::profileUri(const std::string& name) const {
    requireUnlocked();
    const auto it = m_profiles.find(name);
    if (it == m_profiles.end()) {
        throw OtpError(ErrorKind::IoFailure, "no such profile: " + name);
    }
    return UriCodec::build(it->second);
}

// ---------- Encrypted QR exports ----------

std::filesystem::path Session::defaultExportName(const std::string& name) const {
    return m_vault.sanitizeName(name) + ENCRYPTED_EXPORT_SUFFIX;
}

void Session::exportEncryptedQr(const std::string& name, const std::filesystem::path& path,
                                QrCodec& codec) {
    const std::string uri = profileUri(name);
    auto image = codec.imageFromText(uri);
    const std::string sealed = m_vault.sealBlob(image);
    std::fill(image.begin(), image.end(), 0);
    write_file_atomically(path, sealed);
    m_reporter.info("Exported encrypted QR for " + name + " to " + path.string() + ".");
}

ImportResult Session::importQrFile(const std::filesystem::path& path, QrCodec& codec,
                                   const OverwritePrompt& confirmOverwrite) {
    requireUnlocked();
    std::vector<std::uint8_t> image;
    if (ends_with(path.filename().string(), ENCRYPTED_EXPORT_SUFFIX)) {
        image = m_vault.openBlob(read_text_file(path));
    } else {
        image = read_binary_file(path);
    }

    const auto text = codec.textFromImage(image);
    std::fill(image.begin(), image.end(), 0);
    if (!text) {
        throw OtpError(ErrorKind::InvalidUri, "No QR code found in " + path.string());
    }
    return store(UriCodec::parse(trim_ascii(*text)), confirmOverwrite);
}

// ---------- Maintenance ----------

RotationResult Session::changeMasterPassword(const std::string& oldPassword,
                                             const std::string& newPassword,
                                             const std::string& confirmation) {
    requireUnlocked();
    RotationResult result = m_master.changePassword(oldPassword, newPassword, confirmation,
                                                    m_vault, m_config.keySource);
    // master-key file and profiles now agree on newPassword
    activateKey(newPassword, std::string(m_secret));
    reloadProfiles();
    m_reporter.info("Master password changed. Re-encrypted "
                    + std::to_string(result.succeeded.size()) + " profile(s).");
    return result;
}

void Session::resetVault() {
    requireUnlocked();
    m_vault.resetAll();
    m_master.reset();
    lock();
    m_lastClipboard.clear();
    m_reporter.info("Vault reset. All profiles and the master password were deleted.");
}

void Session::schedule(Scheduler& scheduler,
                       std::function<std::string()> clipboardText,
                       OverwritePrompt confirmOverwrite) {
    const auto start = m_clocks.monotonic();
    scheduler.addTask("refresh", m_config.refreshInterval, [this] { refreshCodes(); }, start);
    scheduler.addTask("idle", m_config.idleCheckInterval, [this] { checkIdle(); }, start);
    if (clipboardText) {
        scheduler.addTask("clipboard", m_config.clipboardInterval,
                          [this, source = std::move(clipboardText),
                           confirm = std::move(confirmOverwrite)] {
                              scanClipboard(source(), confirm);
                          },
                          start);
    }
}
