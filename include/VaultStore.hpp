#pragma once
#include "Credential.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Result of a best-effort full load.
struct LoadReport {
    std::map<std::string, Credential> credentials;  // by profile name
    std::vector<std::string> failed;                // names that did not load
};

struct RotationResult {
    std::vector<std::string> succeeded;  // decrypted under the old key
    std::vector<std::string> failed;     // could not be decrypted
    bool committed = false;              // true only when every file was rewritten
};

// One encrypted file per profile: <dir>/<name><extension>, base64 text of an
// EncryptedEnvelope wrapping the profile JSON.
// Every public operation takes the same mutex, so a refresh cannot observe a
// file halfway through a rotation.
class VaultStore {
public:
    static constexpr const char* DEFAULT_EXTENSION = ".enc";
    static constexpr std::size_t MAX_FILE_NAME = 255;

    // Creates the directory if needed. Throws OtpError(IoFailure).
    static std::unique_ptr<VaultStore> open(const std::filesystem::path& dir,
                                            const std::string& extension = DEFAULT_EXTENSION);

    VaultStore(const VaultStore&) = delete;
    VaultStore& operator=(const VaultStore&) = delete;
    ~VaultStore();

    // ---- Key material (master password or master secret, see VaultKeySource)
    void setKey(const std::string& keyMaterial);
    void clearKey();
    bool hasKey() const;

    // ---- Profiles
    // Operations below throw OtpError(SessionLocked) when no key is set.
    void save(const std::string& name, const Credential& credential);
    // Missing file, wrong key, corrupt envelope or bad JSON -> nullopt.
    std::optional<Credential> load(const std::string& name) const;
    LoadReport loadAll() const;

    // Direct file operations; no key needed.
    std::vector<std::string> names() const;
    bool exists(const std::string& name) const;
    void remove(const std::string& name);
    void resetAll();

    // Staged rotation: decrypt every profile under oldKey first. If any fails,
    // nothing is written. Otherwise every profile is rewritten under newKey and
    // onCommit runs before the lock is released; if onCommit throws, the old
    // files are put back and the exception propagates.
    RotationResult reencryptAll(const std::string& oldKey,
                                const std::string& newKey,
                                const std::function<void()>& onCommit = {});

    // ---- Arbitrary blobs sealed under the current key (encrypted QR exports)
    std::string sealBlob(const std::vector<std::uint8_t>& data) const;
    std::vector<std::uint8_t> openBlob(const std::string& text) const;

    // ---- Naming
    // Characters outside [A-Za-z0-9._@-] become '_' (one per UTF-8 character);
    // the result is cut so that name + extension fits MAX_FILE_NAME.
    std::string sanitizeName(const std::string& label) const;
    // Error message, or nullopt when the name can be used as-is.
    std::optional<std::string> validateName(const std::string& name) const;

    const std::filesystem::path& directory() const { return m_dir; }
    const std::string& extension() const { return m_ext; }

private:
    VaultStore(std::filesystem::path dir, std::string extension);

    std::filesystem::path pathFor(const std::string& name) const;
    void requireKey() const;
    std::vector<std::string> namesLocked() const;
    std::optional<Credential> loadLocked(const std::string& name) const;

    std::filesystem::path m_dir;
    std::string m_ext;
    std::string m_key;
    mutable std::mutex m_mutex;
};

// ---- File helpers shared with MasterKeyManager

// Throws OtpError(IoFailure).
std::string read_text_file(const std::filesystem::path& path);
// Writes <path>.tmp then renames over path. Throws OtpError(IoFailure).
void write_file_atomically(const std::filesystem::path& path, const std::string& contents);
