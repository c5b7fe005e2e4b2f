#include "VaultStore.hpp"

#include "EncryptionManager.hpp"
#include "OtpError.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    bool allowed_name_char(unsigned char ch) {
        return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')
            || ch == '.' || ch == '_' || ch == '@' || ch == '-';
    }

    bool ends_with(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    fs::path temp_path_for(const fs::path& path) {
        fs::path tmp = path;
        tmp += ".tmp";
        return tmp;
    }

    void write_whole_file(const fs::path& path, const std::string& contents) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw OtpError(ErrorKind::IoFailure, "cannot open for writing: " + path.string());
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out) {
            throw OtpError(ErrorKind::IoFailure, "write failed: " + path.string());
        }
    }

    void rename_over(const fs::path& from, const fs::path& to) {
        std::error_code ec;
        fs::rename(from, to, ec);
        if (ec) {
            fs::remove(from, ec);
            throw OtpError(ErrorKind::IoFailure, "rename failed: " + to.string());
        }
    }

    void scrub(std::vector<std::uint8_t>& bytes) {
        std::fill(bytes.begin(), bytes.end(), 0);
    }
}

// ---- File helpers

std::string read_text_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw OtpError(ErrorKind::IoFailure, "cannot open for reading: " + path.string());
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw OtpError(ErrorKind::IoFailure, "read failed: " + path.string());
    }
    return data;
}

void write_file_atomically(const fs::path& path, const std::string& contents) {
    const fs::path tmp = temp_path_for(path);
    try {
        write_whole_file(tmp, contents);
    } catch (const OtpError&) {
        std::error_code ec;
        fs::remove(tmp, ec);
        throw;
    }
    rename_over(tmp, path);
}

// ---- Lifecycle

VaultStore::VaultStore(fs::path dir, std::string extension)
    : m_dir(std::move(dir)), m_ext(std::move(extension))
{
}

VaultStore::~VaultStore() {
    std::fill(m_key.begin(), m_key.end(), '\0');
}

std::unique_ptr<VaultStore> VaultStore::open(const fs::path& dir, const std::string& extension) {
    if (extension.empty() || extension[0] != '.') {
        throw std::invalid_argument("VaultStore: extension must start with '.'");
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir)) {
        throw OtpError(ErrorKind::IoFailure, "cannot create vault directory: " + dir.string());
    }
    return std::unique_ptr<VaultStore>(new VaultStore(dir, extension));
}

void VaultStore::setKey(const std::string& keyMaterial) {
    if (keyMaterial.empty()) throw std::invalid_argument("VaultStore: empty key material");
    std::lock_guard<std::mutex> lock(m_mutex);
    std::fill(m_key.begin(), m_key.end(), '\0');
    m_key = keyMaterial;
}

void VaultStore::clearKey() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::fill(m_key.begin(), m_key.end(), '\0');
    m_key.clear();
}

bool VaultStore::hasKey() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_key.empty();
}

void VaultStore::requireKey() const {
    if (m_key.empty()) throw OtpError(ErrorKind::SessionLocked, "vault is locked");
}

// ---- Naming

std::string VaultStore::sanitizeName(const std::string& label) const {
    std::string out;
    out.reserve(label.size());
    for (std::size_t i = 0; i < label.size(); ++i) {
        auto ch = static_cast<unsigned char>(label[i]);
        if (allowed_name_char(ch)) {
            out.push_back(static_cast<char>(ch));
            continue;
        }
        out.push_back('_');
        // skip UTF-8 continuation bytes of the same character
        while (i + 1 < label.size() &&
               (static_cast<unsigned char>(label[i + 1]) & 0xC0) == 0x80) {
            ++i;
        }
    }
    const std::size_t limit = MAX_FILE_NAME - m_ext.size();
    if (out.size() > limit) out.resize(limit);
    return out;
}

std::optional<std::string> VaultStore::validateName(const std::string& name) const {
    if (name.empty()) return std::string("Profile name cannot be empty");
    if (name.size() > MAX_FILE_NAME - m_ext.size()) {
        return std::string("Profile name too long (max ")
             + std::to_string(MAX_FILE_NAME - m_ext.size()) + " characters)";
    }
    for (char ch : name) {
        if (!allowed_name_char(static_cast<unsigned char>(ch))) {
            return std::string("Profile name contains invalid characters");
        }
    }
    return std::nullopt;
}

fs::path VaultStore::pathFor(const std::string& name) const {
    if (auto err = validateName(name)) throw std::invalid_argument(*err + ": " + name);
    return m_dir / (name + m_ext);
}

// ---- Listing / direct file operations

std::vector<std::string> VaultStore::namesLocked() const {
    std::vector<std::string> out;
    std::error_code ec;
    for (fs::directory_iterator it(m_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file()) continue;
        const std::string file = it->path().filename().string();
        if (file.size() > m_ext.size() && ends_with(file, m_ext)) {
            out.push_back(file.substr(0, file.size() - m_ext.size()));
        }
    }
    if (ec) throw OtpError(ErrorKind::IoFailure, "cannot list vault directory: " + m_dir.string());
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::string> VaultStore::names() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return namesLocked();
}

bool VaultStore::exists(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    return fs::is_regular_file(pathFor(name), ec);
}

void VaultStore::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    fs::remove(pathFor(name), ec);
    if (ec) throw OtpError(ErrorKind::IoFailure, "cannot delete profile: " + name);
}

void VaultStore::resetAll() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& name : namesLocked()) {
        std::error_code ec;
        fs::remove(m_dir / (name + m_ext), ec);
        if (ec) throw OtpError(ErrorKind::IoFailure, "cannot delete profile: " + name);
    }
}

// ---- Encrypted profiles

void VaultStore::save(const std::string& name, const Credential& credential) {
    validateCredential(credential);
    const std::string json = credentialToJson(credential);
    std::vector<std::uint8_t> plaintext(json.begin(), json.end());

    std::lock_guard<std::mutex> lock(m_mutex);
    requireKey();
    const fs::path path = pathFor(name);
    const std::string text = EncryptionManager::sealText(plaintext, m_key);
    scrub(plaintext);
    write_file_atomically(path, text);
}

std::optional<Credential> VaultStore::loadLocked(const std::string& name) const {
    std::error_code ec;
    const fs::path path = m_dir / (name + m_ext);
    if (!fs::is_regular_file(path, ec)) return std::nullopt;

    // Any failure means "not loaded"; one bad file must not stop the others.
    try {
        auto plaintext = EncryptionManager::openText(read_text_file(path), m_key);
        std::string json(plaintext.begin(), plaintext.end());
        scrub(plaintext);
        Credential c = credentialFromJson(json);
        std::fill(json.begin(), json.end(), '\0');
        return c;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<Credential> VaultStore::load(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    requireKey();
    if (validateName(name)) return std::nullopt;
    return loadLocked(name);
}

LoadReport VaultStore::loadAll() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    requireKey();
    LoadReport report;
    for (const auto& name : namesLocked()) {
        if (auto c = loadLocked(name)) report.credentials.emplace(name, std::move(*c));
        else                           report.failed.push_back(name);
    }
    return report;
}

// ---- Rotation

RotationResult VaultStore::reencryptAll(const std::string& oldKey,
                                        const std::string& newKey,
                                        const std::function<void()>& onCommit) {
    if (newKey.empty()) throw std::invalid_argument("reencryptAll: empty new key");

    struct Staged {
        fs::path path;
        std::string oldText;
        std::string newText;
        std::vector<std::uint8_t> plaintext;
    };

    std::lock_guard<std::mutex> lock(m_mutex);
    RotationResult result;
    std::vector<Staged> staged;

    // 1) decrypt everything under the old key; nothing is touched yet
    for (const auto& name : namesLocked()) {
        Staged s;
        s.path = m_dir / (name + m_ext);
        try {
            s.oldText   = read_text_file(s.path);
            s.plaintext = EncryptionManager::openText(s.oldText, oldKey);
            staged.push_back(std::move(s));
            result.succeeded.push_back(name);
        } catch (const std::exception&) {
            result.failed.push_back(name);
        }
    }

    if (!result.failed.empty()) {
        for (auto& s : staged) scrub(s.plaintext);
        return result;
    }

    // 2) seal under the new key and stage every file as <name>.tmp
    for (auto& s : staged) {
        s.newText = EncryptionManager::sealText(s.plaintext, newKey);
        scrub(s.plaintext);
    }
    auto drop_temps = [&staged]() {
        for (const auto& s : staged) {
            std::error_code ec;
            fs::remove(temp_path_for(s.path), ec);
        }
    };
    try {
        for (const auto& s : staged) write_whole_file(temp_path_for(s.path), s.newText);
    } catch (const OtpError&) {
        drop_temps();
        throw;
    }

    // 3) swap in; on any failure put the old envelopes back
    auto restore = [&staged](std::size_t count) {
        for (std::size_t i = 0; i < count; ++i) {
            try {
                write_file_atomically(staged[i].path, staged[i].oldText);
            } catch (const OtpError&) {
                // keep restoring the rest; the caller sees the original error
            }
        }
    };
    for (std::size_t i = 0; i < staged.size(); ++i) {
        try {
            rename_over(temp_path_for(staged[i].path), staged[i].path);
        } catch (const OtpError&) {
            restore(i);
            drop_temps();
            throw;
        }
    }

    // 4) master-key update inside the same critical section
    if (onCommit) {
        try {
            onCommit();
        } catch (...) {
            restore(staged.size());
            throw;
        }
    }

    if (m_key == oldKey) {
        std::fill(m_key.begin(), m_key.end(), '\0');
        m_key = newKey;
    }
    result.committed = true;
    return result;
}

// ---- Blobs

std::string VaultStore::sealBlob(const std::vector<std::uint8_t>& data) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    requireKey();
    return EncryptionManager::sealText(data, m_key);
}

std::vector<std::uint8_t> VaultStore::openBlob(const std::string& text) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    requireKey();
    return EncryptionManager::openText(text, m_key);
}
