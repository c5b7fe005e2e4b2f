#include "AppConfig.hpp"

#include "VaultStore.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <stdexcept>
#include <system_error>

const char* keySourceName(VaultKeySource source) {
    return source == VaultKeySource::MasterSecret ? "master_secret" : "password";
}

std::optional<VaultKeySource> keySourceFromName(const std::string& name) {
    if (name == "password")      return VaultKeySource::MasterPassword;
    if (name == "master_secret") return VaultKeySource::MasterSecret;
    return std::nullopt;
}

namespace {
    template <typename T>
    void read_if_present(const nlohmann::json& j, const char* key, T& out) {
        auto it = j.find(key);
        if (it == j.end()) return;
        try {
            out = it->get<T>();
        } catch (const nlohmann::json::exception&) {
            throw std::invalid_argument(std::string("config: wrong type for '") + key + "'");
        }
    }

    template <typename Duration>
    void read_duration(const nlohmann::json& j, const char* key, Duration& out) {
        long long count = out.count();
        read_if_present(j, key, count);
        if (count <= 0) {
            throw std::invalid_argument(std::string("config: '") + key + "' must be positive");
        }
        out = Duration(count);
    }
}

AppConfig AppConfig::fromJson(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& ex) {
        throw std::invalid_argument(std::string("config: ") + ex.what());
    }
    if (!j.is_object()) throw std::invalid_argument("config: top level must be an object");

    AppConfig cfg;
    std::string dir = cfg.profileDir.string();
    read_if_present(j, "profile_dir", dir);
    cfg.profileDir = dir;
    read_if_present(j, "master_key_file", cfg.masterKeyFileName);
    read_if_present(j, "vault_extension", cfg.vaultExtension);
    read_duration(j, "idle_timeout_secs", cfg.idleTimeout);
    read_duration(j, "refresh_interval_ms", cfg.refreshInterval);
    read_duration(j, "idle_check_interval_ms", cfg.idleCheckInterval);
    read_duration(j, "clipboard_interval_ms", cfg.clipboardInterval);
    read_if_present(j, "min_password_length", cfg.minPasswordLength);

    std::string source = keySourceName(cfg.keySource);
    read_if_present(j, "key_source", source);
    auto parsed = keySourceFromName(source);
    if (!parsed) throw std::invalid_argument("config: unknown key_source '" + source + "'");
    cfg.keySource = *parsed;

    if (cfg.vaultExtension.size() < 2 || cfg.vaultExtension[0] != '.') {
        throw std::invalid_argument("config: vault_extension must look like '.enc'");
    }
    const std::string& master = cfg.masterKeyFileName;
    const std::string& ext    = cfg.vaultExtension;
    const bool clashes = master.size() >= ext.size() &&
                         master.compare(master.size() - ext.size(), ext.size(), ext) == 0;
    if (master.empty() || clashes) {
        throw std::invalid_argument("config: master_key_file must not use the vault extension");
    }
    return cfg;
}

AppConfig AppConfig::load() {
    AppConfig cfg;

    std::filesystem::path file = "tokenx.json";
    bool required = false;
    if (const char* env = std::getenv("TOKENX_CONFIG")) {
        file = env;
        required = true;
    }
    std::error_code ec;
    if (std::filesystem::is_regular_file(file, ec)) {
        cfg = fromJson(read_text_file(file));
    } else if (required) {
        throw std::invalid_argument("config: file not found: " + file.string());
    }

    if (const char* home = std::getenv("TOKENX_HOME")) {
        if (*home) cfg.profileDir = home;
    }
    return cfg;
}
