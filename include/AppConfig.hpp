#pragma once
#include "VaultKeySource.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

// Runtime settings. Defaults match the shipped behaviour; a JSON file can
// override any subset:
//   { "profile_dir": "profiles", "master_key_file": ".master",
//     "vault_extension": ".enc", "idle_timeout_secs": 180,
//     "refresh_interval_ms": 1000, "idle_check_interval_ms": 10000,
//     "clipboard_interval_ms": 2000, "min_password_length": 8,
//     "key_source": "password" }
struct AppConfig {
    std::filesystem::path profileDir = "profiles";
    std::string masterKeyFileName    = ".master";
    std::string vaultExtension       = ".enc";

    std::chrono::seconds      idleTimeout{180};
    std::chrono::milliseconds refreshInterval{1000};
    std::chrono::milliseconds idleCheckInterval{10000};
    std::chrono::milliseconds clipboardInterval{2000};

    std::size_t minPasswordLength = 8;
    VaultKeySource keySource = VaultKeySource::MasterPassword;

    std::filesystem::path masterKeyPath() const { return profileDir / masterKeyFileName; }

    // Throws std::invalid_argument on malformed JSON or a wrongly typed value.
    static AppConfig fromJson(const std::string& text);

    // Defaults, then the file named by TOKENX_CONFIG (or ./tokenx.json when it
    // exists), then TOKENX_HOME for the profile directory.
    static AppConfig load();
};
