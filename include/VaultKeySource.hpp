#pragma once
#include <optional>
#include <string>

// What the per-profile envelopes are keyed with.
//  MasterPassword: the password typed at login (profiles written by earlier
//                  releases use this; rotation rewrites every profile).
//  MasterSecret:   the random secret stored in the master-key file
//                  (rotation only rewrites the master-key file).
enum class VaultKeySource { MasterPassword, MasterSecret };

const char* keySourceName(VaultKeySource source);                          // "password" / "master_secret"
std::optional<VaultKeySource> keySourceFromName(const std::string& name);
