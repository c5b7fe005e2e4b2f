// src/main.cpp
#include "AppConfig.hpp"
#include "CodeGenerator.hpp"
#include "Encoding.hpp"
#include "MasterKeyManager.hpp"
#include "OtpError.hpp"
#include "PasswordStrength.hpp"
#include "Scheduler.hpp"
#include "Session.hpp"
#include "StatusReporter.hpp"
#include "TextPayloadCodec.hpp"
#include "UriCodec.hpp"
#include "VaultStore.hpp"
#include "console_io.hpp"
#include "secret_gen.hpp"

#include <algorithm>
#include <iostream>
#include <string>

// ----- Small helpers -----

static void scrub(std::string& s) {
    std::fill(s.begin(), s.end(), '\0');
}

static void print_strength(const std::string& password) {
    const auto report = PasswordStrength::score(password);
    std::cout << "Strength: " << report.score << "/100 ("
              << PasswordStrength::levelName(report.level) << ")\n";
    for (const auto& hint : report.feedback) std::cout << "  - " << hint << "\n";
}

static bool confirm_overwrite(const std::string& name) {
    return prompt_yes_no("Profile '" + name + "' already exists. Overwrite?");
}

static std::string choose_profile(const Session& session) {
    const auto& profiles = session.profiles();
    if (profiles.empty()) {
        std::cout << "No profiles stored.\n";
        return {};
    }
    for (const auto& entry : profiles) std::cout << "  " << entry.first << "\n";
    std::string name = prompt_line("Profile name: ");
    if (!session.hasProfile(name)) {
        std::cout << "Not found.\n";
        return {};
    }
    return name;
}

// ----- Menu actions -----

static void action_list_codes(Session& session) {
    const auto& rows = session.refreshCodes();
    if (rows.empty()) {
        std::cout << "No profiles stored.\n";
        return;
    }
    for (const auto& r : rows) {
        std::cout << "  " << r.name << "  " << r.code;
        if (r.kind == OtpKind::Totp && r.code != CodeGenerator::UNAVAILABLE) {
            std::cout << "  (" << r.remaining << "s)";
        }
        std::cout << "\n";
    }
}

static void action_import_uri(Session& session) {
    const std::string uri = prompt_line("otpauth URI: ");
    try {
        session.importUri(uri, confirm_overwrite);
    } catch (const OtpError& ex) {
        std::cout << "Import failed: " << ex.what() << "\n";
    }
}

static void action_show_uri(Session& session) {
    const std::string name = choose_profile(session);
    if (name.empty()) return;
    std::cout << session.profileUri(name) << "\n";
}

static void action_delete(Session& session) {
    const std::string name = choose_profile(session);
    if (name.empty()) return;
    if (prompt_line("Type 'YES' to confirm deletion: ") == "YES") {
        session.deleteProfile(name);
    } else {
        std::cout << "Aborted.\n";
    }
}

static void action_export(Session& session, QrCodec& codec) {
    const std::string name = choose_profile(session);
    if (name.empty()) return;
    std::string path = prompt_line("Export file (blank=" + session.defaultExportName(name).string() + "): ");
    if (path.empty()) path = session.defaultExportName(name).string();
    try {
        session.exportEncryptedQr(name, path, codec);
    } catch (const OtpError& ex) {
        std::cout << "Export failed: " << ex.what() << "\n";
    }
}

static void action_import_file(Session& session, QrCodec& codec) {
    const std::string path = prompt_line("File to import: ");
    try {
        session.importQrFile(path, codec, confirm_overwrite);
    } catch (const OtpError& ex) {
        std::cout << "Import failed: " << ex.what() << "\n";
    }
}

static void action_generate_secret() {
    const std::string secret = generate_base32_secret();
    std::cout << "Generated secret: " << secret << "\n";
    const std::string label = prompt_line("Label for a TOTP URI (blank=skip): ");
    if (!label.empty()) {
        std::cout << UriCodec::build(Credential::totp(label, secret, prompt_line("Issuer: "))) << "\n";
    }
}

static void action_manual_code() {
    std::string secret = prompt_line("Base32 secret: ");
    std::string algName = to_upper_ascii(prompt_line("Algorithm (blank=SHA1): "));
    if (algName.empty()) algName = "SHA1";
    const auto alg = algorithmFromName(algName);
    if (!alg) {
        std::cout << "Unsupported algorithm.\n";
        return;
    }
    try {
        const auto now = CodeGenerator::currentUnixTime();
        std::cout << "Code: " << CodeGenerator::hmacOtp(secret, now, 6, 30, *alg)
                  << "  (" << CodeGenerator::remainingSeconds(now, 30) << "s)\n";
    } catch (const OtpError& ex) {
        std::cout << CodeGenerator::UNAVAILABLE << ": " << ex.what() << "\n";
    }
    scrub(secret);
}

static void action_change_master(Session& session) {
    std::string current = prompt_hidden("Current master password: ");
    std::string new1 = prompt_hidden("New master password: ");
    print_strength(new1);
    std::string new2 = prompt_hidden("Confirm new master password: ");
    try {
        session.changeMasterPassword(current, new1, new2);
    } catch (const OtpError& ex) {
        std::cout << "Change failed: " << ex.what() << "\n";
        for (const auto& d : ex.details()) std::cout << "  - " << d << "\n";
    }
    scrub(current);
    scrub(new1);
    scrub(new2);
}

static bool action_reset(Session& session) {
    if (prompt_line("This deletes every profile and the master password. Type 'RESET': ") != "RESET") {
        std::cout << "Aborted.\n";
        return false;
    }
    session.resetVault();
    return true;
}

// ----- Authentication -----

static int first_run(Session& session) {
    std::cout << "No master password found (first run).\n";
    for (;;) {
        std::string pw1 = prompt_hidden("Enter new master password: ");
        if (!std::cin) return 1;
        print_strength(pw1);
        std::string pw2 = prompt_hidden("Confirm master password: ");
        try {
            session.setup(pw1, pw2);
            scrub(pw1);
            scrub(pw2);
            return 0;
        } catch (const OtpError& ex) {
            std::cerr << ex.what() << "\n";
            if (ex.kind() != ErrorKind::WeakPassword && ex.kind() != ErrorKind::PasswordMismatch) throw;
        }
        scrub(pw1);
        scrub(pw2);
    }
}

// Wrong password or an unreadable master-key file ends the program.
static bool login(Session& session, const std::string& message) {
    std::string pw = prompt_hidden(message);
    try {
        session.unlock(pw);
    } catch (const OtpError& ex) {
        scrub(pw);
        if (ex.kind() != ErrorKind::DecryptionFailure && ex.kind() != ErrorKind::IoFailure) throw;
        std::cerr << "Login failed (" << errorKindName(ex.kind()) << "): " << ex.what() << "\n";
        return false;
    }
    scrub(pw);
    return true;
}

// ----- Main -----

int main() {
    try {
        std::cout << "TokenX starting...\n";
        const AppConfig config = AppConfig::load();
        auto vault = VaultStore::open(config.profileDir, config.vaultExtension);
        MasterKeyManager master(config.masterKeyPath(), config.minPasswordLength);
        ConsoleReporter reporter;
        TextPayloadCodec codec;
        Session session(config, *vault, master, reporter);

        if (session.needsSetup()) {
            if (first_run(session) != 0) return 1;
        } else {
            std::cout << "Master key found. Please log in.\n";
            if (!login(session, "Enter master password: ")) return 2;
        }
        std::cout << "Login successful. " << session.profiles().size() << " profile(s) loaded.\n";

        // The console has no clipboard; pasted URIs go through the import action.
        Scheduler scheduler;
        session.schedule(scheduler, {}, {});

        for (;;) {
            scheduler.runDue(Scheduler::Clock::now());
            if (session.isLocked()) {
                if (!login(session, "Session locked. Enter master password: ")) return 2;
                continue;
            }

            std::cout << "\n=== Menu ===\n"
                         "1) Show codes\n"
                         "2) Import otpauth URI\n"
                         "3) Show profile URI\n"
                         "4) Delete profile\n"
                         "5) Export encrypted QR\n"
                         "6) Import QR file\n"
                         "7) Generate secret\n"
                         "8) Manual code\n"
                         "9) Change master password\n"
                         "r) Reset vault\n"
                         "q) Quit\n";
            std::string choice = prompt_line("> ");
            if (!std::cin) break;

            // time spent at the prompt counts as idle
            scheduler.runDue(Scheduler::Clock::now());
            session.checkIdle();
            if (session.isLocked()) continue;
            session.recordActivity();

            if (choice == "1") action_list_codes(session);
            else if (choice == "2") action_import_uri(session);
            else if (choice == "3") action_show_uri(session);
            else if (choice == "4") action_delete(session);
            else if (choice == "5") action_export(session, codec);
            else if (choice == "6") action_import_file(session, codec);
            else if (choice == "7") action_generate_secret();
            else if (choice == "8") action_manual_code();
            else if (choice == "9") action_change_master(session);
            else if (choice == "r" || choice == "R") {
                if (action_reset(session)) break;
            }
            else if (choice == "q" || choice == "Q") break;
            else std::cout << "Unknown option.\n";
        }

        session.lock();
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
