#include "PasswordStrength.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace {
    const char kSpecials[] = "!@#$%^&*()_+-=[]{};:'\",.<>?/\\|`~";
    const char* const kSequences[] = {
        "012", "123", "234", "345", "456", "567", "678", "789", "abc", "bcd", "cde"
    };

    // Length in code points, not bytes.
    std::size_t utf8_length(const std::string& s) {
        std::size_t n = 0;
        for (unsigned char ch : s) {
            if ((ch & 0xC0) != 0x80) ++n;
        }
        return n;
    }

    // One entry per code point, each holding its full UTF-8 sequence.
    std::vector<std::string> utf8_chars(const std::string& s) {
        std::vector<std::string> out;
        for (unsigned char ch : s) {
            if ((ch & 0xC0) != 0x80 || out.empty()) out.emplace_back();
            out.back().push_back(static_cast<char>(ch));
        }
        return out;
    }

    bool has_run_of_three(const std::string& s) {
        const auto chars = utf8_chars(s);
        for (std::size_t i = 2; i < chars.size(); ++i) {
            if (chars[i] == chars[i - 1] && chars[i] == chars[i - 2]) return true;
        }
        return false;
    }

    bool has_sequence(const std::string& s) {
        std::string lower(s);
        for (char& ch : lower) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        for (const char* seq : kSequences) {
            if (lower.find(seq) != std::string::npos) return true;
        }
        return false;
    }
}

StrengthReport PasswordStrength::score(const std::string& password) {
    StrengthReport report;
    if (password.empty()) {
        report.feedback.push_back("Password is empty");
        report.color = "#ff0000";
        return report;
    }

    int score = 0;
    const std::size_t length = utf8_length(password);

    if (length >= 8) score += 10;
    else report.feedback.push_back("Password should be at least 8 characters (currently "
                                   + std::to_string(length) + ")");
    if (length >= 12) score += 10;
    if (length >= 16) score += 10;

    bool lower = false, upper = false, digit = false, special = false;
    for (char c : password) {
        auto ch = static_cast<unsigned char>(c);
        if (ch >= 'a' && ch <= 'z') lower = true;
        else if (ch >= 'A' && ch <= 'Z') upper = true;
        else if (ch >= '0' && ch <= '9') digit = true;
        else if (ch != 0 && std::strchr(kSpecials, c)) special = true;
    }

    if (lower) score += 15; else report.feedback.push_back("Add lowercase letters (a-z)");
    if (upper) score += 15; else report.feedback.push_back("Add uppercase letters (A-Z)");
    if (digit) score += 15; else report.feedback.push_back("Add numbers (0-9)");
    if (special) score += 15; else report.feedback.push_back("Add special characters (!@#$%^&*)");

    if (has_run_of_three(password)) {
        score -= 10;
        report.feedback.push_back("Avoid repeating characters");
    }
    if (has_sequence(password)) {
        score -= 5;
        report.feedback.push_back("Avoid sequential characters");
    }

    report.score = std::max(0, std::min(100, score));

    if (report.score < 20)      { report.level = StrengthLevel::VeryWeak; report.color = "#ff0000"; }
    else if (report.score < 40) { report.level = StrengthLevel::Weak;     report.color = "#ff6600"; }
    else if (report.score < 60) { report.level = StrengthLevel::Fair;     report.color = "#ffcc00"; }
    else if (report.score < 80) { report.level = StrengthLevel::Good;     report.color = "#99cc00"; }
    else                        { report.level = StrengthLevel::Strong;   report.color = "#00cc00"; }

    return report;
}

bool PasswordStrength::isAcceptable(const std::string& password, std::size_t minLength) {
    return utf8_length(password) >= minLength && score(password).score >= MIN_ACCEPTED_SCORE;
}

const char* PasswordStrength::levelName(StrengthLevel level) {
    switch (level) {
    case StrengthLevel::VeryWeak: return "Very Weak";
    case StrengthLevel::Weak:     return "Weak";
    case StrengthLevel::Fair:     return "Fair";
    case StrengthLevel::Good:     return "Good";
    case StrengthLevel::Strong:   return "Strong";
    }
    return "Very Weak";
}
