#pragma once
#include <cstddef>
#include <string>
#include <vector>

enum class StrengthLevel { VeryWeak, Weak, Fair, Good, Strong };

struct StrengthReport {
    int score = 0;                      // 0..100
    StrengthLevel level = StrengthLevel::VeryWeak;
    std::vector<std::string> feedback;  // ordered hints for the user
    std::string color;                  // "#rrggbb" hint for the meter
};

// Additive rubric used to gate master passwords.
class PasswordStrength {
public:
    static constexpr std::size_t MIN_LENGTH = 8;
    static constexpr int MIN_ACCEPTED_SCORE = 60;

    static StrengthReport score(const std::string& password);

    // length >= minLength && score >= MIN_ACCEPTED_SCORE
    static bool isAcceptable(const std::string& password, std::size_t minLength = MIN_LENGTH);

    static const char* levelName(StrengthLevel level);
};
