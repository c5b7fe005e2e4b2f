// tests/password_strength.cpp
#include <catch2/catch_all.hpp>
#include "PasswordStrength.hpp"

#include <algorithm>
#include <string>

static bool has_hint(const StrengthReport& r, const std::string& fragment) {
    return std::any_of(r.feedback.begin(), r.feedback.end(),
                       [&](const std::string& f) { return f.find(fragment) != std::string::npos; });
}

TEST_CASE("Strength: empty password", "[strength]") {
    const auto r = PasswordStrength::score("");
    REQUIRE(r.score == 0);
    REQUIRE(r.level == StrengthLevel::VeryWeak);
    REQUIRE(std::string(PasswordStrength::levelName(r.level)) == "Very Weak");
    REQUIRE(r.feedback.size() == 1);
}

TEST_CASE("Strength: rubric arithmetic", "[strength]") {
    SECTION("Four classes, 15 chars, one ascending run") {
        // 20 (length) + 60 (classes) - 5 ("123")
        const auto r = PasswordStrength::score("Str0ng!Pass1234");
        REQUIRE(r.score == 75);
        REQUIRE(r.level == StrengthLevel::Good);
        REQUIRE(has_hint(r, "sequential"));
    }
    SECTION("Long password with every class is Strong") {
        const auto r = PasswordStrength::score("Tr0ub4dor&3-Horse!");
        REQUIRE(r.score == 90);
        REQUIRE(r.level == StrengthLevel::Strong);
        REQUIRE(r.feedback.empty());
        REQUIRE(r.color == "#00cc00");
    }
    SECTION("Lower case only") {
        const auto r = PasswordStrength::score("password");
        REQUIRE(r.score == 25);
        REQUIRE(r.level == StrengthLevel::Weak);
        REQUIRE(has_hint(r, "uppercase"));
        REQUIRE(has_hint(r, "numbers"));
        REQUIRE(has_hint(r, "special"));
    }
    SECTION("Repeats are penalised") {
        const auto r = PasswordStrength::score("aaaaaaaa");
        REQUIRE(r.score == 15);
        REQUIRE(r.level == StrengthLevel::VeryWeak);
        REQUIRE(has_hint(r, "repeating"));
    }
    SECTION("Sequences are matched case-insensitively") {
        REQUIRE(PasswordStrength::score("xABCx").score == PasswordStrength::score("xQRSx").score - 5);
    }
    SECTION("Length is counted in characters") {
        const auto r = PasswordStrength::score("\xC3\xA4\xC3\xB6\xC3\xBC");  // three umlauts
        REQUIRE(has_hint(r, "currently 3"));
    }
    SECTION("Repeats are matched per character, not per byte") {
        const auto ascii = PasswordStrength::score("Ab1!xyzwQQQ");
        const auto accented = PasswordStrength::score("Ab1!xyzw\xC3\xA9\xC3\xA9\xC3\xA9");  // e-acute x3
        REQUIRE(ascii.score == 60);
        REQUIRE(accented.score == 60);
        REQUIRE(has_hint(accented, "repeating"));
        REQUIRE_FALSE(has_hint(PasswordStrength::score("Ab1!xyzw\xC3\xA9\xC3\xA8\xC3\xA9"), "repeating"));
    }
}

TEST_CASE("Strength: acceptance gate", "[strength]") {
    REQUIRE(PasswordStrength::isAcceptable("Ab1!xyzw"));         // 8 chars, 70
    REQUIRE(PasswordStrength::isAcceptable("Str0ng!Pass1234"));
    REQUIRE_FALSE(PasswordStrength::isAcceptable("Ab1!"));        // score 60, too short
    REQUIRE_FALSE(PasswordStrength::isAcceptable("alllower123")); // 35
    REQUIRE_FALSE(PasswordStrength::isAcceptable("Ab1!xyzw", 12));
}
