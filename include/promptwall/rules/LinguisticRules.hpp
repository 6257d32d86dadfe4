#pragma once

#include "promptwall/rules/Rule.hpp"

#include <cstdint>

namespace promptwall {
namespace rules {

enum class Script : uint8_t {
    LATIN    = 0,
    CYRILLIC = 1,
    ARABIC   = 2,
    CHINESE  = 3,
    JAPANESE = 4,
    KOREAN   = 5,
    OTHER    = 255
};

Script scriptOf(char32_t c);

// More than MAX_SCRIPTS script families in a short text
class LanguageSwitchingRule final : public Rule {
public:
    static constexpr std::size_t MAX_SCRIPTS = 3;
    static constexpr std::size_t SHORT_TEXT_LENGTH = 500;

    const std::string& id() const override { return id_; }
    const std::string& description() const override { return description_; }
    const std::string& version() const override { return version_; }
    RuleCategory category() const override { return RuleCategory::LINGUISTIC; }

    bool matches(const NormalizedInput& input) const override;
    RuleEffect effect() const override;
    std::string explain(const NormalizedInput& input) const override;

private:
    const std::string id_ = "linguistic.language-switching";
    const std::string description_ = "Detects rapid switching between languages";
    const std::string version_ = "1.0.0";
};

// Share of characters that are neither ASCII word chars nor whitespace
class SpecialCharacterDensityRule final : public Rule {
public:
    static constexpr double DENSITY_THRESHOLD = 0.3;

    const std::string& id() const override { return id_; }
    const std::string& description() const override { return description_; }
    const std::string& version() const override { return version_; }
    RuleCategory category() const override { return RuleCategory::LINGUISTIC; }

    bool matches(const NormalizedInput& input) const override;
    RuleEffect effect() const override;
    std::string explain(const NormalizedInput& input) const override;

private:
    const std::string id_ = "linguistic.special-character-density";
    const std::string description_ = "Detects excessive use of special characters";
    const std::string version_ = "1.0.0";
};

} // namespace rules
} // namespace promptwall
