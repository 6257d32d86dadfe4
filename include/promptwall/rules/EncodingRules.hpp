#pragma once

#include "promptwall/rules/Rule.hpp"

namespace promptwall {
namespace rules {

// Cyrillic block, General Punctuation (zero-width, bidi controls), BOM
class HomoglyphRule final : public Rule {
public:
    const std::string& id() const override { return id_; }
    const std::string& description() const override { return description_; }
    const std::string& version() const override { return version_; }
    RuleCategory category() const override { return RuleCategory::ENCODING; }

    bool matches(const NormalizedInput& input) const override;
    RuleEffect effect() const override;
    std::string explain(const NormalizedInput& input) const override;

    static bool isSuspicious(char32_t c);

private:
    const std::string id_ = "encoding.homoglyph";
    const std::string description_ = "Detects Unicode homoglyph characters";
    const std::string version_ = "1.0.0";
};

// Replacement char, C0 controls (other than tab / LF / CR), BOM
class MixedEncodingRule final : public Rule {
public:
    const std::string& id() const override { return id_; }
    const std::string& description() const override { return description_; }
    const std::string& version() const override { return version_; }
    RuleCategory category() const override { return RuleCategory::ENCODING; }

    bool matches(const NormalizedInput& input) const override;
    RuleEffect effect() const override;
    std::string explain(const NormalizedInput& input) const override;

    static bool isAnomaly(char32_t c);

private:
    const std::string id_ = "encoding.mixed";
    const std::string description_ = "Detects mixed encoding indicators";
    const std::string version_ = "1.0.0";
};

} // namespace rules
} // namespace promptwall
