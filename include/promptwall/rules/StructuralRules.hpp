#pragma once

#include "promptwall/rules/PatternSet.hpp"
#include "promptwall/rules/Rule.hpp"

namespace promptwall {
namespace rules {

// "ignore previous", "forget everything", "you are now", "new instructions:" ...
class InstructionOverrideRule final : public Rule {
public:
    InstructionOverrideRule();

    const std::string& id() const override { return id_; }
    const std::string& description() const override { return description_; }
    const std::string& version() const override { return version_; }
    RuleCategory category() const override { return RuleCategory::STRUCTURAL; }

    bool matches(const NormalizedInput& input) const override;
    RuleEffect effect() const override;
    std::string explain(const NormalizedInput& input) const override;

private:
    const std::string id_ = "structural.instruction-override";
    const std::string description_ = "Detects attempts to override system instructions";
    const std::string version_ = "1.0.0";
    PatternSet patterns_;
};

// Bracket depth over ([{ / )]} as one counter, floored at zero
class ExcessiveNestingRule final : public Rule {
public:
    static constexpr int MAX_NESTING_DEPTH = 5;

    const std::string& id() const override { return id_; }
    const std::string& description() const override { return description_; }
    const std::string& version() const override { return version_; }
    RuleCategory category() const override { return RuleCategory::STRUCTURAL; }

    bool matches(const NormalizedInput& input) const override;
    RuleEffect effect() const override;
    std::string explain(const NormalizedInput& input) const override;

private:
    const std::string id_ = "structural.excessive-nesting";
    const std::string description_ = "Detects excessive nesting of brackets or parentheses";
    const std::string version_ = "1.0.0";
};

} // namespace rules
} // namespace promptwall
