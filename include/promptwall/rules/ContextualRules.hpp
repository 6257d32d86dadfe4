#pragma once

#include "promptwall/rules/PatternSet.hpp"
#include "promptwall/rules/Rule.hpp"

namespace promptwall {
namespace rules {

class PersonaInjectionRule final : public Rule {
public:
    PersonaInjectionRule();

    const std::string& id() const override { return id_; }
    const std::string& description() const override { return description_; }
    const std::string& version() const override { return version_; }
    RuleCategory category() const override { return RuleCategory::CONTEXTUAL; }

    bool matches(const NormalizedInput& input) const override;
    RuleEffect effect() const override;
    std::string explain(const NormalizedInput& input) const override;

private:
    const std::string id_ = "contextual.persona-injection";
    const std::string description_ = "Detects attempts to inject personas or roles";
    const std::string version_ = "1.0.0";
    PatternSet patterns_;
};

// File/command verbs, traversal, Unix and Windows paths, exec family keywords
class SystemAccessRule final : public Rule {
public:
    SystemAccessRule();

    const std::string& id() const override { return id_; }
    const std::string& description() const override { return description_; }
    const std::string& version() const override { return version_; }
    RuleCategory category() const override { return RuleCategory::CONTEXTUAL; }

    bool matches(const NormalizedInput& input) const override;
    RuleEffect effect() const override;
    std::string explain(const NormalizedInput& input) const override;

private:
    const std::string id_ = "contextual.system-access";
    const std::string description_ = "Detects attempts to access system resources";
    const std::string version_ = "1.0.0";
    PatternSet patterns_;
};

} // namespace rules
} // namespace promptwall
