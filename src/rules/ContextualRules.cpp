#include "promptwall/rules/ContextualRules.hpp"

namespace promptwall {
namespace rules {

PersonaInjectionRule::PersonaInjectionRule()
    : patterns_({
          R"(you\s+are\s+(a|an)\s+[a-z]+)",
          R"(act\s+as\s+(a|an|the)\s+[a-z]+)",
          R"(pretend\s+to\s+be)",
          R"(roleplay\s+as)",
          R"(from\s+now\s+on\s+you)",
      }, PatternSet::Case::INSENSITIVE) {}

bool PersonaInjectionRule::matches(const NormalizedInput& input) const {
    return patterns_.anyMatch(input.normalized);
}

RuleEffect PersonaInjectionRule::effect() const {
    return {0.35, "persona-injection", Severity::HIGH};
}

std::string PersonaInjectionRule::explain(const NormalizedInput&) const {
    return "Persona or role injection pattern detected";
}

SystemAccessRule::SystemAccessRule()
    : patterns_({
          R"((read|open|access|readfile|cat|type)\s+(file|directory|path|system))",
          R"((\.\./|\.\.\\|\.\./\.\.))",          // path traversal
          R"((etc/passwd|proc/|sys/|dev/))",      // unix system paths
          R"((c:\\|c:/|%[a-z]+%))",               // windows paths, env vars
          R"((eval|exec|system|shell|command))",
      }, PatternSet::Case::INSENSITIVE) {}

bool SystemAccessRule::matches(const NormalizedInput& input) const {
    return patterns_.anyMatch(input.normalized);
}

RuleEffect SystemAccessRule::effect() const {
    return {0.5, "system-access-attempt", Severity::CRITICAL};
}

std::string SystemAccessRule::explain(const NormalizedInput&) const {
    return "System access or command execution pattern detected";
}

} // namespace rules
} // namespace promptwall
