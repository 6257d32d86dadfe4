#include "promptwall/rules/StructuralRules.hpp"

#include <algorithm>

namespace promptwall {
namespace rules {

// =============================================================================
// InstructionOverrideRule
// =============================================================================

InstructionOverrideRule::InstructionOverrideRule()
    : patterns_({
          R"(ignore\s+(previous|all|above|prior))",
          R"(forget\s+(everything|all|that|previous))",
          R"(disregard\s+(previous|all|above))",
          R"(delete\s+(your|the|all)\s+(instructions|prompt|system))",
          R"(you\s+are\s+now)",
          R"(new\s+instructions?:)",
          R"(system\s*:\s*ignore)",
      }, PatternSet::Case::INSENSITIVE) {}

bool InstructionOverrideRule::matches(const NormalizedInput& input) const {
    return patterns_.anyMatch(input.normalized);
}

RuleEffect InstructionOverrideRule::effect() const {
    return {0.4, "instruction-injection", Severity::HIGH};
}

std::string InstructionOverrideRule::explain(const NormalizedInput&) const {
    return "Instruction override pattern detected";
}

// =============================================================================
// ExcessiveNestingRule
// =============================================================================

bool ExcessiveNestingRule::matches(const NormalizedInput& input) const {
    int depth = 0;
    for (char32_t c : input.scalars) {
        if (c == U'(' || c == U'[' || c == U'{') {
            if (++depth > MAX_NESTING_DEPTH) return true;
        } else if (c == U')' || c == U']' || c == U'}') {
            depth = std::max(0, depth - 1);
        }
    }
    return false;
}

RuleEffect ExcessiveNestingRule::effect() const {
    return {0.15, "structural-anomaly", Severity::MEDIUM};
}

std::string ExcessiveNestingRule::explain(const NormalizedInput&) const {
    return "Excessive nesting detected (depth > " + std::to_string(MAX_NESTING_DEPTH) + ")";
}

} // namespace rules
} // namespace promptwall
