#include "promptwall/rules/Rule.hpp"

namespace promptwall {

std::string Rule::explain(const NormalizedInput&) const {
    return "Rule " + id() + " matched: " + description();
}

RuleEvidence evaluate(const Rule& rule, const NormalizedInput& input) {
    if (!rule.matches(input)) {
        return RuleEvidence::miss(rule.id());
    }
    return RuleEvidence::hit(rule.id(), rule.effect(), rule.explain(input));
}

} // namespace promptwall
