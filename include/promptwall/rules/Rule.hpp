// =============================================================================
// Rule.hpp - detection rule capability
// =============================================================================
// A rule is identity + pure predicate + fixed effect. Implementations are
// stateless, built once, shared by every evaluation (and every thread).
//
// RULES MUST NOT:
//   - read external state, the clock, or other rules
//   - mutate anything
//   - throw from matches()
//
// evaluate(rule, input) turns the predicate into evidence the same way for
// every rule; implementations never build RuleEvidence themselves.
// =============================================================================
#pragma once

#include "promptwall/normalize/NormalizedInput.hpp"
#include "promptwall/rules/RuleTypes.hpp"

#include <string>

namespace promptwall {

class Rule {
public:
    virtual ~Rule() = default;

    virtual const std::string& id() const = 0;
    virtual const std::string& description() const = 0;
    virtual const std::string& version() const = 0;
    virtual RuleCategory category() const = 0;

    virtual bool matches(const NormalizedInput& input) const = 0;
    virtual RuleEffect effect() const = 0;

    // Default: "Rule <id> matched: <description>"
    virtual std::string explain(const NormalizedInput& input) const;
};

RuleEvidence evaluate(const Rule& rule, const NormalizedInput& input);

} // namespace promptwall
