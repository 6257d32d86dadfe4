#pragma once

#include "promptwall/diag/DiagnosticSink.hpp"
#include "promptwall/rules/Rule.hpp"

#include <memory>
#include <vector>

namespace promptwall {

// Ordered, flat rule collection. Order only affects evidence order,
// never the score (scoring is additive).
// A rule that throws is recorded as a miss and reported through the sink;
// the remaining rules still run.
class RuleEngine {
public:
    using RulePtr = std::shared_ptr<const Rule>;

    RuleEngine() = default;
    explicit RuleEngine(std::vector<RulePtr> rules);

    void addRule(RulePtr rule);

    // Null resets to the shared no-op sink
    void setSink(std::shared_ptr<DiagnosticSink> sink);

    std::vector<RuleEvidence> evaluate(const NormalizedInput& input) const;

    const std::vector<RulePtr>& rules() const { return rules_; }
    std::vector<RulePtr> rulesByCategory(RuleCategory category) const;

    std::size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

private:
    std::vector<RulePtr> rules_;
    std::shared_ptr<DiagnosticSink> sink_ = nullSink();
};

} // namespace promptwall
