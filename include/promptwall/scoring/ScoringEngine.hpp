// =============================================================================
// ScoringEngine.hpp - rule evidence + bounded signals -> (risk, confidence)
// =============================================================================
// RULES ARE ADDITIVE:
//   ruleScore = clamp(sum of matched effect scores)
//
// SIGNALS ARE BOUNDED:
//   adjustment = confidence-weighted novelty * W
//   W = signalWeightWithRules  when any rule was evaluated
//   W = signalWeightNoRules    in a pure-signal deployment
//
// A model cannot force a block on its own while rules are present.
//
// calculate() is total: any evidence / signal list gives values in [0,1].
// =============================================================================
#pragma once

#include "promptwall/rules/RuleTypes.hpp"
#include "promptwall/scoring/ScoringConfig.hpp"
#include "promptwall/signal/SignalTypes.hpp"

#include <vector>

namespace promptwall {

struct ScoreResult {
    double riskScore = 0.0;
    double confidence = 0.0;
};

class ScoringEngine {
public:
    static constexpr double BASELINE_CONFIDENCE     = 0.3;
    static constexpr double PER_MATCH_CONFIDENCE    = 0.2;
    static constexpr double PER_SEVERE_MATCH_BOOST  = 0.1;
    static constexpr double MAX_SEVERITY_BOOST      = 0.3;

    // Throws ConfigError on out-of-range weights
    explicit ScoringEngine(ScoringConfig config = {});

    ScoreResult calculate(const std::vector<RuleEvidence>& evidence,
                          const std::vector<Signal>& signals = {}) const;

    const ScoringConfig& config() const { return config_; }

private:
    double aggregateRuleScores(const std::vector<RuleEvidence>& evidence) const;
    double signalAdjustment(const std::vector<Signal>& signals, bool hasRules) const;
    double calculateConfidence(const std::vector<RuleEvidence>& evidence,
                               const std::vector<Signal>& signals) const;

    ScoringConfig config_;
};

} // namespace promptwall
