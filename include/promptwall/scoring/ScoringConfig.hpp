#pragma once

#include <string>

namespace promptwall {

// Signal influence knobs. Validated once when a ScoringEngine is built.
struct ScoringConfig {
    static constexpr double DEFAULT_SIGNAL_WEIGHT_WITH_RULES  = 0.2;
    static constexpr double DEFAULT_SIGNAL_WEIGHT_NO_RULES    = 1.0;
    static constexpr double DEFAULT_SIGNAL_CONFIDENCE_WEIGHT  = 0.2;

    // Cap on novelty influence when local rules exist
    double signalWeightWithRules = DEFAULT_SIGNAL_WEIGHT_WITH_RULES;
    // Pure-signal deployment (no rules registered)
    double signalWeightNoRules = DEFAULT_SIGNAL_WEIGHT_NO_RULES;
    // Share of average signal confidence added to rule confidence
    double signalConfidenceWeight = DEFAULT_SIGNAL_CONFIDENCE_WEIGHT;

    // Throws ConfigError if any weight is non-finite or outside [0,1]
    void validate() const;
};

} // namespace promptwall
