#include "promptwall/policy/ThresholdPolicy.hpp"

namespace promptwall {

ThresholdPolicy::ThresholdPolicy(PolicyThresholds thresholds)
    : thresholds_(thresholds) {
    thresholds_.validate();
}

PolicyAction ThresholdPolicy::evaluate(double riskScore, double confidence) const {
    // =========================================================================
    // CONFIDENCE GATE
    // =========================================================================
    if (confidence < CONFIDENCE_GATE && riskScore > thresholds_.warn) {
        return PolicyAction::WARN;
    }

    // =========================================================================
    // MAGNITUDE LADDER
    // =========================================================================
    if (riskScore >= thresholds_.quarantine) return PolicyAction::QUARANTINE;
    if (riskScore >= thresholds_.block)      return PolicyAction::BLOCK;
    if (riskScore >= thresholds_.warn)       return PolicyAction::WARN;

    return PolicyAction::ALLOW;
}

} // namespace promptwall
