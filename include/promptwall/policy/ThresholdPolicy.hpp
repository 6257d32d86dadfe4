// =============================================================================
// ThresholdPolicy.hpp - default score -> action policy
// =============================================================================
// ORDER (first match wins):
//   1. confidence < 0.5 and risk > warn   -> WARN   (confidence gate)
//   2. risk >= quarantine                 -> QUARANTINE
//   3. risk >= block                      -> BLOCK
//   4. risk >= warn                       -> WARN
//   5.                                    -> ALLOW
//
// GUARANTEES:
//   - A low-confidence result is never escalated past WARN
//   - Thresholds are checked once, here, and never change afterwards
// =============================================================================
#pragma once

#include "promptwall/policy/Policy.hpp"

namespace promptwall {

class ThresholdPolicy final : public Policy {
public:
    static constexpr double CONFIDENCE_GATE = 0.5;

    // Throws ConfigError on invalid thresholds
    explicit ThresholdPolicy(PolicyThresholds thresholds = {});

    const std::string& id() const override { return id_; }
    const std::string& version() const override { return version_; }

    PolicyAction evaluate(double riskScore, double confidence) const override;
    PolicyThresholds thresholds() const override { return thresholds_; }

private:
    const std::string id_ = "default";
    const std::string version_ = "1.0.0";
    PolicyThresholds thresholds_;
};

} // namespace promptwall
