#include "promptwall/policy/PolicyTypes.hpp"
#include "promptwall/config/ConfigError.hpp"

#include <cmath>

namespace promptwall {

namespace {

void checkThreshold(const char* name, double v) {
    if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
        throw ConfigError(std::string(name) + " threshold must be within [0,1], got " + std::to_string(v));
    }
}

} // namespace

std::optional<PolicyAction> parsePolicyAction(const std::string& s) {
    if (s == "allow")      return PolicyAction::ALLOW;
    if (s == "warn")       return PolicyAction::WARN;
    if (s == "block")      return PolicyAction::BLOCK;
    if (s == "quarantine") return PolicyAction::QUARANTINE;
    return std::nullopt;
}

void PolicyThresholds::validate() const {
    checkThreshold("warn", warn);
    checkThreshold("block", block);
    checkThreshold("quarantine", quarantine);

    if (!(warn < block && block < quarantine)) {
        throw ConfigError("thresholds must satisfy warn < block < quarantine, got " +
                          std::to_string(warn) + " / " + std::to_string(block) + " / " +
                          std::to_string(quarantine));
    }
}

} // namespace promptwall
