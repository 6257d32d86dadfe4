#include "promptwall/scoring/ScoringConfig.hpp"
#include "promptwall/config/ConfigError.hpp"

#include <cmath>

namespace promptwall {

namespace {

void checkWeight(const char* name, double v) {
    if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
        throw ConfigError(std::string(name) + " must be within [0,1], got " + std::to_string(v));
    }
}

} // namespace

void ScoringConfig::validate() const {
    checkWeight("signalWeightWithRules", signalWeightWithRules);
    checkWeight("signalWeightNoRules", signalWeightNoRules);
    checkWeight("signalConfidenceWeight", signalConfidenceWeight);
}

} // namespace promptwall
