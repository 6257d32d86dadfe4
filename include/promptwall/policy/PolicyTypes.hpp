#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace promptwall {

enum class PolicyAction : uint8_t {
    ALLOW      = 0,
    WARN       = 1,
    BLOCK      = 2,
    QUARANTINE = 3
};

inline const char* policyActionToString(PolicyAction a) {
    switch (a) {
        case PolicyAction::ALLOW:      return "allow";
        case PolicyAction::WARN:       return "warn";
        case PolicyAction::BLOCK:      return "block";
        case PolicyAction::QUARANTINE: return "quarantine";
        default:                       return "unknown";
    }
}

std::optional<PolicyAction> parsePolicyAction(const std::string& s);

struct PolicyThresholds {
    static constexpr double DEFAULT_WARN       = 0.3;
    static constexpr double DEFAULT_BLOCK      = 0.7;
    static constexpr double DEFAULT_QUARANTINE = 0.9;

    double warn = DEFAULT_WARN;
    double block = DEFAULT_BLOCK;
    double quarantine = DEFAULT_QUARANTINE;

    // Throws ConfigError unless 0 <= warn < block < quarantine <= 1
    void validate() const;
};

} // namespace promptwall
