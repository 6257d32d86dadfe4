// =============================================================================
// Decision.hpp - the firewall's only output
// =============================================================================
// Returned by value to the caller; the firewall keeps no copy.
//
// JSON SHAPE:
//   { "action", "riskScore", "confidence", "explanation",
//     "evidence": [{ "ruleId", "matched", "effect"?, "explanation"? }],
//     "signals"?: [{ "noveltyScore", "predictedClasses", "confidence", "modelId" }],
//     "timestamp", "version" }
// =============================================================================
#pragma once

#include "promptwall/policy/PolicyTypes.hpp"
#include "promptwall/rules/RuleTypes.hpp"
#include "promptwall/signal/SignalTypes.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <vector>

namespace promptwall {

struct Decision {
    PolicyAction action = PolicyAction::ALLOW;
    double riskScore = 0.0;
    double confidence = 0.0;
    std::string explanation;
    std::vector<RuleEvidence> evidence;
    std::optional<std::vector<Signal>> signals;   // absent when no provider ran
    std::string timestamp;                        // ISO-8601 UTC
    std::string version;

    std::vector<RuleEvidence> matchedEvidence() const;

    nlohmann::json toJson() const;
    std::string toJsonString(int indent = -1) const;

    void print() const;
};

// ISO-8601 UTC with milliseconds, e.g. 2026-10-19T08:15:02.417Z
std::string currentTimestamp();

void to_json(nlohmann::json& j, const RuleEffect& e);
void to_json(nlohmann::json& j, const RuleEvidence& ev);
void to_json(nlohmann::json& j, const Signal& s);
void to_json(nlohmann::json& j, const Decision& d);

} // namespace promptwall
