#include "promptwall/firewall/Decision.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace promptwall {

using json = nlohmann::json;

std::vector<RuleEvidence> Decision::matchedEvidence() const {
    std::vector<RuleEvidence> out;
    for (const auto& ev : evidence) {
        if (ev.matched) out.push_back(ev);
    }
    return out;
}

json Decision::toJson() const {
    json j;
    to_json(j, *this);
    return j;
}

std::string Decision::toJsonString(int indent) const {
    return toJson().dump(indent);
}

// =========================================================================
// PRINT TO CONSOLE
// =========================================================================
void Decision::print() const {
    printf("\n╔══════════════════════════════════════════════════════════════╗\n");
    printf("║  PROMPT FIREWALL DECISION                                     ║\n");
    printf("╠══════════════════════════════════════════════════════════════╣\n");
    printf("║  Action:     %-12s                                     ║\n", policyActionToString(action));
    printf("║  Risk:       %5.1f%%                                           ║\n", riskScore * 100.0);
    printf("║  Confidence: %5.1f%%                                           ║\n", confidence * 100.0);
    printf("╠══════════════════════════════════════════════════════════════╣\n");

    const auto matched = matchedEvidence();
    if (matched.empty()) {
        printf("║  Rules:      none matched\n");
    }
    for (const auto& ev : matched) {
        printf("║  [%-8s] %s (+%.2f)\n",
               ev.effect ? severityToString(ev.effect->severity) : "-",
               ev.ruleId.c_str(),
               ev.effect ? ev.effect->score : 0.0);
    }

    if (signals) {
        for (const auto& s : *signals) {
            printf("║  signal %s: novelty=%.2f confidence=%.2f\n",
                   s.modelId.c_str(), s.noveltyScore, s.confidence);
        }
    }

    printf("╠══════════════════════════════════════════════════════════════╣\n");
    printf("║  %s  v%s\n", timestamp.c_str(), version.c_str());
    printf("╚══════════════════════════════════════════════════════════════╝\n\n");
}

std::string currentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch()).count() % 1000;
    const std::time_t t = std::chrono::system_clock::to_time_t(now);

    std::tm tm{};
    gmtime_r(&t, &tm);

    char date[32];
    if (std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm) == 0) {
        throw std::runtime_error("timestamp formatting failed");
    }

    char millis[16];
    std::snprintf(millis, sizeof(millis), ".%03dZ", static_cast<int>(ms));
    return std::string(date) + millis;
}

// =========================================================================
// JSON SERIALIZATION
// =========================================================================

void to_json(json& j, const RuleEffect& e) {
    j = json{
        {"score", e.score},
        {"class", e.ruleClass},
        {"severity", severityToString(e.severity)}
    };
}

void to_json(json& j, const RuleEvidence& ev) {
    j = json{
        {"ruleId", ev.ruleId},
        {"matched", ev.matched}
    };
    if (ev.effect) j["effect"] = *ev.effect;
    if (ev.explanation) j["explanation"] = *ev.explanation;
}

void to_json(json& j, const Signal& s) {
    j = json{
        {"noveltyScore", s.noveltyScore},
        {"predictedClasses", s.predictedClasses},
        {"confidence", s.confidence},
        {"modelId", s.modelId}
    };
}

void to_json(json& j, const Decision& d) {
    j = json{
        {"action", policyActionToString(d.action)},
        {"riskScore", d.riskScore},
        {"confidence", d.confidence},
        {"explanation", d.explanation},
        {"evidence", d.evidence},
        {"timestamp", d.timestamp},
        {"version", d.version}
    };
    if (d.signals) j["signals"] = *d.signals;
}

} // namespace promptwall
