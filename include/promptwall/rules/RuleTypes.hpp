#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace promptwall {

enum class RuleCategory : uint8_t {
    STRUCTURAL = 0,
    LINGUISTIC = 1,
    ENCODING   = 2,
    CONTEXTUAL = 3
};

inline const char* ruleCategoryToString(RuleCategory c) {
    switch (c) {
        case RuleCategory::STRUCTURAL: return "structural";
        case RuleCategory::LINGUISTIC: return "linguistic";
        case RuleCategory::ENCODING:   return "encoding";
        case RuleCategory::CONTEXTUAL: return "contextual";
        default:                       return "unknown";
    }
}

// Ordinal: only feeds the confidence boost, never the additive score
enum class Severity : uint8_t {
    LOW      = 0,
    MEDIUM   = 1,
    HIGH     = 2,
    CRITICAL = 3
};

inline const char* severityToString(Severity s) {
    switch (s) {
        case Severity::LOW:      return "low";
        case Severity::MEDIUM:   return "medium";
        case Severity::HIGH:     return "high";
        case Severity::CRITICAL: return "critical";
        default:                 return "unknown";
    }
}

struct RuleEffect {
    double score = 0.0;
    std::string ruleClass;
    Severity severity = Severity::LOW;
};

// effect and explanation are set iff matched
struct RuleEvidence {
    std::string ruleId;
    bool matched = false;
    std::optional<RuleEffect> effect;
    std::optional<std::string> explanation;

    static RuleEvidence hit(std::string id, RuleEffect effect, std::string why) {
        RuleEvidence ev;
        ev.ruleId = std::move(id);
        ev.matched = true;
        ev.effect = std::move(effect);
        ev.explanation = std::move(why);
        return ev;
    }

    static RuleEvidence miss(std::string id) {
        RuleEvidence ev;
        ev.ruleId = std::move(id);
        return ev;
    }
};

} // namespace promptwall
