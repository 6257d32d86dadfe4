#include "promptwall/rules/RuleEngine.hpp"

namespace promptwall {

namespace {

// Falls back to the rule's position when id() itself throws
std::string safeId(const Rule& rule, std::size_t index) {
    try {
        return rule.id();
    } catch (const std::exception&) {
        return "#" + std::to_string(index);
    }
}

} // namespace

RuleEngine::RuleEngine(std::vector<RulePtr> rules) {
    for (auto& r : rules) addRule(std::move(r));
}

void RuleEngine::addRule(RulePtr rule) {
    if (!rule) return;
    rules_.push_back(std::move(rule));
}

void RuleEngine::setSink(std::shared_ptr<DiagnosticSink> sink) {
    sink_ = sink ? std::move(sink) : nullSink();
}

std::vector<RuleEvidence> RuleEngine::evaluate(const NormalizedInput& input) const {
    std::vector<RuleEvidence> evidence;
    evidence.reserve(rules_.size());
    for (std::size_t i = 0; i < rules_.size(); ++i) {
        const Rule& rule = *rules_[i];
        try {
            evidence.push_back(promptwall::evaluate(rule, input));
        } catch (const std::exception& e) {
            const std::string id = safeId(rule, i);
            sink_->warn("rule " + id + " failed, counted as no match: " + e.what());
            evidence.push_back(RuleEvidence::miss(id));
        } catch (...) {
            const std::string id = safeId(rule, i);
            sink_->warn("rule " + id + " failed with a non-standard exception, counted as no match");
            evidence.push_back(RuleEvidence::miss(id));
        }
    }
    return evidence;
}

std::vector<RuleEngine::RulePtr> RuleEngine::rulesByCategory(RuleCategory category) const {
    std::vector<RulePtr> out;
    for (const auto& r : rules_) {
        if (r->category() == category) out.push_back(r);
    }
    return out;
}

} // namespace promptwall
