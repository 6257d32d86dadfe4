#include "promptwall/scoring/ScoringEngine.hpp"

#include <algorithm>
#include <cmath>

namespace promptwall {

namespace {

// NaN and infinities count as zero so the engine stays total
double finiteOrZero(double v) {
    return std::isfinite(v) ? v : 0.0;
}

double clamp01(double v) {
    return std::clamp(finiteOrZero(v), 0.0, 1.0);
}

double averageConfidence(const std::vector<Signal>& signals) {
    if (signals.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& s : signals) sum += finiteOrZero(s.confidence);
    return sum / static_cast<double>(signals.size());
}

bool isSevere(const RuleEvidence& ev) {
    return ev.effect && (ev.effect->severity == Severity::HIGH ||
                         ev.effect->severity == Severity::CRITICAL);
}

} // namespace

ScoringEngine::ScoringEngine(ScoringConfig config)
    : config_(config) {
    config_.validate();
}

ScoreResult ScoringEngine::calculate(const std::vector<RuleEvidence>& evidence,
                                     const std::vector<Signal>& signals) const {
    const bool hasRules = !evidence.empty();

    const double ruleScore = aggregateRuleScores(evidence);
    const double adjustment = signalAdjustment(signals, hasRules);

    ScoreResult r;
    r.riskScore = hasRules ? clamp01(ruleScore + adjustment) : clamp01(adjustment);
    r.confidence = clamp01(calculateConfidence(evidence, signals));
    return r;
}

double ScoringEngine::aggregateRuleScores(const std::vector<RuleEvidence>& evidence) const {
    double total = 0.0;
    for (const auto& ev : evidence) {
        if (ev.matched && ev.effect) total += finiteOrZero(ev.effect->score);
    }
    return clamp01(total);
}

double ScoringEngine::signalAdjustment(const std::vector<Signal>& signals, bool hasRules) const {
    if (signals.empty()) return 0.0;

    double weightedNovelty = 0.0;
    double totalConfidence = 0.0;
    for (const auto& s : signals) {
        const double c = finiteOrZero(s.confidence);
        weightedNovelty += finiteOrZero(s.noveltyScore) * c;
        totalConfidence += c;
    }
    if (totalConfidence == 0.0) return 0.0;

    const double avgNovelty = weightedNovelty / totalConfidence;
    const double weight = hasRules ? config_.signalWeightWithRules : config_.signalWeightNoRules;
    return avgNovelty * weight;
}

double ScoringEngine::calculateConfidence(const std::vector<RuleEvidence>& evidence,
                                          const std::vector<Signal>& signals) const {
    if (evidence.empty()) {
        // pure-signal deployment: trust the signals, or the baseline without any
        return signals.empty() ? BASELINE_CONFIDENCE : averageConfidence(signals);
    }

    const double signalPart = averageConfidence(signals) * config_.signalConfidenceWeight;

    const auto matched = std::count_if(evidence.begin(), evidence.end(),
                                       [](const RuleEvidence& ev) { return ev.matched; });
    if (matched == 0) {
        return BASELINE_CONFIDENCE + signalPart;
    }

    const auto severe = std::count_if(evidence.begin(), evidence.end(),
                                      [](const RuleEvidence& ev) { return ev.matched && isSevere(ev); });

    const double ruleConfidence = std::min(1.0, static_cast<double>(matched) * PER_MATCH_CONFIDENCE);
    const double severityBoost = std::min(MAX_SEVERITY_BOOST,
                                          static_cast<double>(severe) * PER_SEVERE_MATCH_BOOST);
    return ruleConfidence + severityBoost + signalPart;
}

} // namespace promptwall
