#include "promptwall/firewall/Firewall.hpp"
#include "promptwall/config/ConfigError.hpp"
#include "promptwall/policy/ThresholdPolicy.hpp"
#include "promptwall/rules/BuiltinRules.hpp"
#include "promptwall/signal/MetadataComputer.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <cstdio>
#include <future>
#include <sstream>

namespace promptwall {

namespace asio = boost::asio;

namespace {

std::shared_ptr<const Policy> requirePolicy(std::shared_ptr<const Policy> policy) {
    if (!policy) {
        throw ConfigError("firewall requires a policy");
    }
    return policy;
}

std::vector<ProviderPtr> dropNull(std::vector<ProviderPtr> providers) {
    providers.erase(std::remove(providers.begin(), providers.end(), nullptr),
                    providers.end());
    return providers;
}

std::size_t workerCount(std::size_t requested, std::size_t providers) {
    if (requested > 0) return requested;
    return std::max<std::size_t>(1, std::min(providers, Firewall::MAX_DEFAULT_WORKERS));
}

std::string percent(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", v * 100.0);
    return buf;
}

// Immutable inputs shared by every provider task of one evaluate() call
struct Snapshot {
    NormalizedInput input;
    Context context;
    Metadata metadata;
};

} // namespace

FirewallParts makeDefaultParts(const FirewallConfig& config,
                               std::shared_ptr<DiagnosticSink> sink) {
    FirewallParts parts;
    parts.rules = rules::makeBuiltinRuleEngine();
    parts.policy = std::make_shared<ThresholdPolicy>(config.thresholds);
    parts.scoring = config.scoring;
    parts.sink = sink ? std::move(sink) : nullSink();
    return parts;
}

Firewall::Firewall(FirewallParts parts)
    : rules_(std::move(parts.rules))
    , policy_(requirePolicy(std::move(parts.policy)))
    , providers_(dropNull(std::move(parts.providers)))
    , scoring_(parts.scoring)
    , sink_(parts.sink ? std::move(parts.sink) : nullSink())
    , version_(std::move(parts.version))
    , pool_(workerCount(parts.workerThreads, providers_.size())) {
    rules_.setSink(sink_);
}

Firewall::~Firewall() {
    pool_.join();
}

Decision Firewall::evaluate(const std::string& prompt,
                            const Context& context,
                            const PartialMetadata& metadata) const {
    // =========================================================================
    // 1. NORMALIZE
    // =========================================================================
    NormalizedInput input = normalizer_.normalize(prompt);

    // =========================================================================
    // 2. RULES
    // =========================================================================
    std::vector<RuleEvidence> evidence = rules_.evaluate(input);

    // =========================================================================
    // 3. SIGNALS
    // =========================================================================
    std::optional<std::vector<Signal>> reported;
    std::vector<Signal> scored;

    const auto active = enabledProviders();
    if (!active.empty()) {
        const Metadata completed = MetadataComputer::complete(metadata, input);
        auto outcomes = gatherSignals(active, input, context, completed);

        reported.emplace();
        reported->reserve(outcomes.size());
        for (auto& o : outcomes) {
            if (o.failure.empty()) {
                scored.push_back(o.signal);
            } else {
                sink_->warn("provider " + o.signal.modelId + " failed, neutral signal used: " +
                            o.failure);
            }
            reported->push_back(std::move(o.signal));
        }
    }

    // =========================================================================
    // 4. SCORE / 5. DECIDE
    // =========================================================================
    const ScoreResult score = scoring_.calculate(evidence, scored);
    const PolicyAction action = policy_->evaluate(score.riskScore, score.confidence);

    // =========================================================================
    // 6. EXPLAIN
    // =========================================================================
    Decision d;
    d.action = action;
    d.riskScore = score.riskScore;
    d.confidence = score.confidence;
    d.explanation = buildExplanation(evidence,
                                     reported ? *reported : std::vector<Signal>{},
                                     score, action);
    d.evidence = std::move(evidence);
    d.signals = std::move(reported);
    d.timestamp = currentTimestamp();
    d.version = version_;
    return d;
}

std::vector<ProviderPtr> Firewall::enabledProviders() const {
    std::vector<ProviderPtr> out;
    for (const auto& p : providers_) {
        try {
            if (p->enabled()) out.push_back(p);
        } catch (const std::exception& e) {
            sink_->warn("provider enabled() check failed, skipping: " + std::string(e.what()));
        }
    }
    return out;
}

std::vector<Firewall::SignalOutcome>
Firewall::gatherSignals(const std::vector<ProviderPtr>& providers,
                        const NormalizedInput& input,
                        const Context& context,
                        const Metadata& metadata) const {
    auto snap = std::make_shared<const Snapshot>(Snapshot{input, context, metadata});

    std::vector<std::future<SignalOutcome>> pending;
    pending.reserve(providers.size());

    for (const auto& provider : providers) {
        std::string id;
        try {
            id = provider->id();
        } catch (const std::exception& e) {
            id = "unknown";
            sink_->warn("provider id() failed: " + std::string(e.what()));
        }

        auto task = std::make_shared<std::packaged_task<SignalOutcome()>>(
            [provider, snap, id]() -> SignalOutcome {
                try {
                    Signal s = provider->analyze(snap->input, snap->context, snap->metadata);
                    const std::string problem = validateSignal(s);
                    if (!problem.empty()) {
                        return {neutralSignal(id), "invalid signal: " + problem};
                    }
                    return {std::move(s), {}};
                } catch (const std::exception& e) {
                    return {neutralSignal(id), e.what()};
                } catch (...) {
                    return {neutralSignal(id), "non-standard exception"};
                }
            });

        pending.push_back(task->get_future());
        asio::post(pool_, [task]() { (*task)(); });
    }

    // Join on every task; order of completion does not matter
    std::vector<SignalOutcome> outcomes;
    outcomes.reserve(pending.size());
    for (auto& f : pending) {
        outcomes.push_back(f.get());
    }
    return outcomes;
}

std::string Firewall::buildExplanation(const std::vector<RuleEvidence>& evidence,
                                       const std::vector<Signal>& signals,
                                       const ScoreResult& score,
                                       PolicyAction action) {
    std::vector<std::string> lines;
    lines.push_back("Risk score: " + percent(score.riskScore));
    lines.push_back("Confidence: " + percent(score.confidence));
    lines.push_back(std::string("Action: ") + policyActionToString(action));

    std::vector<const RuleEvidence*> matched;
    for (const auto& ev : evidence) {
        if (ev.matched) matched.push_back(&ev);
    }

    if (!matched.empty()) {
        lines.push_back("\nMatched " + std::to_string(matched.size()) + " rule(s):");
        for (const auto* ev : matched) {
            lines.push_back("  - " + ev->explanation.value_or(ev->ruleId));
        }
    }

    if (!signals.empty()) {
        lines.push_back("\nIntelligence signals: " + std::to_string(signals.size()));
        for (const auto& s : signals) {
            lines.push_back("  - " + s.modelId + ": novelty=" + percent(s.noveltyScore) +
                            ", confidence=" + percent(s.confidence));
        }
    }

    std::ostringstream out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i) out << '\n';
        out << lines[i];
    }
    return out.str();
}

} // namespace promptwall
