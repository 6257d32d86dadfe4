// =============================================================================
// Firewall.hpp - six-stage evaluation pipeline
// =============================================================================
// PURPOSE: Sequence the components. No rule or scoring logic lives here.
//
// PIPELINE (order fixed):
//   1. normalize            Normalizer
//   2. evaluate rules       RuleEngine (sync, registration order)
//   3. gather signals       enabled providers, concurrently on pool_
//   4. score                ScoringEngine
//   5. decide               Policy
//   6. explain              text summary
//
// GUARANTEES:
//   - evaluate() never throws because of a provider: a provider that throws
//     or returns an invalid signal is replaced by a neutral signal, reported
//     in Decision.signals and to the sink, and left out of scoring
//   - A failing provider scores exactly like a disabled one
//   - No state is shared between evaluate() calls
//
// USAGE:
//   promptwall::Firewall fw(promptwall::makeDefaultParts(config));
//   auto d = fw.evaluate(prompt, {Role::USER, Channel::INPUT});
//   if (d.action == PolicyAction::BLOCK) ...
// =============================================================================
#pragma once

#include "promptwall/Version.hpp"
#include "promptwall/config/FirewallConfig.hpp"
#include "promptwall/diag/DiagnosticSink.hpp"
#include "promptwall/firewall/Decision.hpp"
#include "promptwall/normalize/Normalizer.hpp"
#include "promptwall/policy/Policy.hpp"
#include "promptwall/rules/RuleEngine.hpp"
#include "promptwall/scoring/ScoringEngine.hpp"
#include "promptwall/signal/IntelligenceProvider.hpp"

#include <boost/asio/thread_pool.hpp>

#include <memory>
#include <string>
#include <vector>

namespace promptwall {

using ProviderPtr = std::shared_ptr<const IntelligenceProvider>;

struct FirewallParts {
    RuleEngine rules;
    std::shared_ptr<const Policy> policy;           // required
    std::vector<ProviderPtr> providers;
    ScoringConfig scoring;
    std::shared_ptr<DiagnosticSink> sink = nullSink();
    std::string version = PROMPTWALL_VERSION;
    std::size_t workerThreads = 0;                  // 0 = one per provider, capped
};

// Built-in rules + ThresholdPolicy from the config. Throws ConfigError.
FirewallParts makeDefaultParts(const FirewallConfig& config,
                               std::shared_ptr<DiagnosticSink> sink = nullSink());

class Firewall {
public:
    static constexpr std::size_t MAX_DEFAULT_WORKERS = 8;

    // Throws ConfigError when the policy is missing or the scoring
    // weights are out of range
    explicit Firewall(FirewallParts parts);
    ~Firewall();

    Firewall(const Firewall&) = delete;
    Firewall& operator=(const Firewall&) = delete;

    Decision evaluate(const std::string& prompt,
                      const Context& context = {},
                      const PartialMetadata& metadata = {}) const;

    const RuleEngine& rules() const { return rules_; }
    const Policy& policy() const { return *policy_; }
    const std::vector<ProviderPtr>& providers() const { return providers_; }
    const std::string& version() const { return version_; }

private:
    struct SignalOutcome {
        Signal signal;
        std::string failure;    // empty when the signal is usable
    };

    std::vector<ProviderPtr> enabledProviders() const;

    std::vector<SignalOutcome> gatherSignals(const std::vector<ProviderPtr>& providers,
                                             const NormalizedInput& input,
                                             const Context& context,
                                             const Metadata& metadata) const;

    static std::string buildExplanation(const std::vector<RuleEvidence>& evidence,
                                        const std::vector<Signal>& signals,
                                        const ScoreResult& score,
                                        PolicyAction action);

    Normalizer normalizer_;
    RuleEngine rules_;
    std::shared_ptr<const Policy> policy_;
    std::vector<ProviderPtr> providers_;
    ScoringEngine scoring_;
    std::shared_ptr<DiagnosticSink> sink_;
    std::string version_;

    mutable boost::asio::thread_pool pool_;
};

} // namespace promptwall
