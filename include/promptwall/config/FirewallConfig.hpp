// =============================================================================
// FirewallConfig.hpp - scoring weights + policy thresholds
// =============================================================================
// SOURCES (later wins):
//   1. built-in defaults
//   2. JSON file      { "scoring": {...}, "policy": {...} }
//   3. environment    PROMPTWALL_*
//
// ENVIRONMENT:
//   PROMPTWALL_SIGNAL_WEIGHT_WITH_RULES
//   PROMPTWALL_SIGNAL_WEIGHT_NO_RULES
//   PROMPTWALL_SIGNAL_CONFIDENCE_WEIGHT
//   PROMPTWALL_WARN_THRESHOLD
//   PROMPTWALL_BLOCK_THRESHOLD
//   PROMPTWALL_QUARANTINE_THRESHOLD
//
// A value that is not a number falls back to the built-in default (not the
// file value) and is reported through the sink. Range checks happen when the
// engine/policy is built.
// =============================================================================
#pragma once

#include "promptwall/diag/DiagnosticSink.hpp"
#include "promptwall/policy/PolicyTypes.hpp"
#include "promptwall/scoring/ScoringConfig.hpp"

#include <optional>
#include <string>

namespace promptwall {

struct FirewallConfig {
    ScoringConfig scoring;
    PolicyThresholds thresholds;

    // Throws ConfigError if either half is out of range
    void validate() const;
};

// Strict decimal parse: the whole string must be consumed. Rejects leading
// blanks, hex, nan and infinity.
std::optional<double> parseNumber(const std::string& text);

// Defaults overlaid with PROMPTWALL_* variables
FirewallConfig loadConfigFromEnvironment(DiagnosticSink& sink);

// Defaults overlaid with the file. Throws ConfigError if the file cannot
// be read or is not a JSON object.
FirewallConfig loadConfigFromFile(const std::string& path, DiagnosticSink& sink);

void applyEnvironmentOverrides(FirewallConfig& config, DiagnosticSink& sink);

} // namespace promptwall
