#include "promptwall/config/FirewallConfig.hpp"
#include "promptwall/config/ConfigError.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace promptwall {

using json = nlohmann::json;

namespace {

std::string getEnv(const char* key) {
    const char* val = std::getenv(key);
    return val ? std::string(val) : "";
}

// A malformed value falls back to the built-in default, not to whatever an
// earlier source set
void overrideFromEnv(const char* key, double fallback, double& target, DiagnosticSink& sink) {
    const std::string raw = getEnv(key);
    if (raw.empty()) return;

    auto parsed = parseNumber(raw);
    if (!parsed) {
        sink.warn(std::string(key) + "='" + raw + "' is not a number, using default " +
                  std::to_string(fallback));
        target = fallback;
        return;
    }
    target = *parsed;
}

// Accepts a JSON number or a numeric string
void overrideFromJson(const json& section, const char* key, const std::string& where,
                      double fallback, double& target, DiagnosticSink& sink) {
    if (!section.contains(key)) return;
    const json& v = section.at(key);

    if (v.is_number()) {
        target = v.get<double>();
        return;
    }
    if (v.is_string()) {
        auto parsed = parseNumber(v.get<std::string>());
        if (parsed) {
            target = *parsed;
            return;
        }
    }
    sink.warn(where + "." + key + " is not a number (" + v.dump() + "), using default " +
              std::to_string(fallback));
    target = fallback;
}

} // namespace

void FirewallConfig::validate() const {
    scoring.validate();
    thresholds.validate();
}

std::optional<double> parseNumber(const std::string& text) {
    if (text.empty()) return std::nullopt;

    // strtod would also take leading blanks and hex floats
    if (std::isspace(static_cast<unsigned char>(text[0]))) return std::nullopt;
    const std::size_t i = (text[0] == '+' || text[0] == '-') ? 1 : 0;
    if (i + 1 < text.size() && text[i] == '0' && (text[i + 1] == 'x' || text[i + 1] == 'X')) {
        return std::nullopt;
    }

    const char* begin = text.c_str();
    char* end = nullptr;
    errno = 0;
    const double v = std::strtod(begin, &end);

    if (end == begin || *end != '\0' || errno == ERANGE) return std::nullopt;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

FirewallConfig loadConfigFromEnvironment(DiagnosticSink& sink) {
    FirewallConfig config;
    applyEnvironmentOverrides(config, sink);
    return config;
}

void applyEnvironmentOverrides(FirewallConfig& config, DiagnosticSink& sink) {
    overrideFromEnv("PROMPTWALL_SIGNAL_WEIGHT_WITH_RULES",
                    ScoringConfig::DEFAULT_SIGNAL_WEIGHT_WITH_RULES,
                    config.scoring.signalWeightWithRules, sink);
    overrideFromEnv("PROMPTWALL_SIGNAL_WEIGHT_NO_RULES",
                    ScoringConfig::DEFAULT_SIGNAL_WEIGHT_NO_RULES,
                    config.scoring.signalWeightNoRules, sink);
    overrideFromEnv("PROMPTWALL_SIGNAL_CONFIDENCE_WEIGHT",
                    ScoringConfig::DEFAULT_SIGNAL_CONFIDENCE_WEIGHT,
                    config.scoring.signalConfidenceWeight, sink);

    overrideFromEnv("PROMPTWALL_WARN_THRESHOLD",
                    PolicyThresholds::DEFAULT_WARN, config.thresholds.warn, sink);
    overrideFromEnv("PROMPTWALL_BLOCK_THRESHOLD",
                    PolicyThresholds::DEFAULT_BLOCK, config.thresholds.block, sink);
    overrideFromEnv("PROMPTWALL_QUARANTINE_THRESHOLD",
                    PolicyThresholds::DEFAULT_QUARANTINE, config.thresholds.quarantine, sink);
}

FirewallConfig loadConfigFromFile(const std::string& path, DiagnosticSink& sink) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open config file: " + path);
    }

    std::stringstream ss;
    ss << in.rdbuf();

    json root;
    try {
        root = json::parse(ss.str());
    } catch (const json::parse_error& e) {
        throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }

    if (!root.is_object()) {
        throw ConfigError("config root must be an object: " + path);
    }

    FirewallConfig config;

    if (root.contains("scoring") && root["scoring"].is_object()) {
        const json& s = root["scoring"];
        overrideFromJson(s, "signalWeightWithRules", "scoring",
                         ScoringConfig::DEFAULT_SIGNAL_WEIGHT_WITH_RULES,
                         config.scoring.signalWeightWithRules, sink);
        overrideFromJson(s, "signalWeightNoRules", "scoring",
                         ScoringConfig::DEFAULT_SIGNAL_WEIGHT_NO_RULES,
                         config.scoring.signalWeightNoRules, sink);
        overrideFromJson(s, "signalConfidenceWeight", "scoring",
                         ScoringConfig::DEFAULT_SIGNAL_CONFIDENCE_WEIGHT,
                         config.scoring.signalConfidenceWeight, sink);
    }

    if (root.contains("policy") && root["policy"].is_object()) {
        const json& p = root["policy"];
        overrideFromJson(p, "warn", "policy", PolicyThresholds::DEFAULT_WARN,
                         config.thresholds.warn, sink);
        overrideFromJson(p, "block", "policy", PolicyThresholds::DEFAULT_BLOCK,
                         config.thresholds.block, sink);
        overrideFromJson(p, "quarantine", "policy", PolicyThresholds::DEFAULT_QUARANTINE,
                         config.thresholds.quarantine, sink);
    }

    return config;
}

} // namespace promptwall
