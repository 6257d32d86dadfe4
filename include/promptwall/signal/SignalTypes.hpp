// =============================================================================
// SignalTypes.hpp - intelligence signal, request context, request metadata
// =============================================================================
// Signals are ADVISORY. They come from non-deterministic collaborators
// (local models, remote APIs) and are bounded by the scoring engine.
// =============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace promptwall {

struct Signal {
    double noveltyScore = 0.0;                  // [0,1]
    std::vector<std::string> predictedClasses;
    double confidence = 0.0;                    // [0,1]
    std::string modelId;
};

// Fail-open substitute for a collaborator that threw or returned garbage
inline Signal neutralSignal(const std::string& modelId) {
    Signal s;
    s.modelId = modelId;
    return s;
}

// Empty string when the signal is usable, otherwise what is wrong with it
std::string validateSignal(const Signal& s);

enum class Role : uint8_t {
    SYSTEM = 0,
    USER   = 1,
    TOOL   = 2
};

enum class Channel : uint8_t {
    INPUT       = 0,
    MEMORY      = 1,
    INSTRUCTION = 2
};

inline const char* roleToString(Role r) {
    switch (r) {
        case Role::SYSTEM: return "system";
        case Role::USER:   return "user";
        case Role::TOOL:   return "tool";
        default:           return "unknown";
    }
}

inline const char* channelToString(Channel c) {
    switch (c) {
        case Channel::INPUT:       return "input";
        case Channel::MEMORY:      return "memory";
        case Channel::INSTRUCTION: return "instruction";
        default:                   return "unknown";
    }
}

std::optional<Role> parseRole(const std::string& s);
std::optional<Channel> parseChannel(const std::string& s);

struct Context {
    Role role = Role::USER;
    Channel channel = Channel::INPUT;
    std::optional<std::string> agentType;
    std::optional<std::vector<std::string>> toolAccess;
};

struct Metadata {
    std::size_t tokenCount = 0;
    double entropy = 0.0;                       // bits per character
    std::optional<std::string> language;        // ISO 639-1
};

// Whatever the caller already knows; the rest is computed
struct PartialMetadata {
    std::optional<std::size_t> tokenCount;
    std::optional<double> entropy;
    std::optional<std::string> language;
};

} // namespace promptwall
