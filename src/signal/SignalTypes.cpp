#include "promptwall/signal/SignalTypes.hpp"

#include <cmath>

namespace promptwall {

namespace {

bool inUnitRange(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

} // namespace

std::string validateSignal(const Signal& s) {
    if (!inUnitRange(s.noveltyScore)) return "noveltyScore outside [0,1]";
    if (!inUnitRange(s.confidence))   return "confidence outside [0,1]";
    if (s.modelId.empty())            return "empty modelId";
    return {};
}

std::optional<Role> parseRole(const std::string& s) {
    if (s == "system") return Role::SYSTEM;
    if (s == "user")   return Role::USER;
    if (s == "tool")   return Role::TOOL;
    return std::nullopt;
}

std::optional<Channel> parseChannel(const std::string& s) {
    if (s == "input")       return Channel::INPUT;
    if (s == "memory")      return Channel::MEMORY;
    if (s == "instruction") return Channel::INSTRUCTION;
    return std::nullopt;
}

} // namespace promptwall
