#include "promptwall/rules/LinguisticRules.hpp"

#include <bitset>
#include <cmath>

namespace promptwall {
namespace rules {

namespace {

bool isWordChar(char32_t c) {
    return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') ||
           (c >= U'0' && c <= U'9') || c == U'_';
}

// ECMAScript \s
bool isWhitespace(char32_t c) {
    switch (c) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x0020: case 0x00A0: case 0x1680: case 0x2028: case 0x2029:
        case 0x202F: case 0x205F: case 0x3000: case 0xFEFF:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

} // namespace

Script scriptOf(char32_t c) {
    if (c <= 0x024F)                 return Script::LATIN;
    if (c >= 0x0400 && c <= 0x04FF)  return Script::CYRILLIC;
    if (c >= 0x0600 && c <= 0x06FF)  return Script::ARABIC;
    if (c >= 0x4E00 && c <= 0x9FFF)  return Script::CHINESE;
    if (c >= 0x3040 && c <= 0x30FF)  return Script::JAPANESE;
    if (c >= 0xAC00 && c <= 0xD7AF)  return Script::KOREAN;
    return Script::OTHER;
}

// =============================================================================
// LanguageSwitchingRule
// =============================================================================

bool LanguageSwitchingRule::matches(const NormalizedInput& input) const {
    if (input.length >= SHORT_TEXT_LENGTH) return false;

    std::bitset<6> seen;
    for (char32_t c : input.characterSet) {
        const Script s = scriptOf(c);
        if (s != Script::OTHER) seen.set(static_cast<std::size_t>(s));
    }
    return seen.count() > MAX_SCRIPTS;
}

RuleEffect LanguageSwitchingRule::effect() const {
    return {0.2, "linguistic-anomaly", Severity::MEDIUM};
}

std::string LanguageSwitchingRule::explain(const NormalizedInput&) const {
    return "Rapid language/script switching detected";
}

// =============================================================================
// SpecialCharacterDensityRule
// =============================================================================

bool SpecialCharacterDensityRule::matches(const NormalizedInput& input) const {
    if (input.length == 0) return false;

    std::size_t special = 0;
    for (char32_t c : input.scalars) {
        if (!isWordChar(c) && !isWhitespace(c)) ++special;
    }
    const double density = static_cast<double>(special) / static_cast<double>(input.length);
    return density > DENSITY_THRESHOLD;
}

RuleEffect SpecialCharacterDensityRule::effect() const {
    return {0.25, "encoding-suspicion", Severity::MEDIUM};
}

std::string SpecialCharacterDensityRule::explain(const NormalizedInput&) const {
    const int pct = static_cast<int>(std::lround(DENSITY_THRESHOLD * 100.0));
    return "Special character density exceeds " + std::to_string(pct) + "%";
}

} // namespace rules
} // namespace promptwall
