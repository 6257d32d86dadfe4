#include "promptwall/rules/EncodingRules.hpp"
#include "promptwall/normalize/Utf8.hpp"

#include <algorithm>

namespace promptwall {
namespace rules {

namespace {
constexpr char32_t BYTE_ORDER_MARK = 0xFEFF;
}

// =============================================================================
// HomoglyphRule
// =============================================================================

bool HomoglyphRule::isSuspicious(char32_t c) {
    return (c >= 0x0400 && c <= 0x04FF)     // Cyrillic (incl. Latin lookalikes)
        || (c >= 0x2000 && c <= 0x206F)     // General Punctuation, 202A-202E bidi
        || c == BYTE_ORDER_MARK;
}

bool HomoglyphRule::matches(const NormalizedInput& input) const {
    return std::any_of(input.characterSet.begin(), input.characterSet.end(), isSuspicious);
}

RuleEffect HomoglyphRule::effect() const {
    return {0.3, "homoglyph-attack", Severity::HIGH};
}

std::string HomoglyphRule::explain(const NormalizedInput&) const {
    return "Unicode homoglyph or zero-width characters detected";
}

// =============================================================================
// MixedEncodingRule
// =============================================================================

bool MixedEncodingRule::isAnomaly(char32_t c) {
    if (c == utf8::REPLACEMENT_CHAR || c == BYTE_ORDER_MARK) return true;
    if (c <= 0x08) return true;
    if (c == 0x0B || c == 0x0C) return true;
    return c >= 0x0E && c <= 0x1F;
}

bool MixedEncodingRule::matches(const NormalizedInput& input) const {
    return std::any_of(input.characterSet.begin(), input.characterSet.end(), isAnomaly);
}

RuleEffect MixedEncodingRule::effect() const {
    return {0.2, "encoding-anomaly", Severity::MEDIUM};
}

std::string MixedEncodingRule::explain(const NormalizedInput&) const {
    return "Encoding anomalies detected (replacement characters, BOM, etc.)";
}

} // namespace rules
} // namespace promptwall
