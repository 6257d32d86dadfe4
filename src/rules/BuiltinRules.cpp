#include "promptwall/rules/BuiltinRules.hpp"

namespace promptwall {
namespace rules {

std::vector<RuleEngine::RulePtr> builtinRules() {
    return {
        std::make_shared<InstructionOverrideRule>(),
        std::make_shared<ExcessiveNestingRule>(),
        std::make_shared<PersonaInjectionRule>(),
        std::make_shared<SystemAccessRule>(),
        std::make_shared<LanguageSwitchingRule>(),
        std::make_shared<SpecialCharacterDensityRule>(),
        std::make_shared<HomoglyphRule>(),
        std::make_shared<MixedEncodingRule>(),
    };
}

RuleEngine makeBuiltinRuleEngine() {
    return RuleEngine(builtinRules());
}

} // namespace rules
} // namespace promptwall
