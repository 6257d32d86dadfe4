#pragma once

#include "promptwall/rules/ContextualRules.hpp"
#include "promptwall/rules/EncodingRules.hpp"
#include "promptwall/rules/LinguisticRules.hpp"
#include "promptwall/rules/RuleEngine.hpp"
#include "promptwall/rules/StructuralRules.hpp"

#include <vector>

namespace promptwall {
namespace rules {

// The eight built-in rules, in registration order:
//   structural.instruction-override, structural.excessive-nesting,
//   contextual.persona-injection, contextual.system-access,
//   linguistic.language-switching, linguistic.special-character-density,
//   encoding.homoglyph, encoding.mixed
std::vector<RuleEngine::RulePtr> builtinRules();

RuleEngine makeBuiltinRuleEngine();

} // namespace rules
} // namespace promptwall
