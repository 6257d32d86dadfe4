// =============================================================================
// Normalizer.hpp - canonical text form for deterministic rule evaluation
// =============================================================================
// PURPOSE: Inputs that differ only in whitespace shape or Unicode composition
//          must evaluate identically. All rules see normalized text only.
//
// STEPS:
//   0. UTF-8 decode, ill-formed bytes -> U+FFFD
//   1. NFC (Boost.Locale)
//   2. \r\n and lone \r -> \n
//   3. [ \t]+ -> ' '
//   4. drop spaces touching a line break, trim whitespace at both ends
//   5. encoding label
//   6. sorted distinct character set
//
// normalize() is total: no input string makes it throw.
// normalize(normalize(s).normalized).normalized == normalize(s).normalized
// =============================================================================
#pragma once

#include "promptwall/normalize/NormalizedInput.hpp"

#include <locale>
#include <string>

namespace promptwall {

class Normalizer {
public:
    static constexpr const char* DEFAULT_ENCODING = "utf-8";

    Normalizer();

    NormalizedInput normalize(const std::string& raw) const;

private:
    std::string compose(const std::string& text) const;
    std::string detectEncoding(const std::u32string& text) const;

    std::locale locale_;
};

} // namespace promptwall
