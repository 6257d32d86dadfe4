#pragma once

#include <boost/regex/icu.hpp>

#include <initializer_list>
#include <string>
#include <vector>

namespace promptwall {
namespace rules {

// Compiled once, searched read-only from any thread.
// Patterns run over UTF-8 decoded to code points (Boost.Regex ICU traits), so
// \s covers Unicode spaces (NBSP, EM SPACE, ideographic space) and icase uses
// Unicode case folding. If Boost.Regex gives up on a pathological input
// (complexity limit, malformed UTF-8) that pattern counts as not matched.
class PatternSet {
public:
    enum class Case { SENSITIVE, INSENSITIVE };

    PatternSet(std::initializer_list<const char*> patterns, Case mode);

    bool anyMatch(const std::string& text) const;

    std::size_t size() const { return patterns_.size(); }

private:
    std::vector<boost::u32regex> patterns_;
};

} // namespace rules
} // namespace promptwall
