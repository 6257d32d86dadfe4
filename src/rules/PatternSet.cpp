#include "promptwall/rules/PatternSet.hpp"

namespace promptwall {
namespace rules {

PatternSet::PatternSet(std::initializer_list<const char*> patterns, Case mode) {
    boost::regex::flag_type flags = boost::regex::perl;
    if (mode == Case::INSENSITIVE) flags |= boost::regex::icase;

    patterns_.reserve(patterns.size());
    for (const char* p : patterns) {
        patterns_.push_back(boost::make_u32regex(p, flags));
    }
}

bool PatternSet::anyMatch(const std::string& text) const {
    for (const auto& re : patterns_) {
        try {
            if (boost::u32regex_search(text, re)) return true;
        } catch (const std::runtime_error&) {
            // boost::regex_error: match complexity exceeded on this input
            continue;
        } catch (const std::out_of_range&) {
            // invalid UTF-8 sequence in text
            continue;
        }
    }
    return false;
}

} // namespace rules
} // namespace promptwall
