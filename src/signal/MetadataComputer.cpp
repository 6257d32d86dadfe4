#include "promptwall/signal/MetadataComputer.hpp"

#include <cmath>
#include <unordered_map>

namespace promptwall {

std::size_t MetadataComputer::estimateTokenCount(std::size_t length) {
    return (length + 3) / 4;
}

double MetadataComputer::entropy(const std::u32string& text) {
    if (text.empty()) return 0.0;

    std::unordered_map<char32_t, std::size_t> freq;
    for (char32_t c : text) ++freq[c];

    const double n = static_cast<double>(text.size());
    double h = 0.0;
    for (const auto& [c, count] : freq) {
        const double p = static_cast<double>(count) / n;
        h -= p * std::log2(p);
    }
    return h;
}

std::optional<std::string> MetadataComputer::detectLanguage(const std::u32string&) {
    return std::nullopt;
}

Metadata MetadataComputer::compute(const NormalizedInput& input) {
    return complete(PartialMetadata{}, input);
}

Metadata MetadataComputer::complete(const PartialMetadata& partial, const NormalizedInput& input) {
    Metadata m;
    m.tokenCount = partial.tokenCount ? *partial.tokenCount : estimateTokenCount(input.length);
    m.entropy = partial.entropy ? *partial.entropy : entropy(input.scalars);
    m.language = partial.language ? partial.language : detectLanguage(input.scalars);
    return m;
}

} // namespace promptwall
