#pragma once

#include "promptwall/normalize/NormalizedInput.hpp"
#include "promptwall/signal/SignalTypes.hpp"

namespace promptwall {

class MetadataComputer {
public:
    // ~4 characters per token
    static std::size_t estimateTokenCount(std::size_t length);

    // Shannon entropy in bits over scalar values, 0 for empty text
    static double entropy(const std::u32string& text);

    // No detector yet: always empty
    static std::optional<std::string> detectLanguage(const std::u32string& text);

    static Metadata compute(const NormalizedInput& input);

    // Caller-provided fields win, missing ones are computed
    static Metadata complete(const PartialMetadata& partial, const NormalizedInput& input);
};

} // namespace promptwall
