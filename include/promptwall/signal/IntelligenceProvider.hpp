#pragma once

#include "promptwall/normalize/NormalizedInput.hpp"
#include "promptwall/signal/SignalTypes.hpp"

#include <string>

namespace promptwall {

// External signal source (local model, remote API, ...).
//
// analyze() runs on the firewall's worker pool, concurrently with other
// providers, against a snapshot nobody mutates. It may block and it may
// throw: the firewall substitutes a neutral signal on any failure.
class IntelligenceProvider {
public:
    virtual ~IntelligenceProvider() = default;

    virtual const std::string& id() const = 0;
    virtual bool enabled() const = 0;

    virtual Signal analyze(const NormalizedInput& input,
                           const Context& context,
                           const Metadata& metadata) const = 0;
};

} // namespace promptwall
