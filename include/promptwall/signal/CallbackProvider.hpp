// =============================================================================
// CallbackProvider.hpp - bring-your-own-model adapter
// =============================================================================
// Wraps any callable that scores normalized text. The result is validated:
// an invalid signal is thrown as std::runtime_error, and whatever the callable
// throws propagates. The firewall substitutes a neutral signal for both.
//
// USAGE:
//   auto p = std::make_shared<CallbackProvider>("local-bert",
//       [&](const std::string& text, const Context&, const Metadata&) {
//           return model.score(text);
//       });
// =============================================================================
#pragma once

#include "promptwall/signal/IntelligenceProvider.hpp"

#include <functional>

namespace promptwall {

class CallbackProvider final : public IntelligenceProvider {
public:
    using ModelFn = std::function<Signal(const std::string& normalizedText,
                                         const Context& context,
                                         const Metadata& metadata)>;

    // Throws ConfigError on an empty id or an empty function
    CallbackProvider(std::string id, ModelFn fn, bool enabled = true);

    const std::string& id() const override { return id_; }
    bool enabled() const override { return enabled_; }

    Signal analyze(const NormalizedInput& input,
                   const Context& context,
                   const Metadata& metadata) const override;

private:
    std::string id_;
    ModelFn fn_;
    bool enabled_;
};

} // namespace promptwall
