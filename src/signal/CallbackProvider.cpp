#include "promptwall/signal/CallbackProvider.hpp"
#include "promptwall/config/ConfigError.hpp"

#include <stdexcept>

namespace promptwall {

CallbackProvider::CallbackProvider(std::string id, ModelFn fn, bool enabled)
    : id_(std::move(id)), fn_(std::move(fn)), enabled_(enabled) {
    if (id_.empty()) {
        throw ConfigError("provider id must not be empty");
    }
    if (!fn_) {
        throw ConfigError("provider " + id_ + " has no model function");
    }
}

Signal CallbackProvider::analyze(const NormalizedInput& input,
                                 const Context& context,
                                 const Metadata& metadata) const {
    if (!enabled_) {
        throw std::runtime_error("provider " + id_ + " is not enabled");
    }

    Signal s = fn_(input.normalized, context, metadata);

    const std::string problem = validateSignal(s);
    if (!problem.empty()) {
        throw std::runtime_error("provider " + id_ + " returned invalid signal: " + problem);
    }
    return s;
}

} // namespace promptwall
