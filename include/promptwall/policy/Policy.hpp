#pragma once

#include "promptwall/policy/PolicyTypes.hpp"

#include <string>

namespace promptwall {

// Maps (riskScore, confidence) to an action. Pure, thread-safe.
class Policy {
public:
    virtual ~Policy() = default;

    virtual const std::string& id() const = 0;
    virtual const std::string& version() const = 0;

    virtual PolicyAction evaluate(double riskScore, double confidence) const = 0;
    virtual PolicyThresholds thresholds() const = 0;
};

} // namespace promptwall
