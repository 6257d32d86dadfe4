#pragma once

#include <stdexcept>
#include <string>

namespace promptwall {

// Fatal configuration problem: raised at construction / load, never recovered
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("[CONFIG] " + what) {}
};

} // namespace promptwall
