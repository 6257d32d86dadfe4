// =============================================================================
// DiagnosticSink.hpp - warning channel for configuration / collaborator issues
// =============================================================================
// Never called on the normal evaluation path. Only:
//   - malformed configuration overrides (fallback to default)
//   - intelligence provider failures (neutral signal substituted)
//   - custom rule failures (rule counted as no match)
//
// Default is NullSink. Inject StderrSink (or your own) to see warnings.
// =============================================================================
#pragma once

#include <memory>
#include <mutex>
#include <string>

namespace promptwall {

class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;
    virtual void warn(const std::string& message) = 0;
};

class NullSink final : public DiagnosticSink {
public:
    void warn(const std::string&) override {}
};

// Writes "[PROMPTWALL] WARN: <message>" lines to std::cerr
class StderrSink final : public DiagnosticSink {
public:
    explicit StderrSink(std::string tag = "PROMPTWALL");
    void warn(const std::string& message) override;

private:
    std::string tag_;
    std::mutex mtx_;
};

// Shared no-op instance used when nothing is injected
std::shared_ptr<DiagnosticSink> nullSink();

} // namespace promptwall
