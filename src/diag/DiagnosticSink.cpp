#include "promptwall/diag/DiagnosticSink.hpp"

#include <iostream>

namespace promptwall {

StderrSink::StderrSink(std::string tag)
    : tag_(std::move(tag)) {}

void StderrSink::warn(const std::string& message) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::cerr << "[" << tag_ << "] WARN: " << message << "\n";
}

std::shared_ptr<DiagnosticSink> nullSink() {
    static std::shared_ptr<DiagnosticSink> inst = std::make_shared<NullSink>();
    return inst;
}

} // namespace promptwall
