#include <tickgovernor/core/diagnostics/buffered_diagnostic_sink.hpp>
#include <algorithm>

namespace TickGovernor {

BufferedDiagnosticSink::BufferedDiagnosticSink(size_t max_stored, Severity min_severity)
    : max_stored_(std::max<size_t>(1, max_stored)), min_severity_(min_severity) {
    spdlog::debug("[BufferedDiagnosticSink] Initialized (max stored: {}, min severity: {})",
                  max_stored_, severityString(min_severity_));
}

void BufferedDiagnosticSink::report(const std::string& component,
                                    const std::string& message,
                                    Severity severity) {
    if (severity < min_severity_) return;
    if (!component_filter_.empty() && component_filter_.count(component) == 0) return;

    ++total_accepted_;
    ++per_severity_[static_cast<size_t>(severity)];

    // Ring buffer: remove oldest if at capacity
    if (stored_.size() >= max_stored_) {
        stored_.pop_front();
    }
    stored_.push_back(Diagnostic{component, message, severity, total_accepted_});
}

void BufferedDiagnosticSink::setComponentFilter(const std::vector<std::string>& components) {
    component_filter_.clear();
    component_filter_.insert(components.begin(), components.end());
}

std::vector<Diagnostic> BufferedDiagnosticSink::getRecent(size_t max_count) const {
    std::vector<Diagnostic> result;
    size_t count = std::min(max_count, stored_.size());
    result.reserve(count);

    // Return newest first (reverse order)
    auto it = stored_.rbegin();
    for (size_t i = 0; i < count && it != stored_.rend(); ++i, ++it) {
        result.push_back(*it);
    }
    return result;
}

uint64_t BufferedDiagnosticSink::countFor(Severity s) const {
    return per_severity_[static_cast<size_t>(s)];
}

size_t BufferedDiagnosticSink::countComponent(const std::string& component) const {
    return static_cast<size_t>(std::count_if(stored_.begin(), stored_.end(),
        [&](const Diagnostic& d) { return d.component == component; }));
}

void BufferedDiagnosticSink::clear() {
    stored_.clear();
    spdlog::debug("[BufferedDiagnosticSink] Buffer cleared (total accepted remains: {})",
                  total_accepted_);
}

} // namespace TickGovernor
