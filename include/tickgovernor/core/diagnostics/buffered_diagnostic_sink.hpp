#pragma once

#include <tickgovernor/core/diagnostics/diagnostic_sink.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_set>
#include <vector>

namespace TickGovernor {

struct Diagnostic {
    std::string component;
    std::string message;
    Severity severity = Severity::INFO;
    uint64_t sequence = 0;      // Monotonic per sink, starts at 1
};

/**
 * @class BufferedDiagnosticSink
 * @brief Keeps the most recent diagnostics in memory for inspection.
 *
 * - Filters by minimum severity and (optionally) by component
 * - Counts every accepted diagnostic per severity
 * - Stores the last N accepted diagnostics (ring buffer)
 *
 * Single-threaded like the rest of the core.
 */
class BufferedDiagnosticSink : public DiagnosticSink {
public:
    static constexpr size_t DEFAULT_MAX_STORED = 1000;

    explicit BufferedDiagnosticSink(size_t max_stored = DEFAULT_MAX_STORED,
                                    Severity min_severity = Severity::DEBUG);

    void report(const std::string& component, const std::string& message,
                Severity severity) override;

    const char* name() const override { return "BufferedDiagnosticSink"; }

    /**
     * @brief Only accept diagnostics from the listed components.
     * An empty filter (the default) accepts every component.
     */
    void setComponentFilter(const std::vector<std::string>& components);
    void setMinSeverity(Severity s) { min_severity_ = s; }

    /**
     * @brief Get recent diagnostics
     * @param max_count Maximum entries to retrieve
     * @return Recent diagnostics, newest first
     */
    std::vector<Diagnostic> getRecent(size_t max_count = 100) const;

    size_t size() const { return stored_.size(); }
    uint64_t totalAccepted() const { return total_accepted_; }
    uint64_t countFor(Severity s) const;

    /**
     * @brief Count stored diagnostics whose component matches
     */
    size_t countComponent(const std::string& component) const;

    /**
     * @brief Clear stored diagnostics (totals are kept)
     */
    void clear();

private:
    size_t max_stored_;
    Severity min_severity_;
    std::unordered_set<std::string> component_filter_;
    std::deque<Diagnostic> stored_;
    std::array<uint64_t, 4> per_severity_{};
    uint64_t total_accepted_ = 0;
};

} // namespace TickGovernor
