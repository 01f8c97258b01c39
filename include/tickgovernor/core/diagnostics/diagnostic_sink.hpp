#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace TickGovernor {

/**
 * @enum Severity
 * @brief Severity of a diagnostic raised by a core subsystem
 */
enum class Severity {
    DEBUG = 0,      // Per-item detail, normally filtered
    INFO = 1,       // Informational, no action needed
    WARNING = 2,    // Degraded behaviour (drops, emergency flushes)
    ERROR = 3       // A user callback failed
};

inline const char* severityString(Severity s) {
    switch (s) {
        case Severity::DEBUG:   return "DEBUG";
        case Severity::INFO:    return "INFO";
        case Severity::WARNING: return "WARNING";
        case Severity::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

/**
 * @class DiagnosticSink
 * @brief Output interface for failures the core absorbs instead of throwing.
 *
 * The budget tracker, scheduler, coalescer and event bus report here:
 * - caught callback / subscriber / update failures
 * - dropped deferred callbacks
 * - emergency flushes
 * - invalid targets and rejected registrations
 *
 * Implementations must not throw back into the caller and must not call
 * back into the reporting subsystem.
 */
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    virtual void report(const std::string& component,
                        const std::string& message,
                        Severity severity) = 0;

    virtual const char* name() const = 0;
};

using DiagnosticSinkPtr = std::shared_ptr<DiagnosticSink>;

/**
 * @class LoggingDiagnosticSink
 * @brief Forwards diagnostics to spdlog
 */
class LoggingDiagnosticSink : public DiagnosticSink {
public:
    void report(const std::string& component, const std::string& message,
                Severity severity) override {
        switch (severity) {
            case Severity::DEBUG:
                spdlog::debug("[{}] {}", component, message);
                break;
            case Severity::INFO:
                spdlog::info("[{}] {}", component, message);
                break;
            case Severity::WARNING:
                spdlog::warn("[{}] {}", component, message);
                break;
            case Severity::ERROR:
                spdlog::error("[{}] {}", component, message);
                break;
        }
    }

    const char* name() const override { return "LoggingDiagnosticSink"; }
};

/**
 * @class CallbackDiagnosticSink
 * @brief Sink that calls a user-provided function
 */
class CallbackDiagnosticSink : public DiagnosticSink {
public:
    using Callback = std::function<void(const std::string&, const std::string&, Severity)>;

    explicit CallbackDiagnosticSink(Callback cb, const char* name = "CallbackDiagnosticSink")
        : callback_(std::move(cb)), name_(name) {}

    void report(const std::string& component, const std::string& message,
                Severity severity) override {
        if (callback_) {
            callback_(component, message, severity);
        }
    }

    const char* name() const override { return name_; }

private:
    Callback callback_;
    const char* name_;
};

/**
 * @class CompositeDiagnosticSink
 * @brief Fan-out to multiple sinks
 */
class CompositeDiagnosticSink : public DiagnosticSink {
public:
    void addSink(DiagnosticSinkPtr sink) {
        if (sink) {
            sinks_.push_back(std::move(sink));
        }
    }

    void report(const std::string& component, const std::string& message,
                Severity severity) override {
        for (auto& sink : sinks_) {
            try {
                sink->report(component, message, severity);
            } catch (const std::exception& e) {
                spdlog::error("DiagnosticSink {} threw exception: {}",
                              sink->name(), e.what());
            }
        }
    }

    size_t size() const { return sinks_.size(); }

    const char* name() const override { return "CompositeDiagnosticSink"; }

private:
    std::vector<DiagnosticSinkPtr> sinks_;
};

/**
 * @class NullDiagnosticSink
 * @brief Discards all diagnostics (for benchmarks)
 */
class NullDiagnosticSink : public DiagnosticSink {
public:
    void report(const std::string&, const std::string&, Severity) override {}
    const char* name() const override { return "NullDiagnosticSink"; }
};

} // namespace TickGovernor
