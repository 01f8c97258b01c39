#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

#include <tickgovernor/core/budget/budget_tracker.hpp>
#include <tickgovernor/core/coalescer/event_coalescer.hpp>
#include <tickgovernor/core/config/app_config.hpp>
#include <tickgovernor/core/control/governor_mode.hpp>
#include <tickgovernor/core/control/performance_advisor.hpp>
#include <tickgovernor/core/diagnostics/diagnostic_sink.hpp>
#include <tickgovernor/core/events/event.hpp>
#include <tickgovernor/core/scheduler/batch_scheduler.hpp>
#include <tickgovernor/core/utils/clock.hpp>

namespace TickGovernor {

/**
 * @class Governor
 * @brief Tick driver that owns the three subsystems
 *
 * The host constructs one Governor per update loop and calls tick() once
 * per cycle. Clock, diagnostic sink and dispatch sink are borrowed and must
 * outlive the governor.
 *
 * Per tick:
 *   1. budget.recordCycle(elapsed)  (also drains deferred callbacks)
 *   2. scheduler.runCycle()         (only while it has pending work)
 *   3. coalescer.tick()
 */
class Governor {
public:
    Governor(const AppConfig::AppConfiguration& config,
             Clock& clock,
             DiagnosticSink& diagnostics,
             DispatchSink& sink);
    ~Governor() noexcept;

    Governor(const Governor&) = delete;
    Governor& operator=(const Governor&) = delete;

    /**
     * @brief Drive one cycle with an externally measured duration
     */
    void tick(double elapsed_ms);

    /**
     * @brief Drive one cycle measuring the duration since the previous call
     * The first call only primes the clock and records nothing.
     * @return false on the priming call
     */
    bool tick();

    /**
     * @brief Switch operating mode
     * A real transition flushes the coalescer and force-runs the scheduler.
     * @return true if the mode changed
     */
    bool setMode(GovernorMode mode);
    GovernorMode getMode() const { return mode_.getMode(); }

    void setEnabled(bool enabled);
    bool isEnabled() const { return enabled_; }

    /**
     * @brief Apply a named preset to the live subsystems
     * Unknown names fall back to Medium.
     * @return Name of the preset actually applied
     */
    std::string applyPreset(const std::string& name);
    const std::string& currentPreset() const { return preset_; }

    PerformanceReport analyze(AnalysisScope scope = AnalysisScope::ALL) const;

    /**
     * @brief Log a boxed summary of all three subsystems
     */
    void logReport() const;

    BudgetTracker& budget() { return *budget_; }
    BatchScheduler& scheduler() { return *scheduler_; }
    EventCoalescer& coalescer() { return *coalescer_; }
    PerformanceAdvisor& advisor() { return advisor_; }

    const BudgetTracker& budget() const { return *budget_; }
    const BatchScheduler& scheduler() const { return *scheduler_; }
    const EventCoalescer& coalescer() const { return *coalescer_; }

    uint64_t tickCount() const { return ticks_; }

private:
    void registerConfiguredEvents(const AppConfig::CoalescerConfig& config);

    Clock& clock_;
    DiagnosticSink& diagnostics_;

    std::unique_ptr<BudgetTracker> budget_;
    std::unique_ptr<BatchScheduler> scheduler_;
    std::unique_ptr<EventCoalescer> coalescer_;
    PerformanceAdvisor advisor_;
    GovernorModeManager mode_;

    // Logs coalesced events registered from configuration
    EventHandlerPtr config_handler_;

    std::string preset_;
    bool enabled_ = true;
    bool primed_ = false;
    uint64_t last_tick_ns_ = 0;
    uint64_t ticks_ = 0;
};

} // namespace TickGovernor
