#include <tickgovernor/core/governor/governor.hpp>
#include <tickgovernor/core/config/presets.hpp>

using namespace TickGovernor;

namespace {

BudgetTrackerConfig makeBudgetConfig(const AppConfig::BudgetConfig& cfg) {
    BudgetTrackerConfig out;
    out.target_cycle_ms = cfg.target_cycle_ms;
    out.history_size = cfg.history_size;
    out.max_deferred_per_priority = cfg.max_deferred_per_priority;
    out.max_drain_per_cycle = cfg.max_drain_per_cycle;
    return out;
}

BatchSchedulerConfig makeSchedulerConfig(const AppConfig::SchedulerConfig& cfg) {
    BatchSchedulerConfig out;
    out.enabled = cfg.enabled;
    out.batch_size = cfg.batch_size;
    out.decay_interval_ms = cfg.decay_interval_ms;
    return out;
}

EventCoalescerConfig makeCoalescerConfig(const AppConfig::CoalescerConfig& cfg) {
    EventCoalescerConfig out;
    out.enabled = cfg.enabled;
    out.intervals_ms[coalescerSlot(CoalescerPriority::CRITICAL)] = 0.0;
    out.intervals_ms[coalescerSlot(CoalescerPriority::HIGH)] = cfg.high_interval_ms;
    out.intervals_ms[coalescerSlot(CoalescerPriority::MEDIUM)] = cfg.medium_interval_ms;
    out.intervals_ms[coalescerSlot(CoalescerPriority::LOW)] = cfg.low_interval_ms;
    return out;
}

} // namespace

Governor::Governor(const AppConfig::AppConfiguration& config,
                   Clock& clock,
                   DiagnosticSink& diagnostics,
                   DispatchSink& sink)
    : clock_(clock),
      diagnostics_(diagnostics),
      budget_(std::make_unique<BudgetTracker>(diagnostics, makeBudgetConfig(config.budget))),
      scheduler_(std::make_unique<BatchScheduler>(*budget_, clock, diagnostics,
                                                  makeSchedulerConfig(config.scheduler))),
      coalescer_(std::make_unique<EventCoalescer>(*budget_, clock, sink, diagnostics,
                                                  makeCoalescerConfig(config.coalescer))),
      preset_(config.preset) {
    registerConfiguredEvents(config.coalescer);
    spdlog::info("[Governor] Initialized: preset={} target={:.2f}ms batch={} coalesced_events={}",
                 preset_, budget_->getTargetCycleTime(), scheduler_->getBatchSize(),
                 config.coalescer.events.size());
}

Governor::~Governor() noexcept {
    spdlog::info("[Governor] Shutting down after {} ticks", ticks_);
}

void Governor::registerConfiguredEvents(const AppConfig::CoalescerConfig& config) {
    if (config.events.empty()) {
        return;
    }
    config_handler_ = makeEventHandler(
        [](const std::string& event_name, const EventArgs& args) {
            spdlog::debug("[Governor] Coalesced '{}' delivered with {} args", event_name, args.size());
        },
        "ConfiguredEventLogger");

    for (const auto& event : config.events) {
        coalescer_->registerCoalesced(event.name, event.delay_ms, config_handler_, event.priority);
    }
}

// ============================================================================
// Tick
// ============================================================================

void Governor::tick(double elapsed_ms) {
    ++ticks_;
    budget_->recordCycle(elapsed_ms);

    if (scheduler_->isActive()) {
        scheduler_->runCycle();
    }
    coalescer_->tick();
}

bool Governor::tick() {
    uint64_t now_ns = clock_.nowNs();
    if (!primed_) {
        primed_ = true;
        last_tick_ns_ = now_ns;
        return false;
    }
    double elapsed_ms = clock_.elapsedMs(last_tick_ns_);
    last_tick_ns_ = now_ns;
    tick(elapsed_ms);
    return true;
}

// ============================================================================
// Mode, Enable, Presets
// ============================================================================

bool Governor::setMode(GovernorMode mode) {
    if (!mode_.setMode(mode)) {
        return false;
    }
    // Transition is a sync point: nothing from the previous phase stays queued
    coalescer_->flush();
    size_t flushed = scheduler_->runCycle(true);
    diagnostics_.report("Governor",
                        std::string("Entered ") + GovernorModeManager::toString(mode) +
                        " mode, flushed " + std::to_string(flushed) + " targets",
                        Severity::INFO);
    return true;
}

void Governor::setEnabled(bool enabled) {
    if (enabled_ == enabled) return;
    enabled_ = enabled;
    scheduler_->setEnabled(enabled);
    coalescer_->setEnabled(enabled);
    spdlog::info("[Governor] {}", enabled ? "Enabled" : "Disabled");
}

std::string Governor::applyPreset(const std::string& name) {
    PresetSettings preset = resolvePreset(name);
    auto intervals = presetIntervals(preset.coalesce_interval_ms);

    budget_->setTargetCycleTime(preset.target_cycle_ms);
    scheduler_->setBatchSize(preset.batch_size);
    for (auto priority : {CoalescerPriority::HIGH, CoalescerPriority::MEDIUM, CoalescerPriority::LOW}) {
        coalescer_->setCoalesceInterval(priority, intervals[coalescerSlot(priority)]);
    }

    preset_ = preset.name;
    spdlog::info("[Governor] Preset {} applied: target={:.2f}ms batch={} interval={:.0f}ms",
                 preset_, preset.target_cycle_ms, preset.batch_size, preset.coalesce_interval_ms);
    return preset_;
}

// ============================================================================
// Analysis & Reporting
// ============================================================================

PerformanceReport Governor::analyze(AnalysisScope scope) const {
    return advisor_.analyze(budget_->getStatistics(),
                            scheduler_->getStatistics(),
                            coalescer_->getStatistics(),
                            scope);
}

void Governor::logReport() const {
    PerformanceReport report = analyze(AnalysisScope::ALL);
    BudgetStatistics b = budget_->getStatistics();
    SchedulerStatistics s = scheduler_->getStatistics();
    CoalescerStatistics c = coalescer_->getStatistics();

    auto log_level = (report.health == HealthLevel::HEALTHY)
        ? spdlog::level::info
        : spdlog::level::warn;

    spdlog::log(log_level, "╔════════════════════════════════════════════════════════════╗");
    spdlog::log(log_level, "║              GOVERNOR REPORT                               ║");
    spdlog::log(log_level, "╠════════════════════════════════════════════════════════════╣");
    spdlog::log(log_level, "║ Budget   │ mean {:6.2f} │ p95 {:6.2f} │ p99 {:6.2f} │ tgt {:6.2f} ║",
                b.mean_ms, b.p95_ms, b.p99_ms, b.target_cycle_ms);
    spdlog::log(log_level, "║ Deferred │ pending {:5} │ run {:8} │ dropped {:6}        ║",
                b.pending_deferred, b.executed_deferred, b.dropped_callbacks);
    spdlog::log(log_level, "║ Dirty    │ done {:8} │ pending {:5} │ invalid {:5} │ decay {:3} ║",
                s.targets_processed, s.pending_count, s.invalid_targets_skipped, s.priority_decays);
    spdlog::log(log_level, "║ Events   │ in {:8} │ out {:8} │ saved {:5.1f}% │ emerg {:4} ║",
                c.total_coalesced, c.total_dispatched, c.savings_percent, c.emergency_flushes);
    spdlog::log(log_level, "╠════════════════════════════════════════════════════════════╣");
    spdlog::log(log_level, "║ Mode: {:8} │ Preset: {:6} │ Health: {:8}                ║",
                GovernorModeManager::toString(mode_.getMode()), preset_,
                PerformanceReport::healthString(report.health));
    spdlog::log(log_level, "╚════════════════════════════════════════════════════════════╝");

    budget_->histogram().printDistribution();

    for (size_t i = 0; i < report.recommendations.size(); ++i) {
        spdlog::log(log_level, "[Governor] Recommendation {}: {}", i + 1, report.recommendations[i]);
    }
}
