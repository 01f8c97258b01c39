#include <tickgovernor/core/control/performance_advisor.hpp>
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

using namespace TickGovernor;

namespace {

void escalate(PerformanceReport& report, HealthLevel level) {
    if (static_cast<uint8_t>(level) > static_cast<uint8_t>(report.health)) {
        report.health = level;
    }
}

bool includes(AnalysisScope scope, AnalysisScope part) {
    return scope == AnalysisScope::ALL || scope == part;
}

} // namespace

const char* PerformanceReport::scopeString(AnalysisScope scope) {
    switch (scope) {
        case AnalysisScope::ALL:    return "all";
        case AnalysisScope::FRAME:  return "frame";
        case AnalysisScope::EVENTS: return "events";
        case AnalysisScope::DIRTY:  return "dirty";
        default:                    return "unknown";
    }
}

const char* PerformanceReport::healthString(HealthLevel level) {
    switch (level) {
        case HealthLevel::HEALTHY:  return "HEALTHY";
        case HealthLevel::ELEVATED: return "ELEVATED";
        case HealthLevel::DEGRADED: return "DEGRADED";
        default:                    return "UNKNOWN";
    }
}

AnalysisScope TickGovernor::parseAnalysisScope(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower.empty() || lower == "all") return AnalysisScope::ALL;
    if (lower == "frame") return AnalysisScope::FRAME;
    if (lower == "events" || lower == "eventbus") return AnalysisScope::EVENTS;
    if (lower == "dirty" || lower == "scheduler") return AnalysisScope::DIRTY;

    spdlog::warn("[PerformanceAdvisor] Unknown analysis scope '{}', using all", name);
    return AnalysisScope::ALL;
}

PerformanceAdvisor::PerformanceAdvisor() {
    spdlog::debug("[PerformanceAdvisor] Initialized with thresholds: pressure_p95={}ms, min_savings={}%",
                  thresholds_.pressure_p95_ms, thresholds_.min_savings_percent);
}

PerformanceAdvisor::PerformanceAdvisor(const AdvisorThresholds& thresholds)
    : thresholds_(thresholds) {}

PerformanceReport PerformanceAdvisor::analyze(const BudgetStatistics& budget,
                                              const SchedulerStatistics& scheduler,
                                              const CoalescerStatistics& coalescer,
                                              AnalysisScope scope) const {
    PerformanceReport report;
    report.scope = scope;

    if (includes(scope, AnalysisScope::FRAME)) {
        analyzeFrame(budget, report);
    }
    if (includes(scope, AnalysisScope::EVENTS)) {
        analyzeEvents(coalescer, report);
    }
    if (includes(scope, AnalysisScope::DIRTY)) {
        analyzeDirty(scheduler, report);
    }
    return report;
}

// ============================================================================
// Frame budget
// ============================================================================

void PerformanceAdvisor::analyzeFrame(const BudgetStatistics& budget, PerformanceReport& report) const {
    report.findings.push_back(fmt::format(
        "Frame budget: mean={:.2f}ms p95={:.2f}ms p99={:.2f}ms target={:.2f}ms dropped={} deferred={}",
        budget.mean_ms, budget.p95_ms, budget.p99_ms, budget.target_cycle_ms,
        budget.dropped_callbacks, budget.pending_deferred));

    if (budget.mean_ms > budget.target_cycle_ms || budget.p95_ms > thresholds_.pressure_p95_ms) {
        report.recommendations.push_back(
            "Cycle time pressure is high: switch to the Medium or Low preset and lengthen "
            "coalescing intervals for noisy events.");
        escalate(report, HealthLevel::DEGRADED);
    } else if (budget.mean_ms < thresholds_.headroom_mean_ms &&
               budget.p95_ms < thresholds_.headroom_p95_ms) {
        report.recommendations.push_back(
            "Cycle time headroom is healthy: tighter coalescing intervals are affordable for "
            "latency-sensitive events.");
    }
}

// ============================================================================
// Event coalescer
// ============================================================================

void PerformanceAdvisor::analyzeEvents(const CoalescerStatistics& coalescer, PerformanceReport& report) const {
    const uint64_t coalesced = coalescer.total_coalesced;
    const uint64_t dispatched = coalescer.total_dispatched;

    report.findings.push_back(fmt::format(
        "Coalescer: coalesced={} dispatched={} queued={} savings={:.1f}% defers={} "
        "emergency_flushes={} immediate_critical={}",
        coalesced, dispatched, coalescer.queued_events, coalescer.savings_percent,
        coalescer.budget_defers, coalescer.emergency_flushes, coalescer.immediate_critical));

    // Most saved first, then busiest
    struct Row {
        const std::string* name;
        const PerEventStats* stats;
    };
    std::vector<Row> rows;
    rows.reserve(coalescer.per_event.size());
    for (const auto& [name, stats] : coalescer.per_event) {
        rows.push_back(Row{&name, &stats});
    }
    std::stable_sort(rows.begin(), rows.end(), [](const Row& a, const Row& b) {
        if (a.stats->saved != b.stats->saved) {
            return a.stats->saved > b.stats->saved;
        }
        return (a.stats->coalesced + a.stats->dispatched) > (b.stats->coalesced + b.stats->dispatched);
    });
    const size_t top = std::min(thresholds_.top_events, rows.size());
    for (size_t i = 0; i < top; ++i) {
        report.findings.push_back(fmt::format(
            "Top event {}: {} (coalesced={} dispatched={} saved={})",
            i + 1, *rows[i].name, rows[i].stats->coalesced, rows[i].stats->dispatched, rows[i].stats->saved));
    }

    if (coalesced == 0 && dispatched == 0) {
        report.recommendations.push_back(
            "No coalescer traffic detected: route high-frequency events through submit() and "
            "register coalesced handlers for them.");
    }
    if (coalesced > thresholds_.min_coalesced_for_savings &&
        coalescer.savings_percent < thresholds_.min_savings_percent) {
        report.recommendations.push_back(
            "Low coalescing savings: increase event delays for spammy events or lower their priority.");
        escalate(report, HealthLevel::ELEVATED);
    }
    if (static_cast<double>(coalescer.budget_defers) >
        std::max(thresholds_.defer_floor, static_cast<double>(dispatched) * thresholds_.defer_ratio)) {
        report.recommendations.push_back(
            "High budget defers: reduce MEDIUM/LOW event volume, increase delays, or lower the "
            "scheduler batch size to reduce cycle spikes.");
        escalate(report, HealthLevel::ELEVATED);
    }
    if (static_cast<double>(coalescer.emergency_flushes) >
        std::max(thresholds_.emergency_floor, static_cast<double>(dispatched) * thresholds_.emergency_ratio)) {
        report.recommendations.push_back(
            "Emergency flushes are high: raise delays on noisy HIGH/MEDIUM events and reserve "
            "CRITICAL for true state changes.");
        escalate(report, HealthLevel::DEGRADED);
    }
}

// ============================================================================
// Batch scheduler
// ============================================================================

void PerformanceAdvisor::analyzeDirty(const SchedulerStatistics& scheduler, PerformanceReport& report) const {
    report.findings.push_back(fmt::format(
        "Scheduler: processed={} batches={} pending={} invalid={} blocks={} decays={} failures={}",
        scheduler.targets_processed, scheduler.batches_run, scheduler.pending_count,
        scheduler.invalid_targets_skipped, scheduler.processing_blocks,
        scheduler.priority_decays, scheduler.update_failures));

    if (scheduler.invalid_targets_skipped > thresholds_.max_invalid_targets) {
        report.recommendations.push_back(
            "Scheduler skipped invalid targets: release or re-validate target references before "
            "marking them pending.");
        escalate(report, HealthLevel::ELEVATED);
    }
    if (scheduler.processing_blocks > thresholds_.max_processing_blocks) {
        report.recommendations.push_back(
            "Scheduler re-entry blocks are high: avoid running the scheduler from inside target "
            "updates and batch nested updates instead.");
        escalate(report, HealthLevel::ELEVATED);
    }
}
