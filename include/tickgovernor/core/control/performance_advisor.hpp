#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <tickgovernor/core/budget/budget_tracker.hpp>
#include <tickgovernor/core/coalescer/event_coalescer.hpp>
#include <tickgovernor/core/control/advisor_thresholds.hpp>
#include <tickgovernor/core/scheduler/batch_scheduler.hpp>

namespace TickGovernor {

enum class AnalysisScope : uint8_t {
    ALL = 0,
    FRAME = 1,
    EVENTS = 2,
    DIRTY = 3
};

enum class HealthLevel : uint8_t {
    HEALTHY = 0,
    ELEVATED = 1,
    DEGRADED = 2
};

struct PerformanceReport {
    AnalysisScope scope = AnalysisScope::ALL;
    HealthLevel health = HealthLevel::HEALTHY;
    std::vector<std::string> findings;
    std::vector<std::string> recommendations;

    static const char* scopeString(AnalysisScope scope);
    static const char* healthString(HealthLevel level);
};

/**
 * @brief Parse "all" / "frame" / "events" / "dirty" (case-insensitive)
 * Unknown names fall back to ALL with a warning.
 */
AnalysisScope parseAnalysisScope(const std::string& name);

/**
 * @class PerformanceAdvisor
 * @brief Turns statistics snapshots into findings and tuning advice
 *
 * Pure function of its inputs: nothing is changed on the subsystems.
 * Health escalates to DEGRADED on frame pressure or excessive emergency
 * flushes and to ELEVATED on any other warning-level recommendation.
 */
class PerformanceAdvisor {
public:
    PerformanceAdvisor();
    explicit PerformanceAdvisor(const AdvisorThresholds& thresholds);
    ~PerformanceAdvisor() = default;

    PerformanceReport analyze(const BudgetStatistics& budget,
                              const SchedulerStatistics& scheduler,
                              const CoalescerStatistics& coalescer,
                              AnalysisScope scope = AnalysisScope::ALL) const;

    const AdvisorThresholds& getThresholds() const { return thresholds_; }
    void setThresholds(const AdvisorThresholds& t) { thresholds_ = t; }

private:
    void analyzeFrame(const BudgetStatistics& budget, PerformanceReport& report) const;
    void analyzeEvents(const CoalescerStatistics& coalescer, PerformanceReport& report) const;
    void analyzeDirty(const SchedulerStatistics& scheduler, PerformanceReport& report) const;

    AdvisorThresholds thresholds_;
};

} // namespace TickGovernor
