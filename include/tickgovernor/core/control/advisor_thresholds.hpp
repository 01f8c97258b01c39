#pragma once

#include <cstddef>
#include <cstdint>

namespace TickGovernor {

/**
 * @struct AdvisorThresholds
 * @brief Boundaries used by PerformanceAdvisor
 *
 * Frame:
 * - pressure: mean > target cycle time OR P95 > pressure_p95_ms
 * - headroom: mean < headroom_mean_ms AND P95 < headroom_p95_ms
 *
 * Events:
 * - low savings: coalesced > min_coalesced_for_savings AND savings < min_savings_percent
 * - defers:      budget defers > max(defer_floor, dispatched * defer_ratio)
 * - emergencies: emergency flushes > max(emergency_floor, dispatched * emergency_ratio)
 *
 * Scheduler:
 * - invalid targets > max_invalid_targets
 * - re-entry blocks > max_processing_blocks
 */
struct AdvisorThresholds {
    double pressure_p95_ms = 20.0;
    double headroom_mean_ms = 12.0;
    double headroom_p95_ms = 16.0;

    uint64_t min_coalesced_for_savings = 50;
    double min_savings_percent = 20.0;

    double defer_floor = 20.0;
    double defer_ratio = 0.25;

    double emergency_floor = 10.0;
    double emergency_ratio = 0.10;

    uint64_t max_invalid_targets = 0;
    uint64_t max_processing_blocks = 10;

    // Rows listed under "Top event" findings
    size_t top_events = 5;
};

} // namespace TickGovernor
