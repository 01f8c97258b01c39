#pragma once

#include <tickgovernor/core/budget/budget_priority.hpp>
#include <tickgovernor/core/budget/cycle_histogram.hpp>
#include <tickgovernor/core/budget/cycle_ring_buffer.hpp>
#include <tickgovernor/core/diagnostics/diagnostic_sink.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <functional>

namespace TickGovernor {

/**
 * @struct BudgetTrackerConfig
 * @brief Tunables for cycle-time tracking and admission control
 */
struct BudgetTrackerConfig {
    // Cycle time the host aims for (16.67 ms = 60 Hz)
    double target_cycle_ms = 16.67;

    // Ring buffer slots used for mean and percentiles
    size_t history_size = 100;

    // Percentiles are recomputed every N recorded cycles and stale in between
    uint32_t percentile_interval = 30;

    // Soft cap per deferred queue; only LOW is dropped when it is reached
    size_t max_deferred_per_priority = 200;

    // Global cap on deferred callbacks executed per drain pass
    size_t max_drain_per_cycle = 5;

    // Cost assumed by deferOrRun() and by the drain pass admission checks
    double defer_probe_cost_ms = 0.5;
    double drain_probe_cost_ms = 1.0;
};

/**
 * @struct BudgetStatistics
 * @brief Value snapshot of the tracker; safe to hand to other subsystems
 */
struct BudgetStatistics {
    double mean_ms = 0.0;
    double min_ms = 0.0;
    double max_ms = 0.0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;
    double p99_ms = 0.0;
    double target_cycle_ms = 0.0;
    CycleHistogram::Counts histogram{};

    uint64_t cycles_recorded = 0;
    size_t sample_count = 0;

    size_t pending_deferred = 0;
    std::array<size_t, BUDGET_PRIORITY_LEVELS> pending_by_priority{};
    uint64_t deferred_total = 0;        // Callbacks ever queued
    uint64_t executed_deferred = 0;     // Queued callbacks later executed
    uint64_t ran_immediately = 0;
    uint64_t dropped_callbacks = 0;
    uint64_t callback_failures = 0;
};

/**
 * @class BudgetTracker
 * @brief Measures cycle duration and answers "can priority P afford cost C?"
 *
 * - recordCycle(): O(1) ring buffer insert, running mean/min/max, histogram,
 *   lazy percentiles, then a bounded drain of deferred callbacks
 * - canAfford(): soft, mean-based gate (not a hard real-time guarantee)
 * - deferOrRun(): run now if affordable, otherwise queue per priority
 *
 * Deferred queues for CRITICAL/HIGH/MEDIUM are never dropped and may grow
 * past max_deferred_per_priority; only LOW is dropped at the cap.
 *
 * Single-threaded: all calls come from the host's tick thread.
 */
class BudgetTracker {
public:
    using Callback = std::function<void(void* context)>;

    enum class DeferResult : uint8_t {
        RAN_IMMEDIATELY = 0,
        DEFERRED = 1,
        DROPPED = 2
    };

    static constexpr double DEFAULT_TARGET_CYCLE_MS = 16.67;

    explicit BudgetTracker(DiagnosticSink& diagnostics,
                           const BudgetTrackerConfig& config = BudgetTrackerConfig{});
    ~BudgetTracker() = default;

    BudgetTracker(const BudgetTracker&) = delete;
    BudgetTracker& operator=(const BudgetTracker&) = delete;

    /**
     * @brief Record one cycle's duration and drain ready deferred callbacks
     * @param elapsed_ms Cycle duration; negative or NaN is recorded as 0
     */
    void recordCycle(double elapsed_ms);

    /**
     * @brief Admission check
     * CRITICAL always returns true. Otherwise
     * (mean + estimated_cost_ms) <= target * {0.75, 0.60, 0.40}[priority].
     */
    bool canAfford(BudgetPriority priority, double estimated_cost_ms) const;

    /**
     * @brief Run callback now if affordable, else queue it
     * @param context Opaque, non-owned pointer handed back to the callback
     *
     * Callback failures are reported and never propagate.
     */
    DeferResult deferOrRun(Callback callback, BudgetPriority priority, void* context = nullptr);

    /**
     * @brief Execute up to max_drain_per_cycle queued callbacks,
     * most urgent first, stopping at the first unaffordable priority
     * @return Number of callbacks executed
     */
    size_t drainDeferred();

    /**
     * @brief Recompute P50/P95/P99 from the ring buffer now
     * Normally called every percentile_interval cycles by recordCycle().
     */
    void recomputePercentiles();

    void setTargetCycleTime(double ms);
    double getTargetCycleTime() const { return config_.target_cycle_ms; }

    double currentMean() const { return ring_.mean(); }

    BudgetStatistics getStatistics() const;
    size_t pendingDeferred() const;
    const CycleHistogram& histogram() const { return histogram_; }

    /**
     * @brief Clear statistics, samples and histogram.
     * Queued deferred callbacks are kept.
     */
    void reset();

    const BudgetTrackerConfig& config() const { return config_; }

    /**
     * @brief Fraction of target available to a non-critical priority
     */
    static double admissionFraction(BudgetPriority priority);

private:
    struct DeferredCallback {
        BudgetPriority priority;
        void* context;
        Callback invoke;
    };

    bool invokeGuarded(const Callback& callback, void* context, const char* phase);

    DiagnosticSink& diagnostics_;
    BudgetTrackerConfig config_;

    CycleRingBuffer ring_;
    CycleHistogram histogram_;
    std::array<std::deque<DeferredCallback>, BUDGET_PRIORITY_LEVELS> deferred_;

    double min_ms_ = 0.0;
    double max_ms_ = 0.0;
    double p50_ms_ = 0.0;
    double p95_ms_ = 0.0;
    double p99_ms_ = 0.0;

    uint64_t cycles_recorded_ = 0;
    uint64_t deferred_total_ = 0;
    uint64_t executed_deferred_ = 0;
    uint64_t ran_immediately_ = 0;
    uint64_t dropped_callbacks_ = 0;
    uint64_t callback_failures_ = 0;
};

} // namespace TickGovernor
