#pragma once

#include <tickgovernor/core/budget/budget_tracker.hpp>
#include <tickgovernor/core/diagnostics/diagnostic_sink.hpp>
#include <tickgovernor/core/scheduler/scheduler_priority.hpp>
#include <tickgovernor/core/scheduler/update_target.hpp>
#include <tickgovernor/core/scheduler/work_queue.hpp>
#include <tickgovernor/core/utils/clock.hpp>
#include <array>
#include <cstdint>
#include <memory>
#include <type_traits>

namespace TickGovernor {

struct BatchSchedulerConfig {
    bool enabled = true;
    size_t batch_size = 10;            // Base batch size before adaptation
    double decay_interval_ms = 5000.0; // Starvation guard period
};

struct SchedulerStatistics {
    uint64_t targets_processed = 0;
    uint64_t batches_run = 0;
    uint64_t invalid_targets_skipped = 0;
    uint64_t priority_decays = 0;
    uint64_t processing_blocks = 0;
    uint64_t update_failures = 0;

    size_t pending_count = 0;
    std::array<size_t, SCHEDULER_PRIORITY_LEVELS> pending_by_priority{};  // LOW first

    size_t base_batch_size = 0;
    size_t last_batch_size = 0;
    double last_min_interval_ms = 0.0;
    bool active = false;
    bool enabled = false;
};

/**
 * @class BatchScheduler
 * @brief Idempotent "needs update" queue drained in adaptive, budget-gated batches
 *
 * Targets are queued per SchedulerPriority (CRITICAL drained first). Each
 * runCycle() sizes its batch from the budget tracker's mean/P95, drains
 * levels most-urgent first and stops after a level the tracker can no longer
 * afford. Waiting work is promoted one level every decay interval.
 *
 * State: Idle (nothing pending) <-> Active (host should call runCycle()).
 */
class BatchScheduler {
public:
    struct BatchPlan {
        size_t batch_size;
        double min_interval_ms;
    };

    static constexpr size_t MIN_BATCH_SIZE = 2;
    static constexpr size_t MAX_RELAXED_BATCH_SIZE = 16;

    BatchScheduler(BudgetTracker& budget,
                   Clock& clock,
                   DiagnosticSink& diagnostics,
                   const BatchSchedulerConfig& config = BatchSchedulerConfig{});
    ~BatchScheduler() = default;

    BatchScheduler(const BatchScheduler&) = delete;
    BatchScheduler& operator=(const BatchScheduler&) = delete;

    /**
     * @brief Queue a target unless it is already queued at this priority
     *
     * UpdateTarget implementations are held weakly. Any other type is wrapped
     * with makeUpdateTarget(); the adapter is owned by the queue and refers to
     * the object weakly, so either way an expired object is skipped.
     *
     * @return true if newly queued; false when disabled, null or already queued
     */
    template <typename T>
    bool markPending(const std::shared_ptr<T>& obj,
                     SchedulerPriority priority = SchedulerPriority::MEDIUM) {
        if (!obj) {
            return false;
        }
        PendingEntry entry;
        entry.identity = std::shared_ptr<const void>(obj);
        if constexpr (std::is_base_of_v<UpdateTarget, T>) {
            entry.target = std::static_pointer_cast<UpdateTarget>(obj);
        } else {
            entry.adapter = makeUpdateTarget(obj);
        }
        return enqueue(std::move(entry), priority);
    }

    // Ordinal form; out-of-range values are clamped to [1, 4]
    template <typename T>
    bool markPending(const std::shared_ptr<T>& obj, int priority_ordinal) {
        return markPending(obj, clampSchedulerPriority(priority_ordinal));
    }

    /**
     * @brief Drain one adaptive batch per priority level
     * @param force_flush_all Drain every level completely, ignoring the
     *        minimum interval and the budget
     * @return Number of targets invoked
     */
    size_t runCycle(bool force_flush_all = false);

    /**
     * @brief Batch size and minimum spacing for the given load
     */
    static BatchPlan computeBatchPlan(size_t base_batch_size, double mean_ms, double p95_ms);

    void setEnabled(bool enabled);
    bool isEnabled() const { return enabled_; }

    void setBatchSize(size_t size);
    size_t getBatchSize() const { return batch_size_; }

    size_t getPendingCount() const;
    bool isActive() const { return active_; }

    SchedulerStatistics getStatistics() const;

    // Drop all pending targets
    void clear();

private:
    struct PendingEntry {
        std::weak_ptr<const void> identity;
        std::weak_ptr<UpdateTarget> target;
        UpdateTargetPtr adapter;
    };

    // RAII re-entrancy flag, cleared on every exit path
    class RunningGuard {
    public:
        explicit RunningGuard(bool& flag) : flag_(flag) { flag_ = true; }
        ~RunningGuard() { flag_ = false; }
        RunningGuard(const RunningGuard&) = delete;
        RunningGuard& operator=(const RunningGuard&) = delete;
    private:
        bool& flag_;
    };

    bool enqueue(PendingEntry entry, SchedulerPriority priority);
    static bool sameIdentity(const PendingEntry& a, const PendingEntry& b);

    bool invoke(const PendingEntry& entry);
    void maybeDecay(uint64_t now_ns);

    BudgetTracker& budget_;
    Clock& clock_;
    DiagnosticSink& diagnostics_;

    std::array<WorkQueue<PendingEntry>, SCHEDULER_PRIORITY_LEVELS> queues_;  // LOW first

    bool enabled_;
    bool active_ = false;
    bool running_ = false;
    size_t batch_size_;
    double decay_interval_ms_;

    bool has_run_ = false;
    uint64_t last_run_ns_ = 0;
    uint64_t last_decay_ns_ = 0;
    size_t last_batch_size_ = 0;
    double last_min_interval_ms_ = 0.0;

    uint64_t targets_processed_ = 0;
    uint64_t batches_run_ = 0;
    uint64_t invalid_targets_skipped_ = 0;
    uint64_t priority_decays_ = 0;
    uint64_t processing_blocks_ = 0;
    uint64_t update_failures_ = 0;
};

} // namespace TickGovernor
