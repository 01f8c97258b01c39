#include <tickgovernor/core/scheduler/batch_scheduler.hpp>
#include <algorithm>
#include <string>
#include <vector>

namespace TickGovernor {

namespace {
// Cost the scheduler assumes for one more batch when probing the tracker
constexpr double BATCH_PROBE_COST_MS = 1.0;
}

BatchScheduler::BatchScheduler(BudgetTracker& budget,
                               Clock& clock,
                               DiagnosticSink& diagnostics,
                               const BatchSchedulerConfig& config)
    : budget_(budget),
      clock_(clock),
      diagnostics_(diagnostics),
      enabled_(config.enabled),
      batch_size_(std::max(MIN_BATCH_SIZE, config.batch_size)),
      decay_interval_ms_(config.decay_interval_ms > 0.0 ? config.decay_interval_ms : 5000.0) {
    last_decay_ns_ = clock_.nowNs();
    spdlog::debug("[BatchScheduler] Initialized: batch_size={} decay={:.0f}ms enabled={}",
                  batch_size_, decay_interval_ms_, enabled_);
}

// ============================================================================
// Marking
// ============================================================================

bool BatchScheduler::sameIdentity(const PendingEntry& a, const PendingEntry& b) {
    return !a.identity.owner_before(b.identity) && !b.identity.owner_before(a.identity);
}

bool BatchScheduler::enqueue(PendingEntry entry, SchedulerPriority priority) {
    if (!enabled_) {
        return false;
    }

    auto& queue = queues_[schedulerSlot(priority)];
    if (queue.containsIf([&entry](const PendingEntry& e) { return sameIdentity(e, entry); })) {
        return false;
    }
    queue.push(std::move(entry));

    if (!active_) {
        active_ = true;
        last_decay_ns_ = clock_.nowNs();
        spdlog::debug("[BatchScheduler] Active");
    }
    return true;
}

// ============================================================================
// Batch Processing
// ============================================================================
// mean>18 or P95>28 -> base/4, 30ms spacing
// mean>16 or P95>24 -> base/3, 24ms spacing
// mean>14 or P95>20 -> base/2, 18ms spacing
// mean<11 and P95<16 -> min(2*base, 16), no spacing
// ============================================================================

BatchScheduler::BatchPlan BatchScheduler::computeBatchPlan(size_t base_batch_size,
                                                           double mean_ms,
                                                           double p95_ms) {
    if (mean_ms > 18.0 || p95_ms > 28.0) {
        return {std::max(MIN_BATCH_SIZE, base_batch_size / 4), 30.0};
    }
    if (mean_ms > 16.0 || p95_ms > 24.0) {
        return {std::max(MIN_BATCH_SIZE, base_batch_size / 3), 24.0};
    }
    if (mean_ms > 14.0 || p95_ms > 20.0) {
        return {std::max(MIN_BATCH_SIZE, base_batch_size / 2), 18.0};
    }
    if (mean_ms < 11.0 && p95_ms < 16.0) {
        return {std::min(MAX_RELAXED_BATCH_SIZE, base_batch_size * 2), 0.0};
    }
    return {base_batch_size, 0.0};
}

bool BatchScheduler::invoke(const PendingEntry& entry) {
    UpdateTargetPtr target = entry.adapter ? entry.adapter : entry.target.lock();
    if (!target || !target->isValid()) {
        ++invalid_targets_skipped_;
        diagnostics_.report("BatchScheduler",
                            target ? std::string("Skipping invalid target ") + target->name()
                                   : std::string("Skipping expired target"),
                            Severity::WARNING);
        return false;
    }

    try {
        target->update();
    } catch (const std::exception& e) {
        ++update_failures_;
        diagnostics_.report("BatchScheduler",
                            std::string("Update error in ") + target->name() + ": " + e.what(),
                            Severity::ERROR);
    } catch (...) {
        ++update_failures_;
        diagnostics_.report("BatchScheduler",
                            std::string("Update error in ") + target->name() + ": unknown exception",
                            Severity::ERROR);
    }
    ++targets_processed_;
    return true;
}

size_t BatchScheduler::runCycle(bool force_flush_all) {
    if (running_) {
        ++processing_blocks_;
        spdlog::debug("[BatchScheduler] Re-entrant runCycle blocked ({} total)", processing_blocks_);
        return 0;
    }
    if (!enabled_) {
        return 0;
    }
    RunningGuard guard(running_);

    const uint64_t now_ns = clock_.nowNs();
    BudgetStatistics budget_stats = budget_.getStatistics();
    BatchPlan plan = computeBatchPlan(batch_size_, budget_stats.mean_ms, budget_stats.p95_ms);
    last_batch_size_ = plan.batch_size;
    last_min_interval_ms_ = plan.min_interval_ms;

    if (!force_flush_all && has_run_ && plan.min_interval_ms > 0.0) {
        double since_last_ms = clock_.elapsedMs(last_run_ns_);
        if (since_last_ms < plan.min_interval_ms) {
            return 0;
        }
    }

    size_t invoked = 0;
    for (int level = SCHEDULER_PRIORITY_LEVELS; level >= 1; --level) {
        SchedulerPriority priority = static_cast<SchedulerPriority>(level);
        auto& queue = queues_[schedulerSlot(priority)];

        // A forced pass takes what is queued now; targets re-marked during
        // their own update wait for the next cycle
        size_t limit = force_flush_all ? queue.size() : plan.batch_size;
        size_t processed = 0;
        size_t popped = 0;
        while (!queue.empty() && (force_flush_all ? popped < limit : processed < limit)) {
            auto entry = queue.pop();
            ++popped;
            if (entry && invoke(*entry)) {
                ++processed;
            }
        }
        if (processed > 0) {
            ++batches_run_;
            invoked += processed;
        }

        if (!force_flush_all &&
            !budget_.canAfford(toBudgetPriority(priority), BATCH_PROBE_COST_MS)) {
            break;
        }
    }

    maybeDecay(now_ns);

    has_run_ = true;
    last_run_ns_ = now_ns;

    if (active_ && getPendingCount() == 0) {
        active_ = false;
        spdlog::debug("[BatchScheduler] Idle after {} targets", targets_processed_);
    }
    return invoked;
}

// ============================================================================
// Priority Decay
// ============================================================================
// Each waiting target moves exactly one level toward CRITICAL per period.
// Levels are shifted most-urgent first so nothing moves twice in one pass.
// ============================================================================

void BatchScheduler::maybeDecay(uint64_t now_ns) {
    double since_decay_ms = now_ns > last_decay_ns_
        ? static_cast<double>(now_ns - last_decay_ns_) / 1e6 : 0.0;
    if (since_decay_ms < decay_interval_ms_) {
        return;
    }
    last_decay_ns_ = now_ns;

    size_t moved = 0;
    for (int level = SCHEDULER_PRIORITY_LEVELS - 1; level >= 1; --level) {
        auto& from = queues_[static_cast<size_t>(level - 1)];
        auto& to = queues_[static_cast<size_t>(level)];
        for (auto& entry : from.takeAll()) {
            if (!to.containsIf([&entry](const PendingEntry& e) { return sameIdentity(e, entry); })) {
                to.push(std::move(entry));
            }
            ++moved;
        }
    }

    if (moved > 0) {
        ++priority_decays_;
        spdlog::debug("[BatchScheduler] Priority decay promoted {} targets", moved);
    }
}

// ============================================================================
// Configuration & Statistics
// ============================================================================

void BatchScheduler::setEnabled(bool enabled) {
    if (enabled_ == enabled) return;
    enabled_ = enabled;
    spdlog::info("[BatchScheduler] {}", enabled ? "Enabled" : "Disabled");
}

void BatchScheduler::setBatchSize(size_t size) {
    if (size < MIN_BATCH_SIZE) {
        spdlog::warn("[BatchScheduler] Batch size {} below minimum, using {}", size, MIN_BATCH_SIZE);
        size = MIN_BATCH_SIZE;
    }
    batch_size_ = size;
}

size_t BatchScheduler::getPendingCount() const {
    size_t total = 0;
    for (const auto& q : queues_) total += q.size();
    return total;
}

SchedulerStatistics BatchScheduler::getStatistics() const {
    SchedulerStatistics s;
    s.targets_processed = targets_processed_;
    s.batches_run = batches_run_;
    s.invalid_targets_skipped = invalid_targets_skipped_;
    s.priority_decays = priority_decays_;
    s.processing_blocks = processing_blocks_;
    s.update_failures = update_failures_;
    for (size_t i = 0; i < queues_.size(); ++i) {
        s.pending_by_priority[i] = queues_[i].size();
        s.pending_count += queues_[i].size();
    }
    s.base_batch_size = batch_size_;
    s.last_batch_size = last_batch_size_;
    s.last_min_interval_ms = last_min_interval_ms_;
    s.active = active_;
    s.enabled = enabled_;
    return s;
}

void BatchScheduler::clear() {
    size_t dropped = getPendingCount();
    for (auto& q : queues_) q.clear();
    active_ = false;
    if (dropped > 0) {
        spdlog::info("[BatchScheduler] Cleared {} pending targets", dropped);
    }
}

} // namespace TickGovernor
