#include <tickgovernor/core/budget/budget_tracker.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace TickGovernor {

BudgetTracker::BudgetTracker(DiagnosticSink& diagnostics, const BudgetTrackerConfig& config)
    : diagnostics_(diagnostics),
      config_(config),
      ring_(config.history_size) {
    if (config_.percentile_interval == 0) config_.percentile_interval = 1;
    if (config_.max_drain_per_cycle == 0) config_.max_drain_per_cycle = 1;
    setTargetCycleTime(config_.target_cycle_ms);
    spdlog::debug("[BudgetTracker] Initialized: target={:.2f}ms history={} deferred_cap={} drain_cap={}",
                  config_.target_cycle_ms, ring_.capacity(),
                  config_.max_deferred_per_priority, config_.max_drain_per_cycle);
}

// ============================================================================
// Cycle Recording
// ============================================================================

void BudgetTracker::recordCycle(double elapsed_ms) {
    if (!std::isfinite(elapsed_ms) || elapsed_ms < 0.0) {
        elapsed_ms = 0.0;   // negative, NaN or infinite
    }

    ring_.push(elapsed_ms);
    ++cycles_recorded_;

    if (cycles_recorded_ == 1) {
        min_ms_ = elapsed_ms;
        max_ms_ = elapsed_ms;
    } else {
        min_ms_ = std::min(min_ms_, elapsed_ms);
        max_ms_ = std::max(max_ms_, elapsed_ms);
    }

    // Lazy percentiles: O(n log n) sort amortized over the interval
    if (cycles_recorded_ % config_.percentile_interval == 0) {
        recomputePercentiles();
    }

    histogram_.record(elapsed_ms);

    drainDeferred();
}

void BudgetTracker::recomputePercentiles() {
    std::vector<double> sorted = ring_.snapshot();
    if (sorted.empty()) return;

    std::sort(sorted.begin(), sorted.end());
    const size_t n = sorted.size();

    // Nearest-rank: P(q) = sorted[ceil(n*q) - 1]
    auto rank = [n](double q) {
        size_t r = static_cast<size_t>(std::ceil(static_cast<double>(n) * q));
        r = std::max<size_t>(1, std::min(r, n));
        return r - 1;
    };

    p50_ms_ = sorted[rank(0.50)];
    p95_ms_ = sorted[rank(0.95)];
    p99_ms_ = sorted[rank(0.99)];
}

// ============================================================================
// Admission Control
// ============================================================================
// CRITICAL: always
// HIGH:     mean + cost <= target * 0.75
// MEDIUM:   mean + cost <= target * 0.60
// LOW:      mean + cost <= target * 0.40
//
// Deliberately mean-based even though percentiles are tracked: switching to
// P95/P99 gating would change observable throttling behaviour.
// ============================================================================

double BudgetTracker::admissionFraction(BudgetPriority priority) {
    switch (priority) {
        case BudgetPriority::CRITICAL: return 1.0;
        case BudgetPriority::HIGH:     return 0.75;
        case BudgetPriority::MEDIUM:   return 0.60;
        case BudgetPriority::LOW:
        default:                       return 0.40;
    }
}

bool BudgetTracker::canAfford(BudgetPriority priority, double estimated_cost_ms) const {
    if (priority == BudgetPriority::CRITICAL) {
        return true;
    }
    double threshold = config_.target_cycle_ms * admissionFraction(priority);
    return (ring_.mean() + estimated_cost_ms) <= threshold;
}

// ============================================================================
// Deferred Callbacks
// ============================================================================

bool BudgetTracker::invokeGuarded(const Callback& callback, void* context, const char* phase) {
    try {
        callback(context);
        return true;
    } catch (const std::exception& e) {
        ++callback_failures_;
        diagnostics_.report("BudgetTracker",
                            std::string(phase) + " callback error: " + e.what(),
                            Severity::ERROR);
    } catch (...) {
        ++callback_failures_;
        diagnostics_.report("BudgetTracker",
                            std::string(phase) + " callback error: unknown exception",
                            Severity::ERROR);
    }
    return false;
}

BudgetTracker::DeferResult BudgetTracker::deferOrRun(Callback callback,
                                                     BudgetPriority priority,
                                                     void* context) {
    if (!callback) {
        diagnostics_.report("BudgetTracker", "Ignoring empty callback", Severity::WARNING);
        return DeferResult::DROPPED;
    }

    if (canAfford(priority, config_.defer_probe_cost_ms)) {
        ++ran_immediately_;
        invokeGuarded(callback, context, "Immediate");
        return DeferResult::RAN_IMMEDIATELY;
    }

    auto& queue = deferred_[budgetSlot(priority)];
    if (queue.size() >= config_.max_deferred_per_priority) {
        if (priority == BudgetPriority::LOW) {
            ++dropped_callbacks_;
            diagnostics_.report("BudgetTracker",
                                "LOW deferred queue full (" + std::to_string(queue.size()) +
                                "), dropping callback (total dropped: " +
                                std::to_string(dropped_callbacks_) + ")",
                                Severity::WARNING);
            return DeferResult::DROPPED;
        }
        // Higher priorities are never dropped: the queue grows past the soft cap
        spdlog::debug("[BudgetTracker] {} deferred queue above soft cap: {}",
                      toString(priority), queue.size());
    }

    queue.push_back(DeferredCallback{priority, context, std::move(callback)});
    ++deferred_total_;
    return DeferResult::DEFERRED;
}

size_t BudgetTracker::drainDeferred() {
    size_t processed = 0;

    for (int level = 1; level <= BUDGET_PRIORITY_LEVELS; ++level) {
        BudgetPriority priority = static_cast<BudgetPriority>(level);
        if (!canAfford(priority, config_.drain_probe_cost_ms)) {
            break;  // Less urgent levels are no more affordable
        }

        auto& queue = deferred_[budgetSlot(priority)];
        while (!queue.empty()) {
            DeferredCallback item = std::move(queue.front());
            queue.pop_front();

            invokeGuarded(item.invoke, item.context, "Deferred");
            ++executed_deferred_;
            ++processed;

            if (processed >= config_.max_drain_per_cycle) {
                return processed;
            }
        }
    }
    return processed;
}

// ============================================================================
// Configuration & Statistics
// ============================================================================

void BudgetTracker::setTargetCycleTime(double ms) {
    if (!(ms > 0.0)) {
        spdlog::warn("[BudgetTracker] Invalid target cycle time {}, using {:.2f}ms",
                     ms, DEFAULT_TARGET_CYCLE_MS);
        ms = DEFAULT_TARGET_CYCLE_MS;
    }
    config_.target_cycle_ms = ms;
}

size_t BudgetTracker::pendingDeferred() const {
    size_t total = 0;
    for (const auto& q : deferred_) total += q.size();
    return total;
}

BudgetStatistics BudgetTracker::getStatistics() const {
    BudgetStatistics s;
    s.mean_ms = ring_.mean();
    s.min_ms = cycles_recorded_ > 0 ? min_ms_ : 0.0;
    s.max_ms = max_ms_;
    s.p50_ms = p50_ms_;
    s.p95_ms = p95_ms_;
    s.p99_ms = p99_ms_;
    s.target_cycle_ms = config_.target_cycle_ms;
    s.histogram = histogram_.counts();
    s.cycles_recorded = cycles_recorded_;
    s.sample_count = ring_.size();
    for (size_t i = 0; i < deferred_.size(); ++i) {
        s.pending_by_priority[i] = deferred_[i].size();
        s.pending_deferred += deferred_[i].size();
    }
    s.deferred_total = deferred_total_;
    s.executed_deferred = executed_deferred_;
    s.ran_immediately = ran_immediately_;
    s.dropped_callbacks = dropped_callbacks_;
    s.callback_failures = callback_failures_;
    return s;
}

void BudgetTracker::reset() {
    ring_.clear();
    histogram_.reset();
    min_ms_ = max_ms_ = 0.0;
    p50_ms_ = p95_ms_ = p99_ms_ = 0.0;
    cycles_recorded_ = 0;
    deferred_total_ = 0;
    executed_deferred_ = 0;
    ran_immediately_ = 0;
    dropped_callbacks_ = 0;
    callback_failures_ = 0;
    spdlog::debug("[BudgetTracker] Statistics reset ({} deferred callbacks kept)", pendingDeferred());
}

} // namespace TickGovernor
