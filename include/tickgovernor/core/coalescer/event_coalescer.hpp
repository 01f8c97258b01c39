#pragma once

#include <tickgovernor/core/budget/budget_tracker.hpp>
#include <tickgovernor/core/coalescer/coalescer_priority.hpp>
#include <tickgovernor/core/coalescer/wakeup_timer.hpp>
#include <tickgovernor/core/diagnostics/diagnostic_sink.hpp>
#include <tickgovernor/core/events/event.hpp>
#include <tickgovernor/core/utils/clock.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace TickGovernor {

struct EventCoalescerConfig {
    bool enabled = true;

    // Ad-hoc flush interval per priority, CRITICAL first
    std::array<double, COALESCER_PRIORITY_LEVELS> intervals_ms{{0.0, 10.0, 30.0, 50.0}};
};

struct EventBatchStats {
    size_t min = 0;
    size_t max = 0;
    double avg = 0.0;
    uint64_t count = 0;
};

struct PerEventStats {
    uint64_t coalesced = 0;
    uint64_t dispatched = 0;
    uint64_t saved = 0;
    EventBatchStats batch;
};

struct CoalescerStatistics {
    uint64_t total_coalesced = 0;
    uint64_t total_dispatched = 0;
    uint64_t total_rejected = 0;
    uint64_t budget_defers = 0;
    uint64_t emergency_flushes = 0;
    uint64_t immediate_critical = 0;
    uint64_t subscriber_failures = 0;
    uint64_t passthrough = 0;

    size_t queued_events = 0;       // Ad-hoc buckets waiting for their interval
    size_t pending_registered = 0;  // Registered slots holding undelivered args
    size_t registered_events = 0;

    double savings_percent = 0.0;   // (coalesced - dispatched) / coalesced * 100
    std::map<std::string, PerEventStats> per_event;
};

/**
 * @class EventCoalescer
 * @brief Collapses bursts of named events into trailing-edge dispatches
 *
 * Registered mode: registerCoalesced() gives an event a slot. Submits
 * overwrite the slot's args (last write wins) and at most one delayed
 * wake-up per event delivers them to the event's subscribers. The budget
 * tracker may postpone delivery; once an event exhausts its defers or its
 * wait window it is delivered anyway (emergency flush).
 *
 * Ad-hoc mode: events without a slot are bucketed by name and handed to
 * the dispatch sink wholesale once their priority's interval has elapsed.
 *
 * Nothing fires on its own: the host drives delivery through tick().
 */
class EventCoalescer {
public:
    static constexpr double DEFAULT_DELAY_MS = 50.0;
    static constexpr double MAX_DELAY_MS = 500.0;
    static constexpr double MIN_EVENT_DELAY_MS = 10.0;
    static constexpr double DISPATCH_PROBE_COST_MS = 0.5;

    // Indexed by coalescerSlot(), CRITICAL first
    static constexpr std::array<uint32_t, COALESCER_PRIORITY_LEVELS> MAX_BUDGET_DEFERS{{0, 5, 7, 9}};
    static constexpr std::array<double, COALESCER_PRIORITY_LEVELS> MAX_DEFER_WINDOW_MS{{0.0, 350.0, 450.0, 550.0}};

    EventCoalescer(BudgetTracker& budget,
                   Clock& clock,
                   DispatchSink& sink,
                   DiagnosticSink& diagnostics,
                   const EventCoalescerConfig& config = EventCoalescerConfig{});
    ~EventCoalescer() = default;

    EventCoalescer(const EventCoalescer&) = delete;
    EventCoalescer& operator=(const EventCoalescer&) = delete;

    // ========== Registration ==========

    /**
     * @brief Subscribe a handler to coalesced delivery of an event
     *
     * The first registration creates the slot; later ones update delay and
     * priority. Registering the same handler twice is a no-op.
     * @param delay_ms Clamped to [0, 500]; negative or NaN means 50
     * @return false if the name is empty or the handler is null
     */
    bool registerCoalesced(const std::string& event_name,
                           double delay_ms,
                           EventHandlerPtr handler,
                           CoalescerPriority priority = CoalescerPriority::MEDIUM);

    // Remove one subscriber; the slot stays so pending args still drain
    bool unregister(const std::string& event_name, const EventHandlerPtr& handler);

    // Drop the slot, its pending args and its wake-up
    bool unregisterEvent(const std::string& event_name);

    bool setEventDelay(const std::string& event_name, double delay_ms);
    double getEventDelay(const std::string& event_name) const;
    std::vector<std::string> getCoalescedEvents() const;

    // ========== Submission ==========

    /**
     * @brief Submit an occurrence of an event
     *
     * Registered events use their slot's priority. Unregistered events are
     * bucketed at MEDIUM unless a priority is given; CRITICAL ones go to the
     * sink immediately. While disabled everything passes straight through.
     * @return false if the event name is empty
     */
    bool submit(const std::string& event_name, EventArgs args = {});
    bool submit(const std::string& event_name, CoalescerPriority priority, EventArgs args = {});

    // Direct pass-through to the sink, no coalescing or accounting
    void dispatchEvent(const std::string& event_name, const EventArgs& args);

    // ========== Driving ==========

    /**
     * @brief Per-cycle work: fire due wake-ups, flush ad-hoc buckets whose
     * interval elapsed, retry slots postponed by the budget
     */
    void tick();

    /**
     * @brief Deliver everything now, bypassing delays and the budget
     */
    void flush();

    // ========== Configuration & Statistics ==========

    void setEnabled(bool enabled);
    bool isEnabled() const { return enabled_; }

    void setCoalesceInterval(CoalescerPriority priority, double interval_ms);
    double getCoalesceInterval(CoalescerPriority priority) const;

    size_t pendingCount() const;

    CoalescerStatistics getStatistics() const;
    void resetStatistics();

private:
    struct CoalescedSlot {
        std::vector<EventHandlerPtr> subscribers;
        double delay_ms = DEFAULT_DELAY_MS;
        CoalescerPriority priority = CoalescerPriority::MEDIUM;
        EventArgs pending_args;
        uint32_t accumulated = 0;
        uint64_t first_queued_ns = 0;
        uint32_t defer_count = 0;
        bool has_fired = false;
        uint64_t last_fire_ns = 0;
        bool scheduled = false;
    };

    struct QueuedBucket {
        CoalescerPriority priority = CoalescerPriority::MEDIUM;
        std::vector<EventArgs> args;
    };

    struct EventCounters {
        uint64_t coalesced = 0;
        uint64_t dispatched = 0;
        size_t batch_min = 0;
        size_t batch_max = 0;
        uint64_t batch_total = 0;
        uint64_t batch_count = 0;
    };

    void submitRegistered(const std::string& event_name, CoalescedSlot& slot, EventArgs args);
    void submitAdHoc(const std::string& event_name, CoalescerPriority priority, EventArgs args);

    /**
     * @brief Deliver a slot's pending args to its subscribers
     * @param force Skip the budget check (flush)
     * @return true if delivered; false if nothing pending or postponed
     */
    bool dispatchRegistered(const std::string& event_name, bool force);
    void flushBucket(const std::string& event_name, QueuedBucket& bucket);

    void recordBatch(const std::string& event_name, size_t size);
    void sinkDispatch(const std::string& event_name, const EventArgs& args);

    BudgetTracker& budget_;
    Clock& clock_;
    DispatchSink& sink_;
    DiagnosticSink& diagnostics_;

    bool enabled_;
    std::array<double, COALESCER_PRIORITY_LEVELS> intervals_ms_;

    std::map<std::string, CoalescedSlot> slots_;
    std::map<std::string, QueuedBucket> buckets_;
    std::map<std::string, uint64_t> last_bucket_flush_ns_;
    WakeupTimer timer_;

    std::map<std::string, EventCounters> per_event_;
    uint64_t total_coalesced_ = 0;
    uint64_t total_dispatched_ = 0;
    uint64_t total_rejected_ = 0;
    uint64_t budget_defers_ = 0;
    uint64_t emergency_flushes_ = 0;
    uint64_t immediate_critical_ = 0;
    uint64_t subscriber_failures_ = 0;
    uint64_t passthrough_ = 0;
};

} // namespace TickGovernor
