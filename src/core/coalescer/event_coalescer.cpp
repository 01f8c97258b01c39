#include <tickgovernor/core/coalescer/event_coalescer.hpp>
#include <algorithm>
#include <cmath>

namespace TickGovernor {

EventCoalescer::EventCoalescer(BudgetTracker& budget,
                               Clock& clock,
                               DispatchSink& sink,
                               DiagnosticSink& diagnostics,
                               const EventCoalescerConfig& config)
    : budget_(budget),
      clock_(clock),
      sink_(sink),
      diagnostics_(diagnostics),
      enabled_(config.enabled),
      intervals_ms_(config.intervals_ms) {
    for (auto& interval : intervals_ms_) {
        if (!(interval >= 0.0)) interval = 0.0;
    }
    spdlog::debug("[EventCoalescer] Initialized: intervals={:.0f}/{:.0f}/{:.0f}/{:.0f}ms enabled={}",
                  intervals_ms_[0], intervals_ms_[1], intervals_ms_[2], intervals_ms_[3], enabled_);
}

// ============================================================================
// Registration
// ============================================================================

bool EventCoalescer::registerCoalesced(const std::string& event_name,
                                       double delay_ms,
                                       EventHandlerPtr handler,
                                       CoalescerPriority priority) {
    if (event_name.empty() || !handler) {
        ++total_rejected_;
        diagnostics_.report("EventCoalescer",
                            "Rejected registration for '" + event_name + "': " +
                            (event_name.empty() ? "empty event name" : "null handler"),
                            Severity::WARNING);
        return false;
    }

    if (!(delay_ms >= 0.0)) delay_ms = DEFAULT_DELAY_MS;
    delay_ms = std::min(delay_ms, MAX_DELAY_MS);

    auto [it, created] = slots_.try_emplace(event_name);
    CoalescedSlot& slot = it->second;
    slot.delay_ms = delay_ms;
    slot.priority = priority;
    per_event_.try_emplace(event_name);

    if (created) {
        spdlog::debug("[EventCoalescer] Registered '{}' delay={:.0f}ms priority={}",
                      event_name, delay_ms, toString(priority));
    }

    auto existing = std::find(slot.subscribers.begin(), slot.subscribers.end(), handler);
    if (existing == slot.subscribers.end()) {
        slot.subscribers.push_back(std::move(handler));
    }
    return true;
}

bool EventCoalescer::unregister(const std::string& event_name, const EventHandlerPtr& handler) {
    auto it = slots_.find(event_name);
    if (it == slots_.end()) {
        return false;
    }
    auto& subs = it->second.subscribers;
    auto found = std::find(subs.begin(), subs.end(), handler);
    if (found == subs.end()) {
        return false;
    }
    subs.erase(found);
    return true;
}

bool EventCoalescer::unregisterEvent(const std::string& event_name) {
    auto it = slots_.find(event_name);
    if (it == slots_.end()) {
        return false;
    }
    timer_.cancel(event_name);
    slots_.erase(it);
    spdlog::debug("[EventCoalescer] Unregistered '{}'", event_name);
    return true;
}

bool EventCoalescer::setEventDelay(const std::string& event_name, double delay_ms) {
    auto it = slots_.find(event_name);
    if (it == slots_.end()) {
        return false;
    }
    if (std::isnan(delay_ms)) delay_ms = DEFAULT_DELAY_MS;
    it->second.delay_ms = std::max(MIN_EVENT_DELAY_MS, std::min(MAX_DELAY_MS, delay_ms));
    return true;
}

double EventCoalescer::getEventDelay(const std::string& event_name) const {
    auto it = slots_.find(event_name);
    return it != slots_.end() ? it->second.delay_ms : DEFAULT_DELAY_MS;
}

std::vector<std::string> EventCoalescer::getCoalescedEvents() const {
    std::vector<std::string> names;
    names.reserve(slots_.size());
    for (const auto& [name, slot] : slots_) {
        names.push_back(name);
    }
    return names;
}

// ============================================================================
// Submission
// ============================================================================

bool EventCoalescer::submit(const std::string& event_name, EventArgs args) {
    return submit(event_name, CoalescerPriority::MEDIUM, std::move(args));
}

bool EventCoalescer::submit(const std::string& event_name, CoalescerPriority priority, EventArgs args) {
    if (event_name.empty()) {
        ++total_rejected_;
        diagnostics_.report("EventCoalescer", "Rejected submit with empty event name",
                            Severity::WARNING);
        return false;
    }

    if (!enabled_) {
        ++passthrough_;
        sinkDispatch(event_name, args);
        return true;
    }

    auto it = slots_.find(event_name);
    if (it != slots_.end()) {
        submitRegistered(event_name, it->second, std::move(args));
    } else {
        submitAdHoc(event_name, priority, std::move(args));
    }
    return true;
}

void EventCoalescer::submitRegistered(const std::string& event_name, CoalescedSlot& slot, EventArgs args) {
    const uint64_t now_ns = clock_.nowNs();

    slot.pending_args = std::move(args);
    ++slot.accumulated;
    if (slot.accumulated == 1) {
        slot.first_queued_ns = now_ns;
        slot.defer_count = 0;
    }

    ++total_coalesced_;
    ++per_event_[event_name].coalesced;

    if (slot.priority == CoalescerPriority::CRITICAL) {
        ++immediate_critical_;
        dispatchRegistered(event_name, false);
        return;
    }

    // Never fired counts as "delay elapsed"
    double since_ms = slot.has_fired ? clock_.elapsedMs(slot.last_fire_ns) : slot.delay_ms;
    if (since_ms >= slot.delay_ms) {
        dispatchRegistered(event_name, false);
    } else if (!slot.scheduled) {
        slot.scheduled = true;
        timer_.schedule(event_name, now_ns + Clock::msToNs(slot.delay_ms - since_ms));
    }
}

void EventCoalescer::submitAdHoc(const std::string& event_name, CoalescerPriority priority, EventArgs args) {
    auto& counters = per_event_[event_name];

    if (priority == CoalescerPriority::CRITICAL) {
        ++immediate_critical_;
        ++total_coalesced_;
        ++total_dispatched_;
        ++counters.coalesced;
        ++counters.dispatched;
        recordBatch(event_name, 1);
        sinkDispatch(event_name, args);
        return;
    }

    auto [it, created] = buckets_.try_emplace(event_name);
    if (created) {
        it->second.priority = priority;
    }
    it->second.args.push_back(std::move(args));
    ++total_coalesced_;
    ++counters.coalesced;
}

void EventCoalescer::dispatchEvent(const std::string& event_name, const EventArgs& args) {
    sinkDispatch(event_name, args);
}

// ============================================================================
// Delivery
// ============================================================================
// Unaffordable dispatches are postponed until the event's defer count or
// wait window is exhausted, then delivered as an emergency flush.
// ============================================================================

bool EventCoalescer::dispatchRegistered(const std::string& event_name, bool force) {
    auto it = slots_.find(event_name);
    if (it == slots_.end() || it->second.accumulated == 0) {
        return false;
    }
    CoalescedSlot& slot = it->second;
    const uint64_t now_ns = clock_.nowNs();

    if (!force && !budget_.canAfford(toBudgetPriority(slot.priority), DISPATCH_PROBE_COST_MS)) {
        ++slot.defer_count;
        ++budget_defers_;

        const size_t idx = coalescerSlot(slot.priority);
        const bool waited_too_long = clock_.elapsedMs(slot.first_queued_ns) >= MAX_DEFER_WINDOW_MS[idx];
        if (slot.priority != CoalescerPriority::CRITICAL &&
            slot.defer_count < MAX_BUDGET_DEFERS[idx] && !waited_too_long) {
            return false;
        }
        if (slot.priority != CoalescerPriority::CRITICAL) {
            ++emergency_flushes_;
            diagnostics_.report("EventCoalescer",
                                "Emergency flush of '" + event_name + "' after " +
                                std::to_string(slot.defer_count) + " budget defers",
                                Severity::WARNING);
        }
    }

    // Reset the slot before calling out: subscribers may re-submit or unregister
    EventArgs args = std::move(slot.pending_args);
    std::vector<EventHandlerPtr> subscribers = slot.subscribers;
    const size_t batch = slot.accumulated;

    slot.pending_args.clear();
    slot.accumulated = 0;
    slot.first_queued_ns = 0;
    slot.defer_count = 0;
    slot.has_fired = true;
    slot.last_fire_ns = now_ns;
    if (slot.scheduled) {
        timer_.cancel(event_name);
        slot.scheduled = false;
    }

    ++total_dispatched_;
    ++per_event_[event_name].dispatched;
    recordBatch(event_name, batch);

    for (const auto& subscriber : subscribers) {
        try {
            subscriber->onEvent(event_name, args);
        } catch (const std::exception& e) {
            ++subscriber_failures_;
            diagnostics_.report("EventCoalescer",
                                "Subscriber " + std::string(subscriber->name()) + " failed on '" +
                                event_name + "': " + e.what(),
                                Severity::ERROR);
        } catch (...) {
            ++subscriber_failures_;
            diagnostics_.report("EventCoalescer",
                                "Subscriber " + std::string(subscriber->name()) + " failed on '" +
                                event_name + "': unknown exception",
                                Severity::ERROR);
        }
    }
    return true;
}

void EventCoalescer::flushBucket(const std::string& event_name, QueuedBucket& bucket) {
    const size_t count = bucket.args.size();
    last_bucket_flush_ns_[event_name] = clock_.nowNs();

    total_dispatched_ += count;
    per_event_[event_name].dispatched += count;
    recordBatch(event_name, count);

    for (const auto& args : bucket.args) {
        sinkDispatch(event_name, args);
    }
}

void EventCoalescer::sinkDispatch(const std::string& event_name, const EventArgs& args) {
    try {
        sink_.dispatch(event_name, args);
    } catch (const std::exception& e) {
        ++subscriber_failures_;
        diagnostics_.report("EventCoalescer",
                            "Dispatch sink failed on '" + event_name + "': " + e.what(),
                            Severity::ERROR);
    } catch (...) {
        ++subscriber_failures_;
        diagnostics_.report("EventCoalescer",
                            "Dispatch sink failed on '" + event_name + "': unknown exception",
                            Severity::ERROR);
    }
}

void EventCoalescer::recordBatch(const std::string& event_name, size_t size) {
    auto& c = per_event_[event_name];
    c.batch_min = c.batch_count == 0 ? size : std::min(c.batch_min, size);
    c.batch_max = std::max(c.batch_max, size);
    c.batch_total += size;
    ++c.batch_count;
}

// ============================================================================
// Driving
// ============================================================================

void EventCoalescer::tick() {
    const uint64_t now_ns = clock_.nowNs();

    // 1. Delayed wake-ups
    std::vector<std::string> fired = timer_.collectDue(now_ns);
    for (const auto& name : fired) {
        auto it = slots_.find(name);
        if (it == slots_.end()) continue;
        it->second.scheduled = false;
        dispatchRegistered(name, false);
    }

    // 2. Ad-hoc buckets whose interval elapsed
    std::vector<std::string> due_buckets;
    for (const auto& [name, bucket] : buckets_) {
        auto last = last_bucket_flush_ns_.find(name);
        double interval = intervals_ms_[coalescerSlot(bucket.priority)];
        if (last == last_bucket_flush_ns_.end() || clock_.elapsedMs(last->second) >= interval) {
            due_buckets.push_back(name);
        }
    }
    for (const auto& name : due_buckets) {
        auto it = buckets_.find(name);
        if (it == buckets_.end()) continue;
        QueuedBucket bucket = std::move(it->second);
        buckets_.erase(it);
        flushBucket(name, bucket);
    }

    // 3. Slots postponed by the budget with no wake-up pending
    std::vector<std::string> retry;
    for (const auto& [name, slot] : slots_) {
        if (slot.accumulated > 0 && !slot.scheduled &&
            std::find(fired.begin(), fired.end(), name) == fired.end()) {
            retry.push_back(name);
        }
    }
    for (const auto& name : retry) {
        dispatchRegistered(name, false);
    }
}

void EventCoalescer::flush() {
    std::map<std::string, QueuedBucket> buckets;
    buckets.swap(buckets_);
    for (auto& [name, bucket] : buckets) {
        flushBucket(name, bucket);
    }

    std::vector<std::string> pending;
    for (const auto& [name, slot] : slots_) {
        if (slot.accumulated > 0) pending.push_back(name);
    }
    for (const auto& name : pending) {
        dispatchRegistered(name, true);
    }

    if (!buckets.empty() || !pending.empty()) {
        spdlog::debug("[EventCoalescer] Flushed {} buckets and {} coalesced events",
                      buckets.size(), pending.size());
    }
}

// ============================================================================
// Configuration & Statistics
// ============================================================================

void EventCoalescer::setEnabled(bool enabled) {
    if (enabled_ == enabled) return;
    enabled_ = enabled;
    spdlog::info("[EventCoalescer] {}", enabled ? "Enabled" : "Disabled (pass-through)");
}

void EventCoalescer::setCoalesceInterval(CoalescerPriority priority, double interval_ms) {
    if (!(interval_ms >= 0.0)) interval_ms = 0.0;
    intervals_ms_[coalescerSlot(priority)] = interval_ms;
}

double EventCoalescer::getCoalesceInterval(CoalescerPriority priority) const {
    return intervals_ms_[coalescerSlot(priority)];
}

size_t EventCoalescer::pendingCount() const {
    size_t pending = buckets_.size();
    for (const auto& [name, slot] : slots_) {
        if (slot.accumulated > 0) ++pending;
    }
    return pending;
}

CoalescerStatistics EventCoalescer::getStatistics() const {
    CoalescerStatistics s;
    s.total_coalesced = total_coalesced_;
    s.total_dispatched = total_dispatched_;
    s.total_rejected = total_rejected_;
    s.budget_defers = budget_defers_;
    s.emergency_flushes = emergency_flushes_;
    s.immediate_critical = immediate_critical_;
    s.subscriber_failures = subscriber_failures_;
    s.passthrough = passthrough_;
    s.queued_events = buckets_.size();
    s.registered_events = slots_.size();
    for (const auto& [name, slot] : slots_) {
        if (slot.accumulated > 0) ++s.pending_registered;
    }

    if (total_coalesced_ > 0 && total_coalesced_ > total_dispatched_) {
        s.savings_percent = static_cast<double>(total_coalesced_ - total_dispatched_) * 100.0 /
                            static_cast<double>(total_coalesced_);
    }

    for (const auto& [name, c] : per_event_) {
        PerEventStats e;
        e.coalesced = c.coalesced;
        e.dispatched = c.dispatched;
        e.saved = c.coalesced > c.dispatched ? c.coalesced - c.dispatched : 0;
        e.batch.min = c.batch_min;
        e.batch.max = c.batch_max;
        e.batch.count = c.batch_count;
        e.batch.avg = c.batch_count > 0
            ? static_cast<double>(c.batch_total) / static_cast<double>(c.batch_count) : 0.0;
        s.per_event.emplace(name, e);
    }
    return s;
}

void EventCoalescer::resetStatistics() {
    total_coalesced_ = 0;
    total_dispatched_ = 0;
    total_rejected_ = 0;
    budget_defers_ = 0;
    emergency_flushes_ = 0;
    immediate_critical_ = 0;
    subscriber_failures_ = 0;
    passthrough_ = 0;
    per_event_.clear();
    for (const auto& [name, slot] : slots_) {
        per_event_.try_emplace(name);
    }
}

} // namespace TickGovernor
