#pragma once

#include <tickgovernor/core/events/event.hpp>
#include <tickgovernor/core/diagnostics/diagnostic_sink.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace TickGovernor {

/**
 * @class EventBus
 * @brief Plain observer registry used as the coalescer's delivery sink.
 *
 * Handlers run in subscription order. Each invocation is wrapped so a
 * failing handler is reported and counted and the remaining handlers still
 * run. Not thread-safe: driven from the host's tick thread only.
 */
class EventBus : public DispatchSink {
public:
    struct Statistics {
        uint64_t total_dispatched = 0;        // dispatch() calls
        uint64_t total_deliveries = 0;        // handler invocations that returned
        uint64_t handler_failures = 0;        // handler invocations that threw
        uint64_t unrouted = 0;                // dispatches with no handler
        size_t event_count = 0;               // event names with >= 1 handler
    };

    explicit EventBus(DiagnosticSink& diagnostics);
    ~EventBus() override = default;

    /**
     * @brief Subscribe a handler to an event
     * @return false if the handler is null or already subscribed to the event
     */
    bool subscribe(const std::string& event_name, EventHandlerPtr handler);

    /**
     * @brief Remove a handler from an event
     * @return true if the handler was subscribed
     */
    bool unsubscribe(const std::string& event_name, const EventHandlerPtr& handler);

    void dispatch(const std::string& event_name, const EventArgs& args) override;

    size_t handlerCount(const std::string& event_name) const;
    Statistics getStatistics() const;

private:
    DiagnosticSink& diagnostics_;
    std::unordered_map<std::string, std::vector<EventHandlerPtr>> handlers_;
    Statistics stats_;
};

} // namespace TickGovernor
