#include <tickgovernor/core/events/event_bus.hpp>
#include <algorithm>

namespace TickGovernor {

EventBus::EventBus(DiagnosticSink& diagnostics) : diagnostics_(diagnostics) {
    spdlog::debug("[EventBus] Initialized (diagnostics: {})", diagnostics_.name());
}

bool EventBus::subscribe(const std::string& event_name, EventHandlerPtr handler) {
    if (!handler) {
        spdlog::warn("[EventBus] Ignoring null handler for event {}", event_name);
        return false;
    }

    auto& list = handlers_[event_name];
    if (std::find(list.begin(), list.end(), handler) != list.end()) {
        spdlog::debug("[EventBus] Handler {} already subscribed to {}", handler->name(), event_name);
        return false;
    }
    list.push_back(std::move(handler));
    return true;
}

bool EventBus::unsubscribe(const std::string& event_name, const EventHandlerPtr& handler) {
    auto it = handlers_.find(event_name);
    if (it == handlers_.end()) return false;

    auto& list = it->second;
    auto pos = std::find(list.begin(), list.end(), handler);
    if (pos == list.end()) return false;

    list.erase(pos);
    if (list.empty()) {
        handlers_.erase(it);
    }
    return true;
}

void EventBus::dispatch(const std::string& event_name, const EventArgs& args) {
    ++stats_.total_dispatched;

    auto it = handlers_.find(event_name);
    if (it == handlers_.end() || it->second.empty()) {
        ++stats_.unrouted;
        return;
    }

    // Copy: a handler may (un)subscribe while we iterate
    std::vector<EventHandlerPtr> snapshot = it->second;
    for (auto& handler : snapshot) {
        try {
            handler->onEvent(event_name, args);
            ++stats_.total_deliveries;
        } catch (const std::exception& e) {
            ++stats_.handler_failures;
            diagnostics_.report("EventBus",
                "Handler " + std::string(handler->name()) + " failed on [" + event_name + "]: " + e.what(),
                Severity::ERROR);
        } catch (...) {
            ++stats_.handler_failures;
            diagnostics_.report("EventBus",
                "Handler " + std::string(handler->name()) + " failed on [" + event_name + "]: unknown exception",
                Severity::ERROR);
        }
    }
}

size_t EventBus::handlerCount(const std::string& event_name) const {
    auto it = handlers_.find(event_name);
    return it == handlers_.end() ? 0 : it->second.size();
}

EventBus::Statistics EventBus::getStatistics() const {
    Statistics s = stats_;
    s.event_count = handlers_.size();
    return s;
}

} // namespace TickGovernor
