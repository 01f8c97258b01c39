#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace TickGovernor {

// One positional event argument
using EventValue = std::variant<std::monostate, bool, int64_t, double, std::string>;
using EventArgs = std::vector<EventValue>;

/**
 * @class EventHandler
 * @brief Subscriber interface for named events.
 *
 * Identity is the handler object: subscribing the same EventHandlerPtr twice
 * to one event is a no-op.
 */
class EventHandler {
public:
    virtual ~EventHandler() = default;

    virtual void onEvent(const std::string& event_name, const EventArgs& args) = 0;

    virtual const char* name() const = 0;
};

using EventHandlerPtr = std::shared_ptr<EventHandler>;

/**
 * @class CallbackEventHandler
 * @brief Handler that calls a user-provided function
 */
class CallbackEventHandler : public EventHandler {
public:
    using Callback = std::function<void(const std::string&, const EventArgs&)>;

    explicit CallbackEventHandler(Callback cb, const char* name = "CallbackEventHandler")
        : callback_(std::move(cb)), name_(name) {}

    void onEvent(const std::string& event_name, const EventArgs& args) override {
        if (callback_) {
            callback_(event_name, args);
        }
    }

    const char* name() const override { return name_; }

private:
    Callback callback_;
    const char* name_;
};

inline EventHandlerPtr makeEventHandler(CallbackEventHandler::Callback cb,
                                        const char* name = "CallbackEventHandler") {
    return std::make_shared<CallbackEventHandler>(std::move(cb), name);
}

/**
 * @class DispatchSink
 * @brief Where finalized events are delivered.
 *
 * Implementations must isolate subscriber failures: dispatch() never throws.
 */
class DispatchSink {
public:
    virtual ~DispatchSink() = default;

    virtual void dispatch(const std::string& event_name, const EventArgs& args) = 0;
};

} // namespace TickGovernor
