#pragma once
#include <atomic>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace TickGovernor {

/**
 * Host-level operating mode.
 *
 * NORMAL:   coalescing and batching run on their usual delays
 * CRITICAL: the host is in a latency-sensitive phase (e.g. combat)
 *
 * Every real transition is a synchronization point: pending events and
 * pending targets are flushed so neither phase sees the other's stale state.
 */
enum class GovernorMode : uint8_t {
    NORMAL = 0,
    CRITICAL = 1
};

/**
 * The governor is the only writer. Readers on other threads may poll
 * getMode() without locking.
 */
class GovernorModeManager {
public:
    GovernorModeManager();
    ~GovernorModeManager() = default;

    /**
     * @return true if the mode actually changed
     */
    bool setMode(GovernorMode new_mode);

    GovernorMode getMode() const;

    bool isCritical() const {
        return getMode() == GovernorMode::CRITICAL;
    }

    uint64_t transitionCount() const { return transitions_; }

    static const char* toString(GovernorMode mode);

private:
    std::atomic<GovernorMode> mode_{GovernorMode::NORMAL};
    uint64_t transitions_ = 0;
};

} // namespace TickGovernor
