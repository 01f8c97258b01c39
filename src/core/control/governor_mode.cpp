#include <tickgovernor/core/control/governor_mode.hpp>

using namespace TickGovernor;

GovernorModeManager::GovernorModeManager() {
    spdlog::debug("[GovernorMode] Initialized, mode={}", toString(GovernorMode::NORMAL));
}

bool GovernorModeManager::setMode(GovernorMode new_mode) {
    GovernorMode old_mode = getMode();
    if (old_mode == new_mode) {
        spdlog::debug("[GovernorMode] Mode already {}, no change", toString(new_mode));
        return false;
    }

    mode_.store(new_mode, std::memory_order_release);
    ++transitions_;
    spdlog::warn("[GovernorMode] Mode transition: {} → {}", toString(old_mode), toString(new_mode));
    return true;
}

GovernorMode GovernorModeManager::getMode() const {
    return mode_.load(std::memory_order_acquire);
}

const char* GovernorModeManager::toString(GovernorMode mode) {
    switch (mode) {
        case GovernorMode::NORMAL:   return "NORMAL";
        case GovernorMode::CRITICAL: return "CRITICAL";
        default:                     return "UNKNOWN";
    }
}
