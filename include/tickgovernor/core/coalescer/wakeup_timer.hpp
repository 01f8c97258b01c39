#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace TickGovernor {

/**
 * @class WakeupTimer
 * @brief Single-shot delayed wake-ups keyed by name
 *
 * At most one wake-up per name is pending. Nothing fires on its own: the
 * owner polls collectDue() from its tick.
 */
class WakeupTimer {
public:
    /**
     * @return false if a wake-up for this name is already pending (unchanged)
     */
    bool schedule(const std::string& name, uint64_t due_ns);

    // @return true if a pending wake-up was removed
    bool cancel(const std::string& name);

    /**
     * @brief Remove and return every wake-up due at or before now_ns,
     * earliest first (ties by name)
     */
    std::vector<std::string> collectDue(uint64_t now_ns);

    size_t pending() const { return due_.size(); }
    void clear() { due_.clear(); }

private:
    std::unordered_map<std::string, uint64_t> due_;
};

} // namespace TickGovernor
