#pragma once

#include <tickgovernor/core/budget/budget_priority.hpp>
#include <cstddef>
#include <cstdint>

namespace TickGovernor {

/**
 * Batch scheduler priority. HIGHER ordinal = MORE urgent (drained first).
 *
 *   LOW      (1) - drained last, first to be promoted by decay
 *   MEDIUM   (2) - default for markPending()
 *   HIGH     (3)
 *   CRITICAL (4) - drained first
 *
 * This is the reverse of BudgetPriority. Use toBudgetPriority() at the
 * admission-control boundary.
 */
enum class SchedulerPriority : uint8_t {
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3,
    CRITICAL = 4
};

constexpr int SCHEDULER_PRIORITY_LEVELS = 4;

inline SchedulerPriority clampSchedulerPriority(int ordinal) {
    if (ordinal < 1) return SchedulerPriority::LOW;
    if (ordinal > 4) return SchedulerPriority::CRITICAL;
    return static_cast<SchedulerPriority>(ordinal);
}

// 0-based slot for per-priority arrays, LOW first
inline size_t schedulerSlot(SchedulerPriority p) {
    return static_cast<size_t>(p) - 1;
}

/**
 * @brief Same urgency expressed on the budget tracker's scale
 * CRITICAL(4) -> CRITICAL(1), HIGH(3) -> HIGH(2), MEDIUM(2) -> MEDIUM(3), LOW(1) -> LOW(4)
 */
inline BudgetPriority toBudgetPriority(SchedulerPriority p) {
    return static_cast<BudgetPriority>(5 - static_cast<int>(p));
}

inline SchedulerPriority toSchedulerPriority(BudgetPriority p) {
    return static_cast<SchedulerPriority>(5 - static_cast<int>(p));
}

inline const char* toString(SchedulerPriority p) {
    switch (p) {
        case SchedulerPriority::LOW:      return "LOW";
        case SchedulerPriority::MEDIUM:   return "MEDIUM";
        case SchedulerPriority::HIGH:     return "HIGH";
        case SchedulerPriority::CRITICAL: return "CRITICAL";
        default:                          return "UNKNOWN";
    }
}

} // namespace TickGovernor
