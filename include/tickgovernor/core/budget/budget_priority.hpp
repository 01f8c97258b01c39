#pragma once

#include <cstddef>
#include <cstdint>

namespace TickGovernor {

/**
 * Budget tracker priority. LOWER ordinal = MORE urgent.
 *
 *   CRITICAL (1) - always admitted
 *   HIGH     (2) - admitted while mean + cost <= 75% of target
 *   MEDIUM   (3) - admitted while mean + cost <= 60% of target
 *   LOW      (4) - admitted while mean + cost <= 40% of target, droppable
 *
 * The batch scheduler numbers its levels the other way round; see
 * scheduler_priority.hpp. Never cast between the two, convert explicitly.
 */
enum class BudgetPriority : uint8_t {
    CRITICAL = 1,
    HIGH = 2,
    MEDIUM = 3,
    LOW = 4
};

constexpr int BUDGET_PRIORITY_LEVELS = 4;

// Out-of-range ordinals clamp to the nearest level
inline BudgetPriority clampBudgetPriority(int ordinal) {
    if (ordinal < 1) return BudgetPriority::CRITICAL;
    if (ordinal > 4) return BudgetPriority::LOW;
    return static_cast<BudgetPriority>(ordinal);
}

// 0-based slot for per-priority arrays, most urgent first
inline size_t budgetSlot(BudgetPriority p) {
    return static_cast<size_t>(p) - 1;
}

inline const char* toString(BudgetPriority p) {
    switch (p) {
        case BudgetPriority::CRITICAL: return "CRITICAL";
        case BudgetPriority::HIGH:     return "HIGH";
        case BudgetPriority::MEDIUM:   return "MEDIUM";
        case BudgetPriority::LOW:      return "LOW";
        default:                       return "UNKNOWN";
    }
}

} // namespace TickGovernor
