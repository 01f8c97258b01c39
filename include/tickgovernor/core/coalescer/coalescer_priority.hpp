#pragma once

#include <tickgovernor/core/budget/budget_priority.hpp>
#include <tickgovernor/core/scheduler/scheduler_priority.hpp>
#include <cstddef>
#include <cstdint>

namespace TickGovernor {

/**
 * Event coalescer priority. LOWER ordinal = MORE urgent.
 *
 *   CRITICAL (1) - dispatched immediately, never deferred by the budget
 *   HIGH     (2)
 *   MEDIUM   (3) - default
 *   LOW      (4)
 *
 * Same direction as BudgetPriority, opposite of SchedulerPriority.
 */
enum class CoalescerPriority : uint8_t {
    CRITICAL = 1,
    HIGH = 2,
    MEDIUM = 3,
    LOW = 4
};

constexpr int COALESCER_PRIORITY_LEVELS = 4;

inline CoalescerPriority clampCoalescerPriority(int ordinal) {
    if (ordinal < 1) return CoalescerPriority::CRITICAL;
    if (ordinal > 4) return CoalescerPriority::LOW;
    return static_cast<CoalescerPriority>(ordinal);
}

// 0-based slot, CRITICAL first
inline size_t coalescerSlot(CoalescerPriority p) {
    return static_cast<size_t>(p) - 1;
}

inline BudgetPriority toBudgetPriority(CoalescerPriority p) {
    return static_cast<BudgetPriority>(static_cast<int>(p));
}

inline CoalescerPriority toCoalescerPriority(SchedulerPriority p) {
    return static_cast<CoalescerPriority>(5 - static_cast<int>(p));
}

inline SchedulerPriority toSchedulerPriority(CoalescerPriority p) {
    return static_cast<SchedulerPriority>(5 - static_cast<int>(p));
}

inline const char* toString(CoalescerPriority p) {
    switch (p) {
        case CoalescerPriority::CRITICAL: return "CRITICAL";
        case CoalescerPriority::HIGH:     return "HIGH";
        case CoalescerPriority::MEDIUM:   return "MEDIUM";
        case CoalescerPriority::LOW:      return "LOW";
        default:                          return "UNKNOWN";
    }
}

} // namespace TickGovernor
