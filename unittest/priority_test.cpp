// ============================================================================
// PRIORITY SCALE UNIT TESTS
// ============================================================================
// The budget tracker and coalescer count urgency down from CRITICAL=1, the
// scheduler counts it up to CRITICAL=4. These tests pin the conversions.
// ============================================================================

#include <gtest/gtest.h>
#include <tickgovernor/core/budget/budget_priority.hpp>
#include <tickgovernor/core/coalescer/coalescer_priority.hpp>
#include <tickgovernor/core/scheduler/scheduler_priority.hpp>
#include <string>

using namespace TickGovernor;

TEST(PriorityTest, SchedulerToBudgetPreservesUrgency) {
    EXPECT_EQ(toBudgetPriority(SchedulerPriority::CRITICAL), BudgetPriority::CRITICAL);
    EXPECT_EQ(toBudgetPriority(SchedulerPriority::HIGH), BudgetPriority::HIGH);
    EXPECT_EQ(toBudgetPriority(SchedulerPriority::MEDIUM), BudgetPriority::MEDIUM);
    EXPECT_EQ(toBudgetPriority(SchedulerPriority::LOW), BudgetPriority::LOW);
}

TEST(PriorityTest, BudgetToSchedulerIsInverse) {
    for (int p = 1; p <= 4; ++p) {
        auto scheduler = static_cast<SchedulerPriority>(p);
        EXPECT_EQ(toSchedulerPriority(toBudgetPriority(scheduler)), scheduler);
    }
}

TEST(PriorityTest, CoalescerSharesBudgetDirection) {
    EXPECT_EQ(toBudgetPriority(CoalescerPriority::CRITICAL), BudgetPriority::CRITICAL);
    EXPECT_EQ(toBudgetPriority(CoalescerPriority::LOW), BudgetPriority::LOW);

    EXPECT_EQ(toCoalescerPriority(SchedulerPriority::HIGH), CoalescerPriority::HIGH);
    EXPECT_EQ(toSchedulerPriority(CoalescerPriority::MEDIUM), SchedulerPriority::MEDIUM);
}

TEST(PriorityTest, OrdinalsClampToRange) {
    EXPECT_EQ(clampBudgetPriority(0), BudgetPriority::CRITICAL);
    EXPECT_EQ(clampBudgetPriority(7), BudgetPriority::LOW);

    EXPECT_EQ(clampSchedulerPriority(-3), SchedulerPriority::LOW);
    EXPECT_EQ(clampSchedulerPriority(5), SchedulerPriority::CRITICAL);
    EXPECT_EQ(clampSchedulerPriority(3), SchedulerPriority::HIGH);

    EXPECT_EQ(clampCoalescerPriority(0), CoalescerPriority::CRITICAL);
    EXPECT_EQ(clampCoalescerPriority(2), CoalescerPriority::HIGH);
}

TEST(PriorityTest, SlotsOrdering) {
    EXPECT_EQ(budgetSlot(BudgetPriority::CRITICAL), 0u);
    EXPECT_EQ(coalescerSlot(CoalescerPriority::LOW), 3u);
    EXPECT_EQ(schedulerSlot(SchedulerPriority::LOW), 0u);
    EXPECT_EQ(schedulerSlot(SchedulerPriority::CRITICAL), 3u);
}

TEST(PriorityTest, Names) {
    EXPECT_EQ(std::string(toString(BudgetPriority::MEDIUM)), "MEDIUM");
    EXPECT_EQ(std::string(toString(SchedulerPriority::CRITICAL)), "CRITICAL");
    EXPECT_EQ(std::string(toString(CoalescerPriority::HIGH)), "HIGH");
}
