// ============================================================================
// BUDGET TRACKER UNIT TESTS
// ============================================================================
// Tests for cycle statistics, admission control and deferred callbacks
// ============================================================================

#include <gtest/gtest.h>
#include <tickgovernor/core/budget/budget_tracker.hpp>
#include <tickgovernor/core/diagnostics/buffered_diagnostic_sink.hpp>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace TickGovernor;

class BudgetTrackerTest : public ::testing::Test {
protected:
    void feed(int cycles, double ms) {
        for (int i = 0; i < cycles; ++i) {
            tracker.recordCycle(ms);
        }
    }

    BufferedDiagnosticSink diagnostics;
    BudgetTracker tracker{diagnostics};
};

// ============================================================================
// ADMISSION CONTROL TESTS
// ============================================================================

TEST_F(BudgetTrackerTest, LowPriorityRejectedUnderSustainedLoad) {
    feed(40, 20.0);

    EXPECT_DOUBLE_EQ(tracker.currentMean(), 20.0);
    EXPECT_FALSE(tracker.canAfford(BudgetPriority::LOW, 1.0));
    EXPECT_FALSE(tracker.canAfford(BudgetPriority::MEDIUM, 1.0));
    EXPECT_FALSE(tracker.canAfford(BudgetPriority::HIGH, 1.0));
}

TEST_F(BudgetTrackerTest, LightLoadAdmitsByPriorityFraction) {
    feed(40, 8.0);

    // 8 + 1 against 16.67 * {0.75, 0.60, 0.40}
    EXPECT_TRUE(tracker.canAfford(BudgetPriority::HIGH, 1.0));
    EXPECT_TRUE(tracker.canAfford(BudgetPriority::MEDIUM, 1.0));
    EXPECT_FALSE(tracker.canAfford(BudgetPriority::LOW, 1.0));
}

TEST_F(BudgetTrackerTest, LowPriorityAdmittedWithHeadroom) {
    feed(40, 20.0);
    EXPECT_FALSE(tracker.canAfford(BudgetPriority::LOW, 1.0));

    // Ring holds 100 samples: push the heavy ones out
    feed(100, 5.0);
    EXPECT_DOUBLE_EQ(tracker.currentMean(), 5.0);
    EXPECT_TRUE(tracker.canAfford(BudgetPriority::LOW, 1.0));
}

TEST_F(BudgetTrackerTest, CriticalAlwaysAffordable) {
    feed(50, 100.0);
    EXPECT_TRUE(tracker.canAfford(BudgetPriority::CRITICAL, 1000.0));
}

TEST_F(BudgetTrackerTest, EmptyHistoryAdmitsEverything) {
    EXPECT_TRUE(tracker.canAfford(BudgetPriority::LOW, 1.0));
    EXPECT_TRUE(tracker.canAfford(BudgetPriority::HIGH, 1.0));
}

TEST_F(BudgetTrackerTest, TargetCycleTimeShiftsThresholds) {
    feed(40, 10.0);
    EXPECT_FALSE(tracker.canAfford(BudgetPriority::MEDIUM, 1.0));  // 11 > 10.0

    tracker.setTargetCycleTime(33.33);
    EXPECT_TRUE(tracker.canAfford(BudgetPriority::MEDIUM, 1.0));   // 11 <= 19.998
}

TEST_F(BudgetTrackerTest, InvalidTargetFallsBackToDefault) {
    tracker.setTargetCycleTime(0.0);
    EXPECT_DOUBLE_EQ(tracker.getTargetCycleTime(), BudgetTracker::DEFAULT_TARGET_CYCLE_MS);

    tracker.setTargetCycleTime(-5.0);
    EXPECT_DOUBLE_EQ(tracker.getTargetCycleTime(), BudgetTracker::DEFAULT_TARGET_CYCLE_MS);
}

// ============================================================================
// STATISTICS TESTS
// ============================================================================

TEST_F(BudgetTrackerTest, TracksMinMaxAndSampleWindow) {
    tracker.recordCycle(12.0);
    tracker.recordCycle(3.0);
    tracker.recordCycle(40.0);
    feed(147, 10.0);

    auto stats = tracker.getStatistics();
    EXPECT_EQ(stats.cycles_recorded, 150u);
    EXPECT_EQ(stats.sample_count, 100u);
    EXPECT_DOUBLE_EQ(stats.min_ms, 3.0);
    EXPECT_DOUBLE_EQ(stats.max_ms, 40.0);
    EXPECT_DOUBLE_EQ(stats.mean_ms, 10.0);
}

TEST_F(BudgetTrackerTest, NegativeAndNaNRecordedAsZero) {
    tracker.recordCycle(-4.0);
    tracker.recordCycle(std::numeric_limits<double>::quiet_NaN());

    auto stats = tracker.getStatistics();
    EXPECT_EQ(stats.sample_count, 2u);
    EXPECT_DOUBLE_EQ(stats.mean_ms, 0.0);
    EXPECT_EQ(stats.histogram[0], 2u);
}

TEST_F(BudgetTrackerTest, InfiniteCycleRecordedAsZero) {
    tracker.recordCycle(std::numeric_limits<double>::infinity());
    feed(200, 5.0);

    auto stats = tracker.getStatistics();
    EXPECT_DOUBLE_EQ(stats.mean_ms, 5.0);
    EXPECT_DOUBLE_EQ(stats.max_ms, 5.0);
    EXPECT_TRUE(tracker.canAfford(BudgetPriority::HIGH, 1.0));
    EXPECT_TRUE(tracker.canAfford(BudgetPriority::LOW, 1.0));
}

TEST_F(BudgetTrackerTest, PercentilesRecomputedEveryThirtyCycles) {
    feed(29, 10.0);
    EXPECT_DOUBLE_EQ(tracker.getStatistics().p95_ms, 0.0);  // Stale until cycle 30

    tracker.recordCycle(10.0);
    EXPECT_DOUBLE_EQ(tracker.getStatistics().p95_ms, 10.0);
}

TEST_F(BudgetTrackerTest, NearestRankPercentiles) {
    for (int i = 1; i <= 100; ++i) {
        tracker.recordCycle(static_cast<double>(i));
    }
    tracker.recomputePercentiles();

    auto stats = tracker.getStatistics();
    EXPECT_DOUBLE_EQ(stats.p50_ms, 50.0);
    EXPECT_DOUBLE_EQ(stats.p95_ms, 95.0);
    EXPECT_DOUBLE_EQ(stats.p99_ms, 99.0);
}

TEST_F(BudgetTrackerTest, PercentilesAreMonotonic) {
    // Irregular sequence: spikes mixed into steady cycles
    for (int i = 0; i < 300; ++i) {
        double ms = 8.0 + static_cast<double>((i * 37) % 23);
        if (i % 17 == 0) ms += 40.0;
        tracker.recordCycle(ms);
        if (i % 30 == 29) {
            auto stats = tracker.getStatistics();
            EXPECT_LE(stats.p50_ms, stats.p95_ms);
            EXPECT_LE(stats.p95_ms, stats.p99_ms);
        }
    }
}

TEST_F(BudgetTrackerTest, HistogramBuckets) {
    for (double ms : {3.0, 7.0, 12.0, 17.0, 25.0, 40.0, 5.0}) {
        tracker.recordCycle(ms);
    }
    auto h = tracker.getStatistics().histogram;
    EXPECT_EQ(h[0], 1u);   // <5
    EXPECT_EQ(h[1], 2u);   // <10 (5 and 7)
    EXPECT_EQ(h[2], 1u);   // <15
    EXPECT_EQ(h[3], 1u);   // <20
    EXPECT_EQ(h[4], 1u);   // <30
    EXPECT_EQ(h[5], 1u);   // >=30
}

// ============================================================================
// DEFERRED CALLBACK TESTS
// ============================================================================

TEST_F(BudgetTrackerTest, RunsImmediatelyWhenAffordable) {
    int value = 0;
    auto result = tracker.deferOrRun([](void* ctx) { *static_cast<int*>(ctx) = 7; },
                                     BudgetPriority::LOW, &value);

    EXPECT_EQ(result, BudgetTracker::DeferResult::RAN_IMMEDIATELY);
    EXPECT_EQ(value, 7);
    EXPECT_EQ(tracker.getStatistics().ran_immediately, 1u);
}

TEST_F(BudgetTrackerTest, DefersWhenUnaffordable) {
    feed(40, 20.0);
    int runs = 0;
    auto result = tracker.deferOrRun([&runs](void*) { ++runs; }, BudgetPriority::MEDIUM);

    EXPECT_EQ(result, BudgetTracker::DeferResult::DEFERRED);
    EXPECT_EQ(runs, 0);
    EXPECT_EQ(tracker.pendingDeferred(), 1u);

    auto stats = tracker.getStatistics();
    EXPECT_EQ(stats.pending_by_priority[budgetSlot(BudgetPriority::MEDIUM)], 1u);
    EXPECT_EQ(stats.deferred_total, 1u);
}

TEST_F(BudgetTrackerTest, LowQueueDropsAtCapacity) {
    feed(40, 20.0);
    for (int i = 0; i < 200; ++i) {
        ASSERT_EQ(tracker.deferOrRun([](void*) {}, BudgetPriority::LOW),
                  BudgetTracker::DeferResult::DEFERRED);
    }

    EXPECT_EQ(tracker.deferOrRun([](void*) {}, BudgetPriority::LOW),
              BudgetTracker::DeferResult::DROPPED);

    auto stats = tracker.getStatistics();
    EXPECT_EQ(stats.dropped_callbacks, 1u);
    EXPECT_EQ(stats.pending_by_priority[budgetSlot(BudgetPriority::LOW)], 200u);
    EXPECT_EQ(diagnostics.countFor(Severity::WARNING), 1u);
}

TEST_F(BudgetTrackerTest, HigherPrioritiesGrowPastSoftCap) {
    feed(40, 20.0);
    for (int i = 0; i < 250; ++i) {
        EXPECT_EQ(tracker.deferOrRun([](void*) {}, BudgetPriority::HIGH),
                  BudgetTracker::DeferResult::DEFERRED);
    }
    EXPECT_EQ(tracker.getStatistics().pending_by_priority[budgetSlot(BudgetPriority::HIGH)], 250u);
    EXPECT_EQ(tracker.getStatistics().dropped_callbacks, 0u);
}

TEST_F(BudgetTrackerTest, DrainIsCappedPerPass) {
    feed(40, 20.0);
    std::vector<int> order;
    for (int i = 0; i < 8; ++i) {
        tracker.deferOrRun([&order, i](void*) { order.push_back(i); }, BudgetPriority::HIGH);
    }

    tracker.reset();           // Clears samples, keeps the queue
    tracker.recordCycle(1.0);  // Drains up to 5

    ASSERT_EQ(order.size(), 5u);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
    EXPECT_EQ(tracker.pendingDeferred(), 3u);

    tracker.recordCycle(1.0);
    EXPECT_EQ(order.size(), 8u);
    EXPECT_EQ(tracker.pendingDeferred(), 0u);
    EXPECT_EQ(tracker.getStatistics().executed_deferred, 8u);
}

TEST_F(BudgetTrackerTest, DrainStopsAtFirstUnaffordablePriority) {
    feed(40, 20.0);
    int high_runs = 0;
    int low_runs = 0;
    tracker.deferOrRun([&high_runs](void*) { ++high_runs; }, BudgetPriority::HIGH);
    tracker.deferOrRun([&low_runs](void*) { ++low_runs; }, BudgetPriority::LOW);

    tracker.reset();
    tracker.recordCycle(6.0);  // HIGH: 7 <= 12.5, LOW: 7 > 6.67

    EXPECT_EQ(high_runs, 1);
    EXPECT_EQ(low_runs, 0);
    EXPECT_EQ(tracker.pendingDeferred(), 1u);
}

TEST_F(BudgetTrackerTest, CallbackFailureIsContained) {
    auto result = tracker.deferOrRun([](void*) { throw std::runtime_error("boom"); },
                                     BudgetPriority::HIGH);
    EXPECT_EQ(result, BudgetTracker::DeferResult::RAN_IMMEDIATELY);
    EXPECT_EQ(tracker.getStatistics().callback_failures, 1u);

    feed(40, 20.0);
    int after = 0;
    tracker.deferOrRun([](void*) { throw 42; }, BudgetPriority::HIGH);
    tracker.deferOrRun([&after](void*) { ++after; }, BudgetPriority::HIGH);
    tracker.reset();
    EXPECT_NO_THROW(tracker.recordCycle(1.0));

    EXPECT_EQ(after, 1);
    EXPECT_EQ(tracker.getStatistics().callback_failures, 1u);  // Counted since reset()
    EXPECT_EQ(diagnostics.countFor(Severity::ERROR), 2u);
}

TEST_F(BudgetTrackerTest, EmptyCallbackIsRejected) {
    EXPECT_EQ(tracker.deferOrRun(BudgetTracker::Callback{}, BudgetPriority::HIGH),
              BudgetTracker::DeferResult::DROPPED);
    EXPECT_EQ(diagnostics.countFor(Severity::WARNING), 1u);
}

TEST_F(BudgetTrackerTest, ResetKeepsDeferredWork) {
    feed(40, 20.0);
    tracker.deferOrRun([](void*) {}, BudgetPriority::MEDIUM);
    tracker.reset();

    auto stats = tracker.getStatistics();
    EXPECT_EQ(stats.cycles_recorded, 0u);
    EXPECT_EQ(stats.sample_count, 0u);
    EXPECT_DOUBLE_EQ(stats.mean_ms, 0.0);
    EXPECT_EQ(stats.pending_deferred, 1u);
}
