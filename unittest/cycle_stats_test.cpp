// ============================================================================
// CYCLE STATISTICS UNIT TESTS
// ============================================================================
// Ring buffer and histogram behind the budget tracker
// ============================================================================

#include <gtest/gtest.h>
#include <tickgovernor/core/budget/cycle_histogram.hpp>
#include <tickgovernor/core/budget/cycle_ring_buffer.hpp>
#include <cmath>
#include <vector>

using namespace TickGovernor;

// ============================================================================
// RING BUFFER TESTS
// ============================================================================

TEST(CycleRingBufferTest, EmptyBufferHasZeroMean) {
    CycleRingBuffer ring(4);
    EXPECT_EQ(ring.size(), 0u);
    EXPECT_DOUBLE_EQ(ring.mean(), 0.0);
    EXPECT_TRUE(ring.snapshot().empty());
}

TEST(CycleRingBufferTest, ZeroCapacityClampedToOne) {
    CycleRingBuffer ring(0);
    EXPECT_EQ(ring.capacity(), 1u);

    EXPECT_FALSE(ring.push(3.0));
    EXPECT_TRUE(ring.push(5.0));
    EXPECT_DOUBLE_EQ(ring.mean(), 5.0);
}

TEST(CycleRingBufferTest, EvictsOldestWhenFull) {
    CycleRingBuffer ring(3);
    EXPECT_FALSE(ring.push(1.0));
    EXPECT_FALSE(ring.push(2.0));
    EXPECT_FALSE(ring.push(3.0));
    EXPECT_TRUE(ring.full());

    EXPECT_TRUE(ring.push(10.0));
    EXPECT_EQ(ring.size(), 3u);
    EXPECT_DOUBLE_EQ(ring.sum(), 15.0);
    EXPECT_DOUBLE_EQ(ring.mean(), 5.0);
    EXPECT_EQ(ring.snapshot(), (std::vector<double>{2.0, 3.0, 10.0}));
}

TEST(CycleRingBufferTest, RunningSumTracksWrapAround) {
    CycleRingBuffer ring(5);
    for (int i = 1; i <= 23; ++i) {
        ring.push(static_cast<double>(i));
    }
    // Last five: 19..23
    EXPECT_DOUBLE_EQ(ring.sum(), 105.0);
    EXPECT_DOUBLE_EQ(ring.mean(), 21.0);
    EXPECT_EQ(ring.snapshot(), (std::vector<double>{19.0, 20.0, 21.0, 22.0, 23.0}));
}

TEST(CycleRingBufferTest, RecoversFromSumOverflow) {
    CycleRingBuffer ring(2);
    ring.push(1e308);
    ring.push(1e308);   // Sum overflows to inf

    ring.push(1.0);
    EXPECT_TRUE(std::isfinite(ring.sum()));

    ring.push(1.0);
    EXPECT_DOUBLE_EQ(ring.sum(), 2.0);
    EXPECT_DOUBLE_EQ(ring.mean(), 1.0);
}

TEST(CycleRingBufferTest, ClearResetsState) {
    CycleRingBuffer ring(3);
    ring.push(4.0);
    ring.push(6.0);
    ring.clear();

    EXPECT_EQ(ring.size(), 0u);
    EXPECT_DOUBLE_EQ(ring.sum(), 0.0);
    EXPECT_FALSE(ring.push(9.0));
    EXPECT_DOUBLE_EQ(ring.mean(), 9.0);
}

// ============================================================================
// HISTOGRAM TESTS
// ============================================================================

TEST(CycleHistogramTest, BucketBoundaries) {
    EXPECT_EQ(CycleHistogram::bucketFor(0.0), 0u);
    EXPECT_EQ(CycleHistogram::bucketFor(4.99), 0u);
    EXPECT_EQ(CycleHistogram::bucketFor(5.0), 1u);
    EXPECT_EQ(CycleHistogram::bucketFor(10.0), 2u);
    EXPECT_EQ(CycleHistogram::bucketFor(15.0), 3u);
    EXPECT_EQ(CycleHistogram::bucketFor(20.0), 4u);
    EXPECT_EQ(CycleHistogram::bucketFor(29.99), 4u);
    EXPECT_EQ(CycleHistogram::bucketFor(30.0), 5u);
    EXPECT_EQ(CycleHistogram::bucketFor(1000.0), 5u);
}

TEST(CycleHistogramTest, CountsAccumulateAndReset) {
    CycleHistogram histogram;
    histogram.record(1.0);
    histogram.record(16.0);
    histogram.record(16.5);

    EXPECT_EQ(histogram.getTotalCount(), 3u);
    EXPECT_EQ(histogram.getBucketCount(0), 1u);
    EXPECT_EQ(histogram.getBucketCount(3), 2u);
    EXPECT_EQ(histogram.getBucketCount(99), 0u);

    histogram.reset();
    EXPECT_EQ(histogram.getTotalCount(), 0u);
    EXPECT_EQ(histogram.getBucketCount(3), 0u);
}

TEST(CycleHistogramTest, PrintDistributionHandlesEmptyAndFilled) {
    CycleHistogram histogram;
    EXPECT_NO_THROW(histogram.printDistribution());

    histogram.record(4.0);
    histogram.record(45.0);
    EXPECT_NO_THROW(histogram.printDistribution());
}

TEST(CycleHistogramTest, UpperBounds) {
    EXPECT_DOUBLE_EQ(CycleHistogram::bucketUpperMs(0), 5.0);
    EXPECT_DOUBLE_EQ(CycleHistogram::bucketUpperMs(4), 30.0);
    EXPECT_DOUBLE_EQ(CycleHistogram::bucketUpperMs(5), 0.0);
}
