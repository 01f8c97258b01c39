// ============================================================================
// WORK QUEUE UNIT TESTS
// ============================================================================

#include <gtest/gtest.h>
#include <tickgovernor/core/scheduler/work_queue.hpp>
#include <memory>
#include <string>

using namespace TickGovernor;

TEST(WorkQueueTest, FifoOrder) {
    WorkQueue<int> queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.pop().has_value());

    for (int i = 0; i < 5; ++i) queue.push(i);
    EXPECT_EQ(queue.size(), 5u);

    for (int i = 0; i < 5; ++i) {
        auto item = queue.pop();
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(*item, i);
    }
    EXPECT_TRUE(queue.empty());
}

TEST(WorkQueueTest, DrainingResetsStorage) {
    WorkQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.pop();
    EXPECT_EQ(queue.headIndex(), 1u);

    queue.pop();
    EXPECT_EQ(queue.headIndex(), 0u);
    EXPECT_EQ(queue.capacityUsed(), 0u);
}

TEST(WorkQueueTest, CompactsOnceHeadPassesHalf) {
    WorkQueue<int> queue;
    for (int i = 0; i < 100; ++i) queue.push(i);

    // head 32: 64 < 100, no compaction yet
    for (int i = 0; i < 32; ++i) queue.pop();
    EXPECT_EQ(queue.headIndex(), 32u);
    EXPECT_EQ(queue.capacityUsed(), 100u);

    // head 50: 100 >= 100, consumed prefix is erased
    for (int i = 32; i < 50; ++i) queue.pop();
    EXPECT_EQ(queue.headIndex(), 0u);
    EXPECT_EQ(queue.capacityUsed(), 50u);
    EXPECT_EQ(queue.size(), 50u);

    auto next = queue.pop();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, 50);
}

TEST(WorkQueueTest, SmallQueuesNeverCompact) {
    WorkQueue<int> queue;
    for (int i = 0; i < 40; ++i) queue.push(i);
    for (int i = 0; i < 31; ++i) queue.pop();

    EXPECT_EQ(queue.headIndex(), 31u);
    EXPECT_EQ(queue.capacityUsed(), 40u);
}

TEST(WorkQueueTest, ContainsIfSkipsConsumedEntries) {
    WorkQueue<std::string> queue;
    queue.push("a");
    queue.push("b");
    queue.pop();

    EXPECT_FALSE(queue.containsIf([](const std::string& s) { return s == "a"; }));
    EXPECT_TRUE(queue.containsIf([](const std::string& s) { return s == "b"; }));
}

TEST(WorkQueueTest, TakeAllMovesLiveEntries) {
    WorkQueue<std::unique_ptr<int>> queue;
    for (int i = 0; i < 4; ++i) queue.push(std::make_unique<int>(i));
    queue.pop();

    auto items = queue.takeAll();
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(*items[0], 1);
    EXPECT_EQ(*items[2], 3);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.capacityUsed(), 0u);
}
