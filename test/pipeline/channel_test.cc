#include <gtest/gtest.h>
#include "../../src/pipeline/bounded_channel.h"
#include "../../src/pipeline/mpmc_channel.h"
#include "../../src/pipeline/item.h"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace Handoff;
using namespace std::chrono_literals;

template<typename ChannelType>
class ChannelTest : public ::testing::Test {
protected:
    std::unique_ptr<Channel<int>> Make(size_t capacity) {
        return std::make_unique<ChannelType>(capacity);
    }
};

using ChannelTypes = ::testing::Types<BoundedChannel<int>, MpmcChannel<int>>;
TYPED_TEST_SUITE(ChannelTest, ChannelTypes);

TYPED_TEST(ChannelTest, ZeroCapacityRejected) {
    EXPECT_THROW(TypeParam channel(0), std::invalid_argument);
}

TYPED_TEST(ChannelTest, RemovesInInsertionOrder) {
    auto channel = this->Make(4);
    channel->Insert(3);
    channel->Insert(1);
    channel->Insert(2);

    EXPECT_EQ(channel->Size(), 3);
    EXPECT_EQ(channel->Remove(), 3);
    EXPECT_EQ(channel->Remove(), 1);
    EXPECT_EQ(channel->Remove(), 2);
    EXPECT_EQ(channel->Size(), 0);
    EXPECT_EQ(channel->Capacity(), 4);
}

TYPED_TEST(ChannelTest, InsertBlocksWhileFull) {
    auto channel = this->Make(1);
    channel->Insert(1);

    std::atomic<bool> inserted{false};
    std::thread producer([&]() {
        channel->Insert(2);
        inserted = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(inserted);
    EXPECT_EQ(channel->Size(), 1);

    EXPECT_EQ(channel->Remove(), 1);
    producer.join();
    EXPECT_TRUE(inserted);
    EXPECT_EQ(channel->Remove(), 2);
}

TYPED_TEST(ChannelTest, RemoveBlocksWhileEmpty) {
    auto channel = this->Make(2);

    std::atomic<bool> removed{false};
    int value = 0;
    std::thread consumer([&]() {
        value = channel->Remove();
        removed = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(removed);

    channel->Insert(7);
    consumer.join();
    EXPECT_TRUE(removed);
    EXPECT_EQ(value, 7);
}

TYPED_TEST(ChannelTest, ConcurrentTransferKeepsOrderAndBound) {
    constexpr int kCount = 10000;
    constexpr size_t kCapacity = 8;
    auto channel = this->Make(kCapacity);

    std::thread producer([&]() {
        for (int i = 0; i < kCount; ++i) {
            channel->Insert(i);
        }
    });

    std::vector<int> received;
    received.reserve(kCount);
    for (int i = 0; i < kCount; ++i) {
        received.push_back(channel->Remove());
        EXPECT_LE(channel->Size(), kCapacity);
    }
    producer.join();

    for (int i = 0; i < kCount; ++i) {
        ASSERT_EQ(received[i], i) << "out of order at " << i;
    }
    EXPECT_LE(channel->PeakSize(), kCapacity);
}

TEST(BoundedChannelTest, PeakSizeTracksLargestLength) {
    BoundedChannel<int> channel(3);
    EXPECT_EQ(channel.PeakSize(), 0);

    channel.Insert(1);
    channel.Insert(2);
    channel.Remove();
    channel.Insert(3);
    channel.Insert(4);
    EXPECT_EQ(channel.PeakSize(), 3);

    channel.Remove();
    channel.Remove();
    EXPECT_EQ(channel.Size(), 1);
    EXPECT_EQ(channel.PeakSize(), 3);
}

TEST(BoundedChannelTest, SingleSlotWakesWaitingRemoverForEveryInsert) {
    constexpr int kCount = 1000;
    BoundedChannel<int> channel(1);

    std::vector<int> received;
    std::thread consumer([&]() {
        for (int i = 0; i < kCount; ++i) {
            received.push_back(channel.Remove());
        }
    });
    for (int i = 0; i < kCount; ++i) {
        channel.Insert(i);
        EXPECT_LE(channel.Size(), 1);
    }
    consumer.join();

    ASSERT_EQ(received.size(), static_cast<size_t>(kCount));
    EXPECT_EQ(received.back(), kCount - 1);
    EXPECT_EQ(channel.PeakSize(), 1);
    EXPECT_EQ(channel.Size(), 0);
}

TEST(BoundedChannelTest, EndOfStreamIsDistinctFromZeroItem) {
    BoundedChannel<ChannelElement> channel(2);
    channel.Insert(Item{0, Value{int64_t{0}}});
    channel.Insert(EndOfStream{});

    ChannelElement first = channel.Remove();
    ASSERT_FALSE(IsEndOfStream(first));
    EXPECT_EQ(std::get<Item>(first).index, 0);
    EXPECT_EQ(std::get<Item>(first).value, Value{int64_t{0}});

    EXPECT_TRUE(IsEndOfStream(channel.Remove()));
}

TEST(ChannelBackendTest, ParsesNames) {
    EXPECT_EQ(ParseChannelBackend("monitor"), ChannelBackend::kMonitor);
    EXPECT_EQ(ParseChannelBackend("MPMC"), ChannelBackend::kMpmc);
    EXPECT_EQ(ParseChannelBackend("folly"), ChannelBackend::kMpmc);
    EXPECT_FALSE(ParseChannelBackend("ring").has_value());
    EXPECT_FALSE(ParseChannelBackend("\xC3\xA9").has_value());
    EXPECT_FALSE(ParseChannelBackend("monitor\xFF").has_value());
    EXPECT_STREQ(ChannelBackendName(ChannelBackend::kMpmc), "mpmc");
}

TEST(ChannelCapacityTest, HalfTheSourceAtLeastOne) {
    EXPECT_EQ(ChannelCapacityFor(10), 5);
    EXPECT_EQ(ChannelCapacityFor(1), 1);
    EXPECT_EQ(ChannelCapacityFor(3), 1);
    EXPECT_EQ(ChannelCapacityFor(0), 1);
    EXPECT_EQ(ChannelCapacityFor(1000), 500);
    static_assert(ChannelCapacityFor(5) == 2, "capacity is evaluated at compile time");
}
