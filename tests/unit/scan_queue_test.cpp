#include "badgegate/device/ScanQueue.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace
{
using badgegate::device::CardScanEvent;
using badgegate::device::ScanQueue;
using std::chrono::milliseconds;

[[nodiscard]] CardScanEvent scan(std::string cardId)
{
    return CardScanEvent{ std::move(cardId), {} };
}
} // namespace

TEST(ScanQueue, RejectsZeroCapacity)
{
    EXPECT_THROW(ScanQueue{ 0U }, std::invalid_argument);
}

TEST(ScanQueue, PopsInFifoOrder)
{
    ScanQueue queue{ 4U };
    EXPECT_FALSE(queue.push(scan("AAAAAA")));
    EXPECT_FALSE(queue.push(scan("BBBBBB")));

    EXPECT_EQ(queue.tryPop()->cardId, "AAAAAA");
    EXPECT_EQ(queue.tryPop()->cardId, "BBBBBB");
    EXPECT_FALSE(queue.tryPop().has_value());
}

TEST(ScanQueue, FullQueueEvictsOldest)
{
    ScanQueue queue{ 3U };
    for (const char* id : { "111111", "222222", "333333" })
    {
        EXPECT_FALSE(queue.push(scan(id)));
    }
    EXPECT_TRUE(queue.push(scan("444444")));
    EXPECT_TRUE(queue.push(scan("555555")));

    EXPECT_EQ(queue.size(), 3U);
    EXPECT_EQ(queue.tryPop()->cardId, "333333");
    EXPECT_EQ(queue.tryPop()->cardId, "444444");
    EXPECT_EQ(queue.tryPop()->cardId, "555555");
}

TEST(ScanQueue, NeverExceedsCapacity)
{
    ScanQueue queue{ 10U };
    for (int i = 0; i < 100; ++i)
    {
        (void)queue.push(scan("card" + std::to_string(i)));
        ASSERT_LE(queue.size(), queue.capacity());
    }
}

TEST(ScanQueue, PopTimesOutWhenEmpty)
{
    ScanQueue queue{};
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop(milliseconds{ 30 }).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, milliseconds{ 25 });
}

TEST(ScanQueue, PopWakesUpOnPushFromOtherThread)
{
    ScanQueue queue{};
    std::thread producer{ [&queue] {
        std::this_thread::sleep_for(milliseconds{ 20 });
        (void)queue.push(scan("1234567890"));
    } };

    const auto event = queue.pop(milliseconds{ 2000 });
    producer.join();

    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->cardId, "1234567890");
}

TEST(ScanQueue, ClearEmptiesQueue)
{
    ScanQueue queue{};
    (void)queue.push(scan("AAAAAA"));
    queue.clear();
    EXPECT_EQ(queue.size(), 0U);
}
