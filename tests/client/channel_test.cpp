#include "taildrive/client/channel.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using taildrive::client::Channel;
using namespace std::chrono_literals;

TEST(ChannelTest, FifoOrder) {
    Channel<int> channel;
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(channel.push(i));
    }
    EXPECT_EQ(channel.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        auto item = channel.try_pop();
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(*item, i);
    }
    EXPECT_TRUE(channel.empty());
    EXPECT_FALSE(channel.try_pop().has_value());
}

TEST(ChannelTest, PopForTimesOut) {
    Channel<int> channel;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(channel.pop_for(50ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST(ChannelTest, CloseRejectsPushButDrains) {
    Channel<std::string> channel;
    channel.push("queued");
    channel.close();

    EXPECT_TRUE(channel.is_closed());
    EXPECT_FALSE(channel.push("late"));
    auto item = channel.pop_for(10ms);
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, "queued");
    EXPECT_FALSE(channel.pop_for(10ms).has_value());
}

TEST(ChannelTest, CloseWakesBlockedReader) {
    Channel<int> channel;
    std::atomic<bool> returned{false};
    std::thread reader([&]() {
        channel.pop_for(10s);
        returned = true;
    });
    std::this_thread::sleep_for(20ms);
    channel.close();
    reader.join();
    EXPECT_TRUE(returned);
}

TEST(ChannelTest, WaitForSeesItemWithoutPopping) {
    Channel<int> channel;
    EXPECT_FALSE(channel.wait_for(10ms));
    channel.push(7);
    EXPECT_TRUE(channel.wait_for(10ms));
    EXPECT_EQ(channel.size(), 1u);
}

TEST(ChannelTest, BoundedPushBlocksUntilSpace) {
    Channel<int> channel(1);
    channel.push(1);

    std::atomic<bool> pushed{false};
    std::thread writer([&]() {
        channel.push(2);
        pushed = true;
    });
    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(pushed);

    EXPECT_EQ(*channel.try_pop(), 1);
    writer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(*channel.try_pop(), 2);
}

TEST(ChannelTest, ConcurrentProducers) {
    Channel<int> channel;
    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&channel]() {
            for (int i = 0; i < 250; ++i) {
                channel.push(i);
            }
        });
    }
    for (auto& t : producers) {
        t.join();
    }
    EXPECT_EQ(channel.size(), 1000u);
}
