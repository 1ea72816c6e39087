/**
 * @file channel_test.cpp
 * @brief 有界通道
 */

#include <gtest/gtest.h>

#include <thread>
#include <chrono>

#include "engine/channel.h"

using namespace sj::engine;

TEST(ChannelTest, DropsWhenFull) {
    Channel<int> ch(2);
    EXPECT_TRUE(ch.try_send(1));
    EXPECT_TRUE(ch.try_send(2));
    EXPECT_FALSE(ch.try_send(3));
    EXPECT_EQ(ch.dropped(), 1u);
    EXPECT_EQ(ch.size(), 2u);

    EXPECT_EQ(*ch.try_recv(), 1);
    EXPECT_TRUE(ch.try_send(4));
    EXPECT_EQ(*ch.try_recv(), 2);
    EXPECT_EQ(*ch.try_recv(), 4);
    EXPECT_FALSE(ch.try_recv().has_value());
}

TEST(ChannelTest, ZeroCapacityBecomesOne) {
    Channel<int> ch(0);
    EXPECT_EQ(ch.capacity(), 1u);
    EXPECT_TRUE(ch.try_send(7));
}

TEST(ChannelTest, RecvForTimesOut) {
    Channel<int> ch(4);
    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(ch.recv_for(std::chrono::milliseconds(30)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(25));
}

TEST(ChannelTest, RecvWakesOnSend) {
    Channel<std::string> ch(4);
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ch.try_send("hello");
    });
    auto item = ch.recv();
    producer.join();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, "hello");
}

// 测试：关闭后已有消息仍可取出，之后 recv 返回空
TEST(ChannelTest, CloseDrainsThenEnds) {
    Channel<int> ch(4);
    ch.try_send(1);
    ch.close();
    EXPECT_TRUE(ch.is_closed());
    EXPECT_FALSE(ch.try_send(2));
    EXPECT_EQ(ch.dropped(), 1u);
    EXPECT_EQ(*ch.recv(), 1);
    EXPECT_FALSE(ch.recv().has_value());
}

TEST(ChannelTest, CloseWakesBlockedReceiver) {
    Channel<int> ch(4);
    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ch.close();
    });
    EXPECT_FALSE(ch.recv().has_value());
    closer.join();
}
