/**
 * @file test_result_channel.cpp
 * @brief Unit tests for the completion-order channel.
 */

#include "runner/result_channel.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <thread>
#include <vector>

using namespace sandbox_runner;

TEST(ResultChannelTest, DeliversInPushOrder) {
    std::vector<int> seen;
    ResultChannel<int> channel([&seen](const int& v) { seen.push_back(v); });

    for (int i = 0; i < 10; ++i) channel.push(i);
    channel.close();

    ASSERT_EQ(seen.size(), 10u);
    for (int i = 0; i < 10; ++i) EXPECT_EQ(seen[i], i);
    EXPECT_EQ(channel.delivered(), 10u);
}

TEST(ResultChannelTest, ManyProducersEachItemOnce) {
    std::vector<int> seen;
    ResultChannel<int> channel([&seen](const int& v) { seen.push_back(v); });

    {
        std::vector<std::jthread> producers;
        for (int p = 0; p < 4; ++p) {
            producers.emplace_back([&channel, p] {
                for (int i = 0; i < 25; ++i) channel.push(p * 100 + i);
            });
        }
    }
    channel.close();

    ASSERT_EQ(seen.size(), 100u);
    std::sort(seen.begin(), seen.end());
    EXPECT_EQ(std::adjacent_find(seen.begin(), seen.end()), seen.end());
}

TEST(ResultChannelTest, PushAfterCloseIsRejected) {
    int count = 0;
    ResultChannel<int> channel([&count](const int&) { ++count; });
    channel.close();
    EXPECT_FALSE(channel.push(1));
    channel.close();
    EXPECT_EQ(count, 0);
}

TEST(ResultChannelTest, DestructorDrains) {
    int count = 0;
    {
        ResultChannel<int> channel([&count](const int&) { ++count; });
        channel.push(1);
        channel.push(2);
    }
    EXPECT_EQ(count, 2);
}
