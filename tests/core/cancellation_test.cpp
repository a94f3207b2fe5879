#include "mbk/core/cancellation.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using mbk::core::CancellationSource;
using mbk::core::CancellationToken;

TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_TRUE(token.wait_for(std::chrono::milliseconds(1)));
}

TEST(CancellationTest, CancelIsVisibleToEveryCopy) {
    CancellationSource source;
    auto first = source.token();
    auto second = first;

    EXPECT_FALSE(first.is_cancelled());
    source.cancel();

    EXPECT_TRUE(source.is_cancelled());
    EXPECT_TRUE(first.is_cancelled());
    EXPECT_TRUE(second.is_cancelled());
}

TEST(CancellationTest, WaitForReturnsTrueWhenTimeElapses) {
    CancellationSource source;
    EXPECT_TRUE(source.token().wait_for(std::chrono::milliseconds(10)));
}

TEST(CancellationTest, CancelWakesWaiter) {
    CancellationSource source;
    auto token = source.token();

    const auto start = std::chrono::steady_clock::now();
    std::thread canceller([&source]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        source.cancel();
    });

    EXPECT_FALSE(token.wait_for(std::chrono::seconds(10)));
    canceller.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}
