#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "cancellation_token.h"

TEST(CancellationTokenTest, StartsActive) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    EXPECT_FALSE(token.waitFor(std::chrono::milliseconds(1)));
}

TEST(CancellationTokenTest, CancelIsSticky) {
    CancellationToken token;
    token.cancel();
    token.cancel();
    EXPECT_TRUE(token.isCancelled());
    EXPECT_TRUE(token.waitFor(std::chrono::milliseconds(0)));
}

TEST(CancellationTokenTest, CancelWakesWaiter) {
    CancellationToken token;
    auto begin = std::chrono::steady_clock::now();

    std::thread canceller([&token]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });

    EXPECT_TRUE(token.waitFor(std::chrono::seconds(10)));
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
}

TEST(CancellationTokenTest, RequestCancelIsSeenByNextWait) {
    CancellationToken token;
    token.requestCancel();
    EXPECT_TRUE(token.isCancelled());
    EXPECT_TRUE(token.waitFor(std::chrono::milliseconds(50)));
}
