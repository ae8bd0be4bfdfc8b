#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace engine;

TEST(RetryTest, SucceedsAfterFailures) {
    int attempts = 0;
    int result = retry("flaky operation", 5, chrono::milliseconds(1), [&] {
        if (++attempts < 3) throw runtime_error("connection refused");
        return 42;
    });
    EXPECT_EQ(result, 42);
    EXPECT_EQ(attempts, 3);
}

TEST(RetryTest, GivesUpAfterMaxRetries) {
    int attempts = 0;
    EXPECT_THROW(retry("broken operation", 12, chrono::milliseconds(1), [&] {
                     ++attempts;
                     throw runtime_error("connection refused");
                 }),
                 network_error);
    // 第一次尝试加上 12 次重试
    EXPECT_EQ(attempts, 13);
}

TEST(RetryTest, WaitsBetweenRetries) {
    elapsed_time timer;
    EXPECT_THROW(retry("broken operation", 2, chrono::milliseconds(50), [] {
                     throw runtime_error("connection refused");
                 }),
                 network_error);
    EXPECT_GE(timer.duration<chrono::milliseconds>().count(), 100);
}
