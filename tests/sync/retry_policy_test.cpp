#include "fieldsync/sync/retry_policy.hpp"

#include <gtest/gtest.h>

#include <chrono>

using fieldsync::RetryConfig;
using fieldsync::sync::RetryPolicy;
using std::chrono::milliseconds;

TEST(RetryPolicyTest, DoublesUntilCap) {
    RetryPolicy policy(RetryConfig{milliseconds(100), milliseconds(1000), milliseconds(0)}, 5);

    EXPECT_EQ(policy.next_delay(0).count(), 100);
    EXPECT_EQ(policy.next_delay(1).count(), 200);
    EXPECT_EQ(policy.next_delay(2).count(), 400);
    EXPECT_EQ(policy.next_delay(3).count(), 800);
    EXPECT_EQ(policy.next_delay(4).count(), 1000);
    EXPECT_EQ(policy.next_delay(63).count(), 1000);
}

TEST(RetryPolicyTest, NonDecreasingWithJitter) {
    RetryPolicy policy(RetryConfig{milliseconds(50), milliseconds(60000), milliseconds(500)}, 10);

    for (std::uint64_t salt = 0; salt < 50; ++salt) {
        auto previous = milliseconds(0);
        for (std::uint32_t attempt = 0; attempt < 20; ++attempt) {
            const auto delay = policy.next_delay(attempt, salt);
            EXPECT_GE(delay, previous) << "salt " << salt << " attempt " << attempt;
            EXPECT_LE(delay, milliseconds(60000));
            previous = delay;
        }
    }
}

TEST(RetryPolicyTest, JitterIsBoundedAndDeterministic) {
    RetryPolicy policy(RetryConfig{milliseconds(1000), milliseconds(300000), milliseconds(250)}, 3);

    for (std::uint64_t salt = 0; salt < 20; ++salt) {
        const auto delay = policy.next_delay(1, salt);
        EXPECT_GE(delay.count(), 2000);
        EXPECT_LE(delay.count(), 2250);
        EXPECT_EQ(delay, policy.next_delay(1, salt));
    }
}

TEST(RetryPolicyTest, DeadExactlyAtMaxRetries) {
    RetryPolicy policy(RetryConfig{}, 3);

    EXPECT_FALSE(policy.is_dead(0));
    EXPECT_FALSE(policy.is_dead(2));
    EXPECT_TRUE(policy.is_dead(3));
    EXPECT_TRUE(policy.is_dead(4));

    auto relaxed = policy.with_max_retries(5);
    EXPECT_FALSE(relaxed.is_dead(3));
    EXPECT_EQ(relaxed.config().base_delay, policy.config().base_delay);
}

TEST(RetryPolicyTest, ZeroDelaysRetryImmediately) {
    RetryPolicy policy(RetryConfig{milliseconds(0), milliseconds(0), milliseconds(0)}, 3);

    EXPECT_EQ(policy.next_delay(0).count(), 0);
    EXPECT_EQ(policy.next_delay(7, 99).count(), 0);
}
