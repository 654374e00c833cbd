// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * PGShield a resilient PostgreSQL access service.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"
#include <chrono>
#include <cstddef>
#include <vector>

using pgshield::ExponentialBackoff;
using pgshield::RetryPolicy;

class ExponentialBackoffTest : public ::testing::Test {
protected:
    RetryPolicy defaultPolicy{};
};

TEST_F(ExponentialBackoffTest, InitialDelayIsBaseDelay) {
    ExponentialBackoff backoff(defaultPolicy);
    auto delay = backoff.nextDelay();
    ASSERT_TRUE(delay.has_value());
    if (delay.has_value()) {
        EXPECT_EQ(delay.value(), std::chrono::milliseconds{500L});
    }
}

TEST_F(ExponentialBackoffTest, DelayDoublesEachAttempt) {
    const RetryPolicy policy{
        6,
        std::chrono::milliseconds{100L},
        std::chrono::milliseconds{1000L},
        std::chrono::milliseconds{0L},
        std::chrono::milliseconds{200L}
    };
    ExponentialBackoff backoff(policy);
    std::vector<long> expected = {100, 200, 400, 800, 1000}; // capped at delayCap
    for (std::size_t i = 0; i < expected.size(); ++i) {
        auto delay = backoff.nextDelay();
        ASSERT_TRUE(delay.has_value());
        if (delay.has_value()) {
            EXPECT_EQ(delay.value(), std::chrono::milliseconds{expected[i]});
        }
    }
}

TEST_F(ExponentialBackoffTest, DefaultPolicyYieldsTwoDelays) {
    ExponentialBackoff backoff(defaultPolicy);
    EXPECT_EQ(backoff.nextDelay(), std::chrono::milliseconds{500L});
    EXPECT_EQ(backoff.nextDelay(), std::chrono::milliseconds{1000L});
    EXPECT_FALSE(backoff.nextDelay().has_value());
}

TEST_F(ExponentialBackoffTest, LargeAttemptCountsStayAtCap) {
    const RetryPolicy policy{
        80,
        std::chrono::milliseconds{500L},
        std::chrono::milliseconds{5000L},
        std::chrono::milliseconds{0L},
        std::chrono::milliseconds{200L}
    };
    ExponentialBackoff backoff(policy);
    std::chrono::milliseconds last{0};
    for (int i = 0; i < policy.maxAttempts - 1; ++i) {
        auto delay = backoff.nextDelay();
        ASSERT_TRUE(delay.has_value());
        EXPECT_LE(delay.value(), policy.delayCap);
        EXPECT_GE(delay.value(), last);
        last = delay.value();
    }
    EXPECT_EQ(last, policy.delayCap);
}

TEST_F(ExponentialBackoffTest, StaysExhaustedOnceBudgetIsSpent) {
    ExponentialBackoff backoff(defaultPolicy);
    for (int i = 0; i < defaultPolicy.maxAttempts - 1; ++i) {
        ASSERT_TRUE(backoff.nextDelay().has_value());
    }
    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(backoff.nextDelay().has_value());
    }
}

TEST_F(ExponentialBackoffTest, SingleAttemptNeverWaits) {
    const RetryPolicy policy{
        1,
        std::chrono::milliseconds{500L},
        std::chrono::milliseconds{5000L},
        std::chrono::milliseconds{100L},
        std::chrono::milliseconds{200L}
    };
    ExponentialBackoff backoff(policy);
    EXPECT_FALSE(backoff.nextDelay().has_value());
}
