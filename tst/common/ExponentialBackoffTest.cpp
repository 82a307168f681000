// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * MeshCore a service-mesh communication layer.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <vector>
#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"

using mesh::ExponentialBackoff;
using mesh::RetryPolicy;

class ExponentialBackoffTest : public ::testing::Test {
protected:
    RetryPolicy defaultPolicy {
        std::chrono::microseconds{100L},
        std::chrono::microseconds{1000L},
        5
    };
};

TEST_F(ExponentialBackoffTest, InitialDelayIsBaseDelay) {
    ExponentialBackoff backoff(defaultPolicy);
    auto delay = backoff.nextDelay();
    ASSERT_TRUE(delay.has_value());
    EXPECT_EQ(delay.value(), std::chrono::microseconds{100L});
}

TEST_F(ExponentialBackoffTest, DelayDoublesUntilCapped) {
    ExponentialBackoff backoff(defaultPolicy);
    const std::vector<long> expected = {100, 200, 400, 800, 1000};
    for (auto e : expected) {
        auto delay = backoff.nextDelay();
        ASSERT_TRUE(delay.has_value());
        EXPECT_EQ(delay.value(), std::chrono::microseconds{e});
    }
}

TEST_F(ExponentialBackoffTest, DelaysNeverDecrease) {
    const RetryPolicy policy {std::chrono::microseconds{300L}, std::chrono::microseconds{500L}, 4};
    ExponentialBackoff backoff(policy);
    const std::vector<long> expected = {300, 500, 500, 500};
    for (auto e : expected) {
        auto delay = backoff.nextDelay();
        ASSERT_TRUE(delay.has_value());
        EXPECT_EQ(delay.value(), std::chrono::microseconds{e});
    }
}

TEST_F(ExponentialBackoffTest, ReturnsNulloptAfterRetries) {
    ExponentialBackoff backoff(defaultPolicy);
    for (int i = 0; i < defaultPolicy.retries; ++i) {
        ASSERT_TRUE(backoff.nextDelay().has_value());
    }
    EXPECT_FALSE(backoff.nextDelay().has_value());
    EXPECT_EQ(backoff.attempts(), defaultPolicy.retries);
}

TEST_F(ExponentialBackoffTest, ResetStartsOver) {
    ExponentialBackoff backoff(defaultPolicy);
    backoff.nextDelay();
    backoff.nextDelay();
    backoff.reset();
    EXPECT_EQ(backoff.attempts(), 0);
    EXPECT_EQ(backoff.nextDelay().value(), std::chrono::microseconds{100L});
}

TEST_F(ExponentialBackoffTest, ZeroRetriesNeverDelays) {
    const RetryPolicy policy {std::chrono::microseconds{100L}, std::chrono::microseconds{1000L}, 0};
    ExponentialBackoff backoff(policy);
    EXPECT_FALSE(backoff.nextDelay().has_value());
}

TEST_F(ExponentialBackoffTest, LargeAttemptsDoNotOverflow) {
    const RetryPolicy policy {std::chrono::seconds{1L}, std::chrono::seconds{60L}, 100};
    ExponentialBackoff backoff(policy);
    std::chrono::microseconds last {0};
    for (int i = 0; i < 100; ++i) {
        auto delay = backoff.nextDelay();
        ASSERT_TRUE(delay.has_value());
        EXPECT_GE(delay.value(), last);
        EXPECT_LE(delay.value(), std::chrono::seconds{60L});
        last = delay.value();
    }
    EXPECT_EQ(last, std::chrono::seconds{60L});
}
