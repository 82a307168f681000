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
#include <atomic>
#include <chrono>
#include <expected>
#include <string>
#include <thread>
#include "common/Error.hpp"
#include "common/Repeater.hpp"
#include "common/RetryPolicy.hpp"

using mesh::Error;
using mesh::ErrorCode;
using mesh::Repeater;
using mesh::RetryPolicy;

namespace {
    using result_t = std::expected<void, Error>;

    result_t retriableError() {
        return std::unexpected {Error{ErrorCode::Transport, "Retriable"}};
    }

    result_t nonRetriableError() {
        return std::unexpected {Error{ErrorCode::Application, "Non-retriable"}};
    }

    const RetryPolicy fastPolicy {std::chrono::microseconds{100L}, std::chrono::microseconds{1000L}, 3};
} // namespace

TEST(RepeaterTest, SuccessOnFirstAttempt) {
    Repeater repeater(fastPolicy);
    int callCount = 0;
    auto result = repeater.attempt("get", [&]() -> result_t {
        ++callCount;
        return {};
    });
    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(callCount, 1);
    EXPECT_EQ(repeater.attempts(), 1);
}

TEST(RepeaterTest, NonRetriableIsNotRepeated) {
    Repeater repeater(fastPolicy);
    int callCount = 0;
    auto result = repeater.attempt("get", [&]() {
        ++callCount;
        return nonRetriableError();
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Application);
    EXPECT_EQ(callCount, 1);
}

TEST(RepeaterTest, CircuitOpenIsNotRepeated) {
    Repeater repeater(fastPolicy);
    int callCount = 0;
    auto result = repeater.attempt("get", [&]() -> result_t {
        ++callCount;
        return std::unexpected {Error{ErrorCode::CircuitOpen, "open"}};
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::CircuitOpen);
    EXPECT_EQ(callCount, 1);
}

TEST(RepeaterTest, TransientFailureThenSuccess) {
    Repeater repeater(fastPolicy);
    int callCount = 0;
    auto result = repeater.attempt("get", [&]() -> result_t {
        if (++callCount < 3) {
            return retriableError();
        }
        return {};
    });
    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(callCount, 3);
}

TEST(RepeaterTest, GivesUpAfterRetriesWithLastError) {
    Repeater repeater(fastPolicy);
    int callCount = 0;
    auto result = repeater.attempt("get", [&]() -> result_t {
        ++callCount;
        return std::unexpected {Error{ErrorCode::Timeout, "attempt " + std::to_string(callCount)}};
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);
    EXPECT_EQ(result.error().what, "attempt 4");
    EXPECT_EQ(callCount, 1 + fastPolicy.retries);
    EXPECT_EQ(repeater.attempts(), 4);
}

TEST(RepeaterTest, ZeroRetriesMeansOneAttempt) {
    Repeater repeater(RetryPolicy{std::chrono::microseconds{100L}, std::chrono::microseconds{100L}, 0});
    int callCount = 0;
    auto result = repeater.attempt("get", [&]() {
        ++callCount;
        return retriableError();
    });
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(callCount, 1);
}

TEST(RepeaterTest, CancelledBeforeStart) {
    std::atomic<bool> cancel {true};
    Repeater repeater(fastPolicy, &cancel);
    int callCount = 0;
    auto result = repeater.attempt("get", [&]() -> result_t {
        ++callCount;
        return {};
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(callCount, 0);
}

TEST(RepeaterTest, CancelDuringBackoffStopsLoop) {
    std::atomic<bool> cancel {false};
    Repeater repeater(RetryPolicy{std::chrono::seconds{5L}, std::chrono::seconds{5L}, 3}, &cancel);
    int callCount = 0;
    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds{50L});
        cancel = true;
    });
    const auto start = std::chrono::steady_clock::now();
    auto result = repeater.attempt("get", [&]() {
        ++callCount;
        return retriableError();
    });
    canceller.join();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(callCount, 1);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds{2L});
}

TEST(RepeaterTest, StopAndReset) {
    Repeater repeater(fastPolicy);
    repeater.stop();
    int callCount = 0;
    auto rpc = [&]() -> result_t {
        ++callCount;
        return {};
    };
    EXPECT_EQ(repeater.attempt("get", rpc).error().code, ErrorCode::Cancelled);
    repeater.reset();
    EXPECT_TRUE(repeater.attempt("get", rpc).has_value());
    EXPECT_EQ(callCount, 1);
}
