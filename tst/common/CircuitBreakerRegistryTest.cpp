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
#include <expected>
#include <set>
#include <thread>
#include <vector>
#include "common/BreakerConfig.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/CircuitBreakerRegistry.hpp"
#include "common/Error.hpp"

using mesh::BreakerConfig;
using mesh::CircuitBreaker;
using mesh::CircuitBreakerRegistry;
using mesh::Error;
using mesh::ErrorCode;

namespace {

std::expected<int, Error> transportFailure() {
    return std::unexpected {Error{ErrorCode::Transport, "down"}};
}

} // namespace

class CircuitBreakerRegistryTest : public ::testing::Test {
protected:
    CircuitBreakerRegistry registry {BreakerConfig{2, std::chrono::seconds{30L}, 1, std::chrono::seconds{1L}}};
};

TEST_F(CircuitBreakerRegistryTest, CreatesOnFirstUse) {
    EXPECT_FALSE(registry.contains("orders"));
    EXPECT_FALSE(registry.stats("orders").has_value());
    auto result = registry.call("orders", []() -> std::expected<int, Error> { return 7; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 7);
    EXPECT_TRUE(registry.contains("orders"));
    EXPECT_EQ(registry.size(), 1U);
}

TEST_F(CircuitBreakerRegistryTest, SameNameSameBreaker) {
    auto& a = registry.get("orders");
    auto& b = registry.get("orders");
    EXPECT_EQ(&a, &b);
    EXPECT_NE(&a, &registry.get("billing"));
}

TEST_F(CircuitBreakerRegistryTest, FirstConfigWins) {
    auto& custom = registry.get("slow", BreakerConfig{9, std::chrono::seconds{1L}, 4, std::chrono::seconds{2L}});
    EXPECT_EQ(custom.config().failureThreshold, 9);
    auto& again = registry.get("slow", BreakerConfig{1, std::chrono::seconds{1L}, 1, std::chrono::seconds{1L}});
    EXPECT_EQ(again.config().failureThreshold, 9);
    EXPECT_EQ(registry.get("plain").config().failureThreshold, registry.defaults().failureThreshold);
}

TEST_F(CircuitBreakerRegistryTest, BreakersAreIndependent) {
    registry.call("orders", transportFailure);
    registry.call("orders", transportFailure);
    EXPECT_EQ(registry.stats("orders")->state, CircuitBreaker::State::Open);
    EXPECT_TRUE(registry.call("billing", []() -> std::expected<int, Error> { return 1; }).has_value());
    EXPECT_EQ(registry.call("orders", transportFailure).error().code, ErrorCode::CircuitOpen);
}

TEST_F(CircuitBreakerRegistryTest, ConcurrentFirstUseSharesOneBreaker) {
    std::vector<std::thread> threads;
    std::vector<CircuitBreaker*> seen(16, nullptr);
    for (std::size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([this, &seen, i] {
            seen[i] = &registry.get("shared");
            registry.call("shared", []() -> std::expected<int, Error> { return 0; });
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    const std::set<CircuitBreaker*> distinct(seen.begin(), seen.end());
    EXPECT_EQ(distinct.size(), 1U);
    EXPECT_EQ(registry.size(), 1U);
    EXPECT_EQ(registry.stats("shared")->totalRequests, 16U);
}

TEST_F(CircuitBreakerRegistryTest, ResetOne) {
    registry.call("orders", transportFailure);
    registry.call("orders", transportFailure);
    EXPECT_TRUE(registry.reset("orders"));
    EXPECT_EQ(registry.stats("orders")->state, CircuitBreaker::State::Closed);
    EXPECT_FALSE(registry.reset("unknown"));
}

TEST_F(CircuitBreakerRegistryTest, ResetAll) {
    for (const auto* name : {"a", "b"}) {
        registry.call(name, transportFailure);
        registry.call(name, transportFailure);
    }
    registry.resetAll();
    for (const auto& stats : registry.allStats()) {
        EXPECT_EQ(stats.state, CircuitBreaker::State::Closed);
        EXPECT_EQ(stats.totalRequests, 0U);
    }
}

TEST_F(CircuitBreakerRegistryTest, AllStatsSortedByName) {
    registry.get("zeta");
    registry.get("alpha");
    registry.get("mid");
    auto stats = registry.allStats();
    ASSERT_EQ(stats.size(), 3U);
    EXPECT_EQ(stats[0].name, "alpha");
    EXPECT_EQ(stats[1].name, "mid");
    EXPECT_EQ(stats[2].name, "zeta");
}
