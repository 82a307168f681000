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
#ifndef MESH_CIRCUIT_BREAKER_H
#define MESH_CIRCUIT_BREAKER_H

#include "common/BreakerConfig.hpp"
#include "common/Error.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace mesh {

struct BreakerStats;

class CircuitBreaker {
public:
    enum class State : char {
        Open,
        Closed,
        HalfOpen
    };
    using clock = std::chrono::steady_clock;

    explicit CircuitBreaker(std::string name, const BreakerConfig config = BreakerConfig{});
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // fn returns std::expected<T, Error>. Calls through one breaker are
    // serialized for their whole duration; an open breaker returns
    // CircuitOpen without invoking fn.
    template<typename F, typename R = std::invoke_result_t<F&>>
    R call(F&& fn) {
        static_assert(std::is_same_v<typename R::error_type, Error>, "CircuitBreaker::call expects std::expected<T, Error>");
        std::lock_guard callLock {callMutex};
        if (!admit()) {
            return std::unexpected {Error{ErrorCode::CircuitOpen, "Circuit breaker is open", breakerName}};
        }
        try {
            R result = fn();
            if (result.has_value() || !countsAsFailure(result.error())) {
                onSuccess();
            } else {
                onFailure();
            }
            return result;
        } catch (...) {
            onFailure();
            throw;
        }
    }

    [[nodiscard]] State state() const;
    // True while calls would be rejected without a probe.
    [[nodiscard]] bool open() const;
    [[nodiscard]] BreakerStats stats() const;
    void reset();
    [[nodiscard]] const std::string& name() const;
    [[nodiscard]] const BreakerConfig& config() const;
private:
    bool admit();
    void onSuccess();
    void onFailure();
    void transition(State next);

    const std::string breakerName;
    const BreakerConfig cfg;
    std::mutex callMutex;
    mutable std::mutex stateMutex;
    State current;
    int failureCount;
    int successCount;
    std::optional<clock::time_point> lastFailureTime;
    std::optional<clock::time_point> lastSuccessTime;
    uint64_t totalRequests;
    uint64_t totalFailures;
    uint64_t rejectedCalls;
};

struct BreakerStats {
    std::string name;
    CircuitBreaker::State state;
    int failureCount;
    int successCount;
    std::optional<CircuitBreaker::clock::time_point> lastFailureTime;
    std::optional<CircuitBreaker::clock::time_point> lastSuccessTime;
    uint64_t totalRequests;
    // Includes calls rejected while open.
    uint64_t totalFailures;
    uint64_t rejectedCalls;
    BreakerConfig config;
};

std::string toString(const CircuitBreaker::State& state);

} // namespace mesh

#endif // MESH_CIRCUIT_BREAKER_H
