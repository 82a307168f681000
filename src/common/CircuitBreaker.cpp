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
#include "common/CircuitBreaker.hpp"
#include "common/BreakerConfig.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <mutex>
#include <string>
#include <utility>

namespace mesh {

CircuitBreaker::CircuitBreaker(std::string name, const BreakerConfig config)
    : breakerName {std::move(name)},
      cfg {config},
      current {State::Closed},
      failureCount {0},
      successCount {0},
      totalRequests {0},
      totalFailures {0},
      rejectedCalls {0} {}

bool CircuitBreaker::admit() {
    std::lock_guard lock {stateMutex};
    totalRequests++;
    if (current != State::Open) {
        return true;
    }
    auto now = clock::now();
    if (lastFailureTime.has_value() && now - lastFailureTime.value() <= cfg.recoveryTimeout) {
        totalFailures++;
        rejectedCalls++;
        return false;
    }
    transition(State::HalfOpen);
    successCount = 0;
    return true;
}

void CircuitBreaker::onSuccess() {
    std::lock_guard lock {stateMutex};
    lastSuccessTime = clock::now();
    switch (current) {
        case State::HalfOpen:
            successCount++;
            if (successCount >= cfg.successThreshold) {
                transition(State::Closed);
                failureCount = 0;
                successCount = 0;
            }
            break;
        case State::Closed:
            failureCount = 0;
            break;
        case State::Open:
            break;
    }
}

void CircuitBreaker::onFailure() {
    std::lock_guard lock {stateMutex};
    lastFailureTime = clock::now();
    totalFailures++;
    failureCount++;
    switch (current) {
        case State::HalfOpen:
            successCount = 0;
            transition(State::Open);
            break;
        case State::Closed:
            if (failureCount >= cfg.failureThreshold) {
                transition(State::Open);
            }
            break;
        case State::Open:
            break;
    }
}

void CircuitBreaker::transition(State next) {
    if (current == next) {
        return;
    }
    spdlog::info("CircuitBreaker {}: {} -> {} (failures: {}, successes: {})",
        breakerName, toString(current), toString(next), failureCount, successCount);
    current = next;
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard lock {stateMutex};
    return current;
}

bool CircuitBreaker::open() const {
    std::lock_guard lock {stateMutex};
    if (current != State::Open) {
        return false;
    }
    return lastFailureTime.has_value() && clock::now() - lastFailureTime.value() <= cfg.recoveryTimeout;
}

BreakerStats CircuitBreaker::stats() const {
    std::lock_guard lock {stateMutex};
    return BreakerStats {
        breakerName,
        current,
        failureCount,
        successCount,
        lastFailureTime,
        lastSuccessTime,
        totalRequests,
        totalFailures,
        rejectedCalls,
        cfg
    };
}

void CircuitBreaker::reset() {
    std::lock_guard lock {stateMutex};
    if (current != State::Closed) {
        spdlog::info("CircuitBreaker {}: reset from {}", breakerName, toString(current));
    }
    current = State::Closed;
    failureCount = 0;
    successCount = 0;
    lastFailureTime.reset();
    lastSuccessTime.reset();
    totalRequests = 0;
    totalFailures = 0;
    rejectedCalls = 0;
}

const std::string& CircuitBreaker::name() const {
    return breakerName;
}

const BreakerConfig& CircuitBreaker::config() const {
    return cfg;
}

std::string toString(const CircuitBreaker::State& state) {
    switch (state) {
        case CircuitBreaker::State::Open: return "Open";
        case CircuitBreaker::State::Closed: return "Closed";
        case CircuitBreaker::State::HalfOpen: return "HalfOpen";
    }
    std::unreachable();
}

} // namespace mesh
