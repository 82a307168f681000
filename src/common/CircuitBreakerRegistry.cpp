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
#include "common/CircuitBreakerRegistry.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mesh {

CircuitBreakerRegistry::CircuitBreakerRegistry(const BreakerConfig defaults)
    : defaultConfig {defaults} {}

CircuitBreaker& CircuitBreakerRegistry::get(const std::string& name) {
    return get(name, defaultConfig);
}

CircuitBreaker& CircuitBreakerRegistry::get(const std::string& name, const BreakerConfig& config) {
    std::lock_guard lock {m};
    auto it = breakers.find(name);
    if (it == breakers.end()) {
        spdlog::debug("CircuitBreakerRegistry: creating breaker {}", name);
        it = breakers.emplace(name, std::make_unique<CircuitBreaker>(name, config)).first;
    }
    return *it->second;
}

CircuitBreaker* CircuitBreakerRegistry::find(const std::string& name) const {
    std::lock_guard lock {m};
    auto it = breakers.find(name);
    if (it == breakers.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<BreakerStats> CircuitBreakerRegistry::stats(const std::string& name) const {
    auto* breaker = find(name);
    if (!breaker) {
        return std::nullopt;
    }
    return breaker->stats();
}

std::vector<BreakerStats> CircuitBreakerRegistry::allStats() const {
    std::vector<CircuitBreaker*> snapshot;
    {
        std::lock_guard lock {m};
        snapshot.reserve(breakers.size());
        for (const auto& [name, breaker] : breakers) {
            snapshot.push_back(breaker.get());
        }
    }
    std::vector<BreakerStats> result;
    result.reserve(snapshot.size());
    for (auto* breaker : snapshot) {
        result.push_back(breaker->stats());
    }
    std::sort(result.begin(), result.end(), [](const BreakerStats& a, const BreakerStats& b) {
        return a.name < b.name;
    });
    return result;
}

bool CircuitBreakerRegistry::reset(const std::string& name) {
    auto* breaker = find(name);
    if (!breaker) {
        return false;
    }
    breaker->reset();
    return true;
}

void CircuitBreakerRegistry::resetAll() {
    std::lock_guard lock {m};
    for (auto& [name, breaker] : breakers) {
        breaker->reset();
    }
    spdlog::info("CircuitBreakerRegistry: reset {} breakers", breakers.size());
}

bool CircuitBreakerRegistry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

std::size_t CircuitBreakerRegistry::size() const {
    std::lock_guard lock {m};
    return breakers.size();
}

const BreakerConfig& CircuitBreakerRegistry::defaults() const {
    return defaultConfig;
}

} // namespace mesh
