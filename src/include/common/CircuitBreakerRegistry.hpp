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
#ifndef MESH_CIRCUIT_BREAKER_REGISTRY_H
#define MESH_CIRCUIT_BREAKER_REGISTRY_H

#include "common/BreakerConfig.hpp"
#include "common/CircuitBreaker.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mesh {

// One breaker per dependency name, created on first use and kept for the
// lifetime of the registry.
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(const BreakerConfig defaults = BreakerConfig{});
    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    CircuitBreaker& get(const std::string& name);
    // The config only applies if this call creates the breaker.
    CircuitBreaker& get(const std::string& name, const BreakerConfig& config);

    template<typename F>
    auto call(const std::string& name, F&& fn) {
        return get(name).call(std::forward<F>(fn));
    }

    [[nodiscard]] std::optional<BreakerStats> stats(const std::string& name) const;
    [[nodiscard]] std::vector<BreakerStats> allStats() const;
    bool reset(const std::string& name);
    void resetAll();
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] const BreakerConfig& defaults() const;
private:
    CircuitBreaker* find(const std::string& name) const;
    mutable std::mutex m;
    const BreakerConfig defaultConfig;
    std::unordered_map<std::string, std::unique_ptr<CircuitBreaker>> breakers;
};

} // namespace mesh

#endif // MESH_CIRCUIT_BREAKER_REGISTRY_H
