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
#include "common/BreakerConfig.hpp"
#include <stdexcept>
#include <chrono>

namespace mesh {

BreakerConfig::BreakerConfig()
    : BreakerConfig(5, std::chrono::seconds{60L}, 3, std::chrono::seconds{30L}) {}

BreakerConfig::BreakerConfig(
    int failures,
    std::chrono::milliseconds recovery,
    int successes,
    std::chrono::milliseconds call)
    : failureThreshold {failures},
      recoveryTimeout {recovery},
      successThreshold {successes},
      callTimeout {call} {
    if (failures < 1) {
        throw std::invalid_argument("Failure threshold must be >= one.");
    }
    if (successes < 1) {
        throw std::invalid_argument("Success threshold must be >= one.");
    }
    if (recovery < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Recovery timeout must be >= zero.");
    }
    if (call <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Call timeout must be > zero.");
    }
}

} // namespace mesh
