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
#ifndef MESH_BREAKER_CONFIG_H
#define MESH_BREAKER_CONFIG_H

#include <chrono>

namespace mesh {

struct BreakerConfig {
    BreakerConfig();
    BreakerConfig(
        int failures,
        std::chrono::milliseconds recovery,
        int successes,
        std::chrono::milliseconds call
    );
    // Failures in a row that open a closed breaker.
    int failureThreshold;
    // How long an open breaker rejects calls before letting a probe through.
    std::chrono::milliseconds recoveryTimeout;
    // Successes in a row that close a half-open breaker.
    int successThreshold;
    std::chrono::milliseconds callTimeout;
};

} // namespace mesh

#endif // MESH_BREAKER_CONFIG_H
