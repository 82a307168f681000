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
#ifndef MESH_HEALTH_H
#define MESH_HEALTH_H

#include <string>
#include <grpc/grpc.h>

namespace mesh {

// Shared by the client side (breaker, channel connectivity) and the server
// side (registered services) so both directions answer the same question.
enum class HealthState : char {
    Unknown,
    Serving,
    NotServing
};

std::string toString(const HealthState& state);

std::string toString(const grpc_connectivity_state& state);

} // namespace mesh

#endif // MESH_HEALTH_H
