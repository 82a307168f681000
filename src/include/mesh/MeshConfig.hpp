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
#ifndef MESH_MESH_CONFIG_H
#define MESH_MESH_CONFIG_H

#include "client/ChannelOptions.hpp"
#include "client/EndpointDirectory.hpp"
#include "common/BreakerConfig.hpp"
#include "common/RetryPolicy.hpp"
#include "discovery/ServiceResolver.hpp"
#include "server/ServerRegistry.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>

namespace mesh {

struct MeshConfig {
    std::string nodeId {"mesh-node"};
    BreakerConfig breaker {};
    RetryPolicy retry {};
    KeepAliveOptions keepAlive {};
    ServerConfig server {};
    ResolverConfig resolver {};
    std::unordered_map<std::string, std::string> endpoints {EndpointDirectory::defaultEndpoints()};
    // Port paired with A/AAAA answers that carry none.
    uint16_t defaultPort {50051};
    // Fall back to DNS when the directory has no entry.
    bool useResolver {true};
    // Mount the Probe service on start.
    bool probeService {true};
};

} // namespace mesh

#endif // MESH_MESH_CONFIG_H
