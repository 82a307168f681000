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
#ifndef MESH_MESH_RUNTIME_H
#define MESH_MESH_RUNTIME_H

#include "client/ChannelManager.hpp"
#include "client/EndpointDirectory.hpp"
#include "common/CircuitBreakerRegistry.hpp"
#include "common/Error.hpp"
#include "common/Health.hpp"
#include "discovery/ServiceResolver.hpp"
#include "interface/DnsClient.hpp"
#include "mesh/MeshConfig.hpp"
#include "server/ProbeServiceImpl.hpp"
#include "server/ServerRegistry.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <string>

namespace mesh {

// Control-plane object owning one of each mesh component.
class MeshRuntime {
public:
    static constexpr const char* probeServiceName = "mesh.probe.Probe";

    // A null dns uses the system resolver.
    explicit MeshRuntime(const MeshConfig& config, std::shared_ptr<DnsClient> dns = nullptr);
    ~MeshRuntime();
    MeshRuntime(const MeshRuntime&) = delete;
    MeshRuntime& operator=(const MeshRuntime&) = delete;

    std::expected<void, Error> start();
    std::expected<void, Error> stop(std::chrono::milliseconds grace = std::chrono::seconds{5});

    // Serving while the breaker admits calls and the channel is READY,
    // NotServing when the breaker is open or the channel has failed,
    // Unknown when nothing has been learned yet.
    [[nodiscard]] HealthState dependencyHealth(const std::string& service) const;

    CircuitBreakerRegistry& breakers();
    ChannelManager& channels();
    ServerRegistry& server();
    ServiceResolver& resolver();
    EndpointDirectory& directory();
    [[nodiscard]] const MeshConfig& config() const;
private:
    const MeshConfig cfg;
    CircuitBreakerRegistry breakerRegistry;
    EndpointDirectory endpointDirectory;
    ServiceResolver serviceResolver;
    ChannelManager channelManager;
    ServerRegistry serverRegistry;
    std::shared_ptr<ProbeServiceImpl> probe;
};

} // namespace mesh

#endif // MESH_MESH_RUNTIME_H
