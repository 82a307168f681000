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
#include "mesh/MeshRuntime.hpp"
#include "discovery/ResolvDnsClient.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <stdexcept>
#include <utility>

namespace mesh {

namespace {

std::shared_ptr<DnsClient> orSystemResolver(std::shared_ptr<DnsClient> dns) {
    if (dns) {
        return dns;
    }
    return std::make_shared<ResolvDnsClient>();
}

} // namespace

MeshRuntime::MeshRuntime(const MeshConfig& config, std::shared_ptr<DnsClient> dns)
    : cfg {config},
      breakerRegistry {cfg.breaker},
      endpointDirectory {cfg.endpoints},
      serviceResolver {orSystemResolver(std::move(dns)), cfg.resolver},
      channelManager {
          breakerRegistry,
          endpointDirectory,
          cfg.useResolver ? &serviceResolver : nullptr,
          cfg.retry,
          cfg.keepAlive,
          cfg.defaultPort},
      serverRegistry {cfg.server} {
    if (cfg.probeService) {
        probe = std::make_shared<ProbeServiceImpl>(cfg.nodeId);
        auto added = serverRegistry.addService(probeServiceName, probe);
        if (!added.has_value()) {
            throw std::runtime_error("MeshRuntime: " + added.error().what);
        }
    }
    spdlog::info("MeshRuntime {}: {} directory entries, resolver {}",
        cfg.nodeId, endpointDirectory.listEndpoints().size(), cfg.useResolver ? "on" : "off");
}

MeshRuntime::~MeshRuntime() {
    channelManager.closeAll();
    serverRegistry.cleanup();
}

std::expected<void, Error> MeshRuntime::start() {
    return serverRegistry.start();
}

std::expected<void, Error> MeshRuntime::stop(std::chrono::milliseconds grace) {
    channelManager.closeAll();
    return serverRegistry.stop(grace);
}

HealthState MeshRuntime::dependencyHealth(const std::string& service) const {
    auto stats = breakerRegistry.stats(service);
    if (stats.has_value() && stats->state == CircuitBreaker::State::Open) {
        return HealthState::NotServing;
    }
    auto state = channelManager.connectivity(service);
    if (!state.has_value()) {
        return HealthState::Unknown;
    }
    switch (state.value()) {
        case GRPC_CHANNEL_READY:
            return HealthState::Serving;
        case GRPC_CHANNEL_TRANSIENT_FAILURE:
        case GRPC_CHANNEL_SHUTDOWN:
            return HealthState::NotServing;
        default:
            return HealthState::Unknown;
    }
}

CircuitBreakerRegistry& MeshRuntime::breakers() {
    return breakerRegistry;
}

ChannelManager& MeshRuntime::channels() {
    return channelManager;
}

ServerRegistry& MeshRuntime::server() {
    return serverRegistry;
}

ServiceResolver& MeshRuntime::resolver() {
    return serviceResolver;
}

EndpointDirectory& MeshRuntime::directory() {
    return endpointDirectory;
}

const MeshConfig& MeshRuntime::config() const {
    return cfg;
}

} // namespace mesh
