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
#include "client/ChannelManager.hpp"
#include "common/Util.hpp"
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <string>

namespace mesh {

ChannelManager::ChannelManager(
    CircuitBreakerRegistry& b,
    EndpointDirectory& d,
    ServiceResolver* r,
    const RetryPolicy p,
    const KeepAliveOptions k,
    uint16_t port)
    : breakers {b},
      directory {d},
      resolver {r},
      policy {p},
      keepAlive {k},
      defaultPort {port} {}

ChannelManager::~ChannelManager() {
    closeAll();
}

std::optional<std::string> ChannelManager::resolveEndpoint(const std::string& service) const {
    if (auto endpoint = directory.endpointFor(service); endpoint.has_value()) {
        return endpoint;
    }
    if (resolver == nullptr) {
        return std::nullopt;
    }
    auto picked = resolver->resolveRandom(service, defaultPort);
    if (!picked.has_value()) {
        return std::nullopt;
    }
    return join_host_port(picked->host, picked->port);
}

std::expected<ChannelHandle, Error> ChannelManager::createChannel(
    const std::string& service,
    const std::optional<std::string>& endpoint,
    const std::optional<KeepAliveOptions>& options) {
    std::lock_guard create {createMutex};
    return createChannelLocked(service, endpoint, options);
}

std::expected<ChannelHandle, Error> ChannelManager::createChannelLocked(
    const std::string& service,
    const std::optional<std::string>& endpoint,
    const std::optional<KeepAliveOptions>& options) {
    auto target = endpoint.has_value() ? endpoint : resolveEndpoint(service);
    if (!target.has_value()) {
        spdlog::error("ChannelManager: no endpoint for service {}", service);
        return std::unexpected {Error{ErrorCode::NoChannel, "No endpoint for service", service}};
    }
    std::string host;
    uint16_t port = 0;
    if (!split_host_port(target.value(), host, port)) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Invalid endpoint '" + target.value() + "'", service}};
    }
    auto opts = options.value_or(keepAlive);
    auto args = opts.toChannelArguments();
    auto channel = grpc::CreateCustomChannel(target.value(), grpc::InsecureChannelCredentials(), args);
    if (!channel) {
        return std::unexpected {Error{ErrorCode::NoChannel, "Could not create channel to " + target.value(), service}};
    }
    ChannelHandle handle {service, target.value(), opts, channel, std::chrono::system_clock::now()};
    bool replaced = false;
    {
        std::lock_guard lock {m};
        replaced = !channels.insert_or_assign(service, handle).second;
        stubs.erase(service);
    }
    spdlog::info("ChannelManager: channel for {} {} at {}", service, replaced ? "replaced" : "created", target.value());
    return handle;
}

bool ChannelManager::healthCheck(const std::string& service) const {
    auto state = connectivity(service);
    return state.has_value() && state.value() == GRPC_CHANNEL_READY;
}

std::optional<grpc_connectivity_state> ChannelManager::connectivity(const std::string& service) const {
    std::shared_ptr<grpc::Channel> channel;
    {
        std::lock_guard lock {m};
        auto it = channels.find(service);
        if (it == channels.end()) {
            return std::nullopt;
        }
        channel = it->second.channel;
    }
    return channel->GetState(false);
}

std::expected<void, Error> ChannelManager::connect(const std::string& service, std::chrono::milliseconds timeout) {
    std::shared_ptr<grpc::Channel> channel;
    {
        std::lock_guard lock {m};
        auto it = channels.find(service);
        if (it != channels.end()) {
            channel = it->second.channel;
        }
    }
    if (!channel) {
        return std::unexpected {Error{ErrorCode::NoChannel, "No channel for service", service}};
    }
    if (!channel->WaitForConnected(std::chrono::system_clock::now() + timeout)) {
        return std::unexpected {Error{ErrorCode::Unavailable, "Channel did not become ready", service}};
    }
    return {};
}

bool ChannelManager::closeChannel(const std::string& service) {
    bool closed = false;
    {
        std::lock_guard lock {m};
        stubs.erase(service);
        closed = channels.erase(service) > 0;
    }
    if (closed) {
        spdlog::info("ChannelManager: channel for {} closed", service);
    }
    return closed;
}

void ChannelManager::closeAll() {
    std::size_t count = 0;
    {
        std::lock_guard lock {m};
        stubs.clear();
        count = channels.size();
        channels.clear();
    }
    if (count > 0) {
        spdlog::info("ChannelManager: closed {} channels", count);
    }
}

std::optional<ChannelHandle> ChannelManager::channelInfo(const std::string& service) const {
    std::lock_guard lock {m};
    auto it = channels.find(service);
    if (it == channels.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ChannelHandle> ChannelManager::listChannels() const {
    std::vector<ChannelHandle> result;
    {
        std::lock_guard lock {m};
        result.reserve(channels.size());
        for (const auto& [name, handle] : channels) {
            result.push_back(handle);
        }
    }
    std::sort(result.begin(), result.end(), [](const ChannelHandle& a, const ChannelHandle& b) {
        return a.serviceName < b.serviceName;
    });
    return result;
}

void ChannelManager::addEndpoint(const std::string& service, const std::string& endpoint) {
    directory.addEndpoint(service, endpoint);
}

bool ChannelManager::removeEndpoint(const std::string& service) {
    return directory.removeEndpoint(service);
}

std::map<std::string, std::string> ChannelManager::listEndpoints() const {
    return directory.listEndpoints();
}

const RetryPolicy& ChannelManager::retryPolicy() const {
    return policy;
}

} // namespace mesh
