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
#ifndef MESH_CHANNEL_MANAGER_H
#define MESH_CHANNEL_MANAGER_H

#include "client/ChannelOptions.hpp"
#include "client/EndpointDirectory.hpp"
#include "common/CircuitBreakerRegistry.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/Repeater.hpp"
#include "common/RetryPolicy.hpp"
#include "discovery/ServiceResolver.hpp"
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace mesh {

struct ChannelHandle {
    std::string serviceName;
    std::string endpoint;
    KeepAliveOptions options;
    std::shared_ptr<grpc::Channel> channel;
    std::chrono::system_clock::time_point createdAt;
};

struct CallOptions {
    // Per-attempt deadline; defaults to the breaker's callTimeout.
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<int> retries;
    const std::atomic<bool>* cancel {nullptr};
};

// One long-lived channel and at most one stub per downstream service. Every
// call attempt goes through the service's circuit breaker; transport
// failures are retried with exponential backoff.
class ChannelManager {
public:
    template<typename Stub>
    using StubFactory = std::function<std::unique_ptr<Stub>(std::shared_ptr<grpc::Channel>)>;

    ChannelManager(
        CircuitBreakerRegistry& breakers,
        EndpointDirectory& directory,
        ServiceResolver* resolver = nullptr,
        const RetryPolicy policy = RetryPolicy{},
        const KeepAliveOptions keepAlive = KeepAliveOptions{},
        uint16_t defaultPort = 50051);
    ChannelManager(const ChannelManager&) = delete;
    ChannelManager& operator=(const ChannelManager&) = delete;
    ~ChannelManager();

    // Endpoint order: explicit argument, directory, resolver.
    std::expected<ChannelHandle, Error> createChannel(
        const std::string& service,
        const std::optional<std::string>& endpoint = std::nullopt,
        const std::optional<KeepAliveOptions>& options = std::nullopt);

    template<typename Stub>
    std::expected<std::shared_ptr<Stub>, Error> createStub(
        const std::string& service,
        const StubFactory<Stub>& factory,
        const std::optional<std::string>& endpoint = std::nullopt);

    template<typename Service>
    std::expected<std::shared_ptr<typename Service::Stub>, Error> createServiceStub(
        const std::string& service,
        const std::optional<std::string>& endpoint = std::nullopt) {
        return createStub<typename Service::Stub>(
            service,
            [](std::shared_ptr<grpc::Channel> channel) { return Service::NewStub(channel); },
            endpoint);
    }

    template<typename Stub>
    std::expected<std::shared_ptr<Stub>, Error> stub(const std::string& service) const;

    template<typename Stub, typename Req, typename Rep>
    std::expected<Rep, Error> call(
        const std::string& service,
        const std::string& op,
        grpc::Status (Stub::*method)(grpc::ClientContext*, const Req&, Rep*),
        const Req& request,
        const CallOptions& options = CallOptions{});

    // READY only; does not trigger a connection attempt.
    [[nodiscard]] bool healthCheck(const std::string& service) const;
    [[nodiscard]] std::optional<grpc_connectivity_state> connectivity(const std::string& service) const;
    // Blocks until the channel is READY or the timeout passes.
    std::expected<void, Error> connect(const std::string& service, std::chrono::milliseconds timeout);

    bool closeChannel(const std::string& service);
    void closeAll();
    [[nodiscard]] std::optional<ChannelHandle> channelInfo(const std::string& service) const;
    [[nodiscard]] std::vector<ChannelHandle> listChannels() const;

    void addEndpoint(const std::string& service, const std::string& endpoint);
    bool removeEndpoint(const std::string& service);
    [[nodiscard]] std::map<std::string, std::string> listEndpoints() const;

    [[nodiscard]] const RetryPolicy& retryPolicy() const;
private:
    struct StubHandle {
        std::shared_ptr<void> stub;
        std::type_index type;
        std::shared_ptr<grpc::Channel> channel;
    };

    std::optional<std::string> resolveEndpoint(const std::string& service) const;
    std::expected<ChannelHandle, Error> createChannelLocked(
        const std::string& service,
        const std::optional<std::string>& endpoint,
        const std::optional<KeepAliveOptions>& options);

    CircuitBreakerRegistry& breakers;
    EndpointDirectory& directory;
    ServiceResolver* resolver;
    const RetryPolicy policy;
    const KeepAliveOptions keepAlive;
    const uint16_t defaultPort;
    // Serializes channel and stub creation; never held with m.
    std::mutex createMutex;
    mutable std::mutex m;
    std::unordered_map<std::string, ChannelHandle> channels;
    std::unordered_map<std::string, StubHandle> stubs;
};

template<typename Stub>
std::expected<std::shared_ptr<Stub>, Error> ChannelManager::createStub(
    const std::string& service,
    const StubFactory<Stub>& factory,
    const std::optional<std::string>& endpoint) {
    std::lock_guard create {createMutex};
    std::shared_ptr<grpc::Channel> channel;
    {
        std::lock_guard lock {m};
        auto it = stubs.find(service);
        if (it != stubs.end()) {
            if (it->second.type != std::type_index(typeid(Stub))) {
                return std::unexpected {Error{ErrorCode::InvalidArg, "Stub type mismatch", service}};
            }
            return std::static_pointer_cast<Stub>(it->second.stub);
        }
        auto c = channels.find(service);
        if (c != channels.end() && (!endpoint.has_value() || c->second.endpoint == endpoint.value())) {
            channel = c->second.channel;
        }
    }
    if (!channel) {
        auto handle = createChannelLocked(service, endpoint, std::nullopt);
        if (!handle.has_value()) {
            return std::unexpected {handle.error()};
        }
        channel = handle.value().channel;
    }
    std::shared_ptr<Stub> created {factory(channel)};
    if (!created) {
        return std::unexpected {Error{ErrorCode::NoStub, "Stub factory returned null", service}};
    }
    {
        std::lock_guard lock {m};
        stubs.insert_or_assign(service, StubHandle{created, std::type_index(typeid(Stub)), channel});
    }
    spdlog::info("ChannelManager: stub created for {}", service);
    return created;
}

template<typename Stub>
std::expected<std::shared_ptr<Stub>, Error> ChannelManager::stub(const std::string& service) const {
    std::lock_guard lock {m};
    auto it = stubs.find(service);
    if (it == stubs.end()) {
        return std::unexpected {Error{ErrorCode::NoStub, "No stub for service", service}};
    }
    if (it->second.type != std::type_index(typeid(Stub))) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Stub type mismatch", service}};
    }
    return std::static_pointer_cast<Stub>(it->second.stub);
}

template<typename Stub, typename Req, typename Rep>
std::expected<Rep, Error> ChannelManager::call(
    const std::string& service,
    const std::string& op,
    grpc::Status (Stub::*method)(grpc::ClientContext*, const Req&, Rep*),
    const Req& request,
    const CallOptions& options) {
    auto s = stub<Stub>(service);
    if (!s.has_value()) {
        spdlog::error("ChannelManager: {}.{}: {}", service, op, s.error().what);
        return std::unexpected {s.error()};
    }
    if (options.retries.has_value() && options.retries.value() < 0) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "retries must be non-negative", service}};
    }
    auto stubPtr = s.value();
    auto& breaker = breakers.get(service);
    auto timeout = options.timeout.value_or(
        std::chrono::duration_cast<std::chrono::milliseconds>(breaker.config().callTimeout));
    Repeater repeater {
        RetryPolicy{policy.baseDelay, policy.maxDelay, options.retries.value_or(policy.retries)},
        options.cancel};
    Rep reply;
    auto result = repeater.attempt(service + "." + op, [&]() -> std::expected<void, Error> {
        return breaker.call([&]() -> std::expected<void, Error> {
            grpc::ClientContext context;
            context.set_deadline(std::chrono::system_clock::now() + timeout);
            reply = Rep{};
            auto status = ((*stubPtr).*method)(&context, request, &reply);
            if (status.ok()) {
                return {};
            }
            auto error = toError(status);
            if (error.service.empty()) {
                error.service = service;
            }
            return std::unexpected {error};
        });
    });
    if (!result.has_value()) {
        return std::unexpected {result.error()};
    }
    return reply;
}

} // namespace mesh

#endif // MESH_CHANNEL_MANAGER_H
