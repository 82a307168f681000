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
#ifndef MESH_SERVER_REGISTRY_H
#define MESH_SERVER_REGISTRY_H

#include "common/Error.hpp"
#include "common/Health.hpp"
#include <grpcpp/grpcpp.h>
#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mesh {

struct ServerConfig {
    ServerConfig();
    ServerConfig(std::string address, int maxThreads, bool healthService);
    std::string address;
    int maxThreads;
    // Standard grpc.health.v1 service.
    bool healthService;
};

struct ServerHealth {
    bool running;
    std::size_t servicesCount;
    std::size_t healthyServices;
    std::map<std::string, HealthState> services;
    std::chrono::system_clock::time_point timestamp;
};

// Owns the inbound listener. Services are recorded first and mounted when
// the listener starts; the listener cannot be restarted once stopped.
class ServerRegistry {
public:
    enum class State : char {
        NotStarted,
        Running,
        Stopped
    };
    using mount_t = std::function<void(grpc::ServerBuilder&, grpc::Service&)>;
    using health_check_t = std::function<bool()>;

    struct RegisteredService {
        std::string name;
        std::shared_ptr<grpc::Service> impl;
        mount_t mount;
        std::chrono::system_clock::time_point addedAt;
        health_check_t healthCheck;
    };

    explicit ServerRegistry(ServerConfig config = ServerConfig{});
    ~ServerRegistry();
    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;
    ServerRegistry(ServerRegistry&&) = delete;
    ServerRegistry& operator=(ServerRegistry&&) = delete;

    // An empty mount registers impl on the builder.
    std::expected<void, Error> addService(const std::string& name, std::shared_ptr<grpc::Service> impl, mount_t mount = {});
    std::expected<void, Error> removeService(const std::string& name);
    std::expected<void, Error> start();
    std::expected<void, Error> stop(std::chrono::milliseconds grace = std::chrono::seconds{5});
    std::expected<void, Error> waitForTermination();

    std::expected<void, Error> addHealthCheck(const std::string& name, health_check_t check);
    [[nodiscard]] bool checkServiceHealth(const std::string& name) const;
    ServerHealth getServerHealth();

    [[nodiscard]] State state() const;
    [[nodiscard]] bool running() const;
    // 0 until the listener is bound.
    [[nodiscard]] int boundPort() const;
    [[nodiscard]] std::vector<std::string> listServices() const;
    [[nodiscard]] const ServerConfig& config() const;
    void cleanup();
private:
    bool evaluate(const std::string& name, const health_check_t& check) const;
    void publishHealth(const std::map<std::string, HealthState>& services);

    const ServerConfig cfg;
    // Serializes start, stop and health publication.
    std::mutex lifecycle;
    mutable std::mutex m;
    std::condition_variable terminated;
    State current;
    int port;
    std::map<std::string, RegisteredService> services;
    std::unique_ptr<grpc::Server> server;
    std::thread serverThread;
};

std::string toString(const ServerRegistry::State& state);

} // namespace mesh

#endif // MESH_SERVER_REGISTRY_H
