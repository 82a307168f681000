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
#include "server/ServerRegistry.hpp"
#include <grpc/grpc.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/resource_quota.h>
#include <spdlog/spdlog.h>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace mesh {

ServerConfig::ServerConfig()
    : address {"0.0.0.0:50051"},
      maxThreads {10},
      healthService {true} {}

ServerConfig::ServerConfig(std::string a, int t, bool h)
    : address {std::move(a)},
      maxThreads {t},
      healthService {h} {
    if (address.empty()) {
        throw std::invalid_argument("ServerConfig: address must not be empty");
    }
    if (maxThreads < 1) {
        throw std::invalid_argument("ServerConfig: maxThreads must be at least 1");
    }
}

std::string toString(const ServerRegistry::State& state) {
    switch (state) {
        case ServerRegistry::State::NotStarted: return "NotStarted";
        case ServerRegistry::State::Running: return "Running";
        case ServerRegistry::State::Stopped: return "Stopped";
    }
    std::unreachable();
}

ServerRegistry::ServerRegistry(ServerConfig config)
    : cfg {std::move(config)},
      current {State::NotStarted},
      port {0} {}

ServerRegistry::~ServerRegistry() {
    if (running()) {
        auto result = stop();
        if (!result.has_value()) {
            spdlog::error("ServerRegistry: stop on destruction failed: {}", result.error().what);
        }
    }
}

std::expected<void, Error> ServerRegistry::addService(const std::string& name, std::shared_ptr<grpc::Service> impl, mount_t mount) {
    if (name.empty() || !impl) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Service name and implementation are required", name}};
    }
    if (!mount) {
        mount = [](grpc::ServerBuilder& builder, grpc::Service& service) {
            builder.RegisterService(&service);
        };
    }
    std::lock_guard lock {m};
    if (current != State::NotStarted) {
        return std::unexpected {Error{ErrorCode::AlreadyRunning, "Cannot add a service after the server started", name}};
    }
    if (services.contains(name)) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Service already registered", name}};
    }
    services.emplace(name, RegisteredService{name, std::move(impl), std::move(mount), std::chrono::system_clock::now(), {}});
    spdlog::info("ServerRegistry: service {} added", name);
    return {};
}

std::expected<void, Error> ServerRegistry::removeService(const std::string& name) {
    std::lock_guard lock {m};
    if (current != State::NotStarted) {
        return std::unexpected {Error{ErrorCode::AlreadyRunning, "Cannot remove a service after the server started", name}};
    }
    if (services.erase(name) == 0) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Service not registered", name}};
    }
    spdlog::info("ServerRegistry: service {} removed", name);
    return {};
}

std::expected<void, Error> ServerRegistry::start() {
    std::lock_guard life {lifecycle};
    std::unique_lock lock {m};
    if (current == State::Running) {
        return std::unexpected {Error{ErrorCode::AlreadyRunning, "Server already running"}};
    }
    if (current == State::Stopped) {
        return std::unexpected {Error{ErrorCode::AlreadyRunning, "Server was stopped and cannot be restarted"}};
    }
    grpc::EnableDefaultHealthCheckService(cfg.healthService);
    grpc::ServerBuilder builder;
    int selected = 0;
    builder.AddListeningPort(cfg.address, grpc::InsecureServerCredentials(), &selected);
    // A port held by another listener is a bind failure, not a shared port.
    builder.AddChannelArgument(GRPC_ARG_ALLOW_REUSEPORT, 0);
    grpc::ResourceQuota quota {"mesh-server"};
    quota.SetMaxThreads(cfg.maxThreads);
    builder.SetResourceQuota(quota);
    for (auto& [name, service] : services) {
        service.mount(builder, *service.impl);
    }
    auto built = builder.BuildAndStart();
    if (!built || selected == 0) {
        spdlog::error("ServerRegistry: failed to bind {}", cfg.address);
        return std::unexpected {Error{ErrorCode::Unavailable, "Failed to start server on " + cfg.address}};
    }
    server = std::move(built);
    port = selected;
    current = State::Running;
    if (cfg.healthService) {
        if (auto* health = server->GetHealthCheckService(); health != nullptr) {
            for (const auto& [name, service] : services) {
                health->SetServingStatus(name, true);
            }
            health->SetServingStatus(true);
        }
    }
    serverThread = std::thread([this]() { server->Wait(); });
    spdlog::info("ServerRegistry: listening on {} (port {}) with {} services", cfg.address, port, services.size());
    return {};
}

std::expected<void, Error> ServerRegistry::stop(std::chrono::milliseconds grace) {
    std::lock_guard life {lifecycle};
    {
        std::lock_guard lock {m};
        if (current != State::Running) {
            return std::unexpected {Error{ErrorCode::NotRunning, "Server is not running"}};
        }
    }
    if (cfg.healthService) {
        if (auto* health = server->GetHealthCheckService(); health != nullptr) {
            health->SetServingStatus(false);
        }
    }
    server->Shutdown(std::chrono::system_clock::now() + grace);
    if (serverThread.joinable()) {
        serverThread.join();
    }
    server.reset();
    {
        std::lock_guard lock {m};
        current = State::Stopped;
        port = 0;
    }
    terminated.notify_all();
    spdlog::info("ServerRegistry: server on {} stopped", cfg.address);
    return {};
}

std::expected<void, Error> ServerRegistry::waitForTermination() {
    std::unique_lock lock {m};
    if (current == State::NotStarted) {
        return std::unexpected {Error{ErrorCode::NotRunning, "Server never started"}};
    }
    terminated.wait(lock, [this]() { return current == State::Stopped; });
    return {};
}

std::expected<void, Error> ServerRegistry::addHealthCheck(const std::string& name, health_check_t check) {
    std::lock_guard lock {m};
    auto it = services.find(name);
    if (it == services.end()) {
        return std::unexpected {Error{ErrorCode::InvalidArg, "Service not registered", name}};
    }
    it->second.healthCheck = std::move(check);
    return {};
}

bool ServerRegistry::evaluate(const std::string& name, const health_check_t& check) const {
    if (!check) {
        return true;
    }
    try {
        return check();
    } catch (const std::exception& e) {
        spdlog::warn("ServerRegistry: health check for {} threw: {}", name, e.what());
        return false;
    }
}

bool ServerRegistry::checkServiceHealth(const std::string& name) const {
    health_check_t check;
    {
        std::lock_guard lock {m};
        auto it = services.find(name);
        if (it == services.end()) {
            return false;
        }
        check = it->second.healthCheck;
    }
    return evaluate(name, check);
}

ServerHealth ServerRegistry::getServerHealth() {
    std::map<std::string, health_check_t> checks;
    bool isRunning = false;
    {
        std::lock_guard lock {m};
        isRunning = current == State::Running;
        for (const auto& [name, service] : services) {
            checks.emplace(name, service.healthCheck);
        }
    }
    ServerHealth report {isRunning, checks.size(), 0, {}, std::chrono::system_clock::now()};
    for (const auto& [name, check] : checks) {
        auto healthy = evaluate(name, check);
        report.services.emplace(name, healthy ? HealthState::Serving : HealthState::NotServing);
        if (healthy) {
            report.healthyServices++;
        }
    }
    if (isRunning) {
        publishHealth(report.services);
    }
    return report;
}

void ServerRegistry::publishHealth(const std::map<std::string, HealthState>& states) {
    if (!cfg.healthService) {
        return;
    }
    std::lock_guard life {lifecycle};
    if (!server) {
        return;
    }
    auto* health = server->GetHealthCheckService();
    if (health == nullptr) {
        return;
    }
    for (const auto& [name, state] : states) {
        health->SetServingStatus(name, state == HealthState::Serving);
    }
}

ServerRegistry::State ServerRegistry::state() const {
    std::lock_guard lock {m};
    return current;
}

bool ServerRegistry::running() const {
    return state() == State::Running;
}

int ServerRegistry::boundPort() const {
    std::lock_guard lock {m};
    return port;
}

std::vector<std::string> ServerRegistry::listServices() const {
    std::lock_guard lock {m};
    std::vector<std::string> names;
    names.reserve(services.size());
    for (const auto& [name, service] : services) {
        names.push_back(name);
    }
    return names;
}

const ServerConfig& ServerRegistry::config() const {
    return cfg;
}

void ServerRegistry::cleanup() {
    if (running()) {
        auto result = stop();
        if (!result.has_value()) {
            spdlog::warn("ServerRegistry: cleanup stop: {}", result.error().what);
        }
    }
    std::lock_guard lock {m};
    services.clear();
    spdlog::info("ServerRegistry: cleaned up");
}

} // namespace mesh
